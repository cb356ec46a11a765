// src/chunk_reference_manager.cpp
#include "chunk_reference_manager.hpp"
#include "drive_log.hpp"
#include <stdexcept>

namespace ChunkDrive
{
    namespace Chunks
    {

        ChunkReferenceManager::ChunkReferenceManager() = default;

        std::optional<std::string> ChunkReferenceManager::releaseIfUnused(
            std::unordered_map<std::string, Entry>::iterator it)
        {
            if (it->second.refs > 0 || it->second.pins > 0)
            {
                return std::nullopt;
            }
            std::string handle = it->second.handle;
            entries.erase(it);
            return handle;
        }

        std::optional<std::string> ChunkReferenceManager::pinExisting(const std::string &chunk_cid)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it == entries.end())
            {
                return std::nullopt;
            }
            it->second.pins++;
            return it->second.handle;
        }

        std::string ChunkReferenceManager::pinStored(const std::string &chunk_cid, const std::string &handle)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it != entries.end())
            {
                it->second.pins++;
                return it->second.handle;
            }
            Entry entry;
            entry.handle = handle;
            entry.pins = 1;
            entries.emplace(chunk_cid, entry);
            return handle;
        }

        std::optional<std::string> ChunkReferenceManager::unpin(const std::string &chunk_cid)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it == entries.end() || it->second.pins <= 0)
            {
                Logging::warn("REFERENCES", "", "Unpin of unpinned chunk " + chunk_cid);
                return std::nullopt;
            }
            it->second.pins--;
            return releaseIfUnused(it);
        }

        void ChunkReferenceManager::promotePin(const std::string &chunk_cid)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it == entries.end() || it->second.pins <= 0)
            {
                throw std::logic_error("Promoting a pin that was never taken: " + chunk_cid);
            }
            it->second.pins--;
            it->second.refs++;
        }

        std::optional<std::string> ChunkReferenceManager::decrement(const std::string &chunk_cid)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it == entries.end() || it->second.refs <= 0)
            {
                // This indicates an error state or a bug in logic
                Logging::warn("REFERENCES", "", "Attempted to decrement non-existent or zero-count chunk: " + chunk_cid);
                return std::nullopt;
            }
            it->second.refs--;
            return releaseIfUnused(it);
        }

        int ChunkReferenceManager::getCount(const std::string &chunk_cid) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it == entries.end())
            {
                return 0;
            }
            return it->second.refs;
        }

        int ChunkReferenceManager::getPins(const std::string &chunk_cid) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            return it == entries.end() ? 0 : it->second.pins;
        }

        std::optional<std::string> ChunkReferenceManager::findHandle(const std::string &chunk_cid) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = entries.find(chunk_cid);
            if (it == entries.end())
            {
                return std::nullopt;
            }
            return it->second.handle;
        }

        bool ChunkReferenceManager::isHandleReferenced(const std::string &handle) const
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (const auto &kv : entries)
            {
                if (kv.second.handle == handle)
                {
                    return true;
                }
            }
            return false;
        }

        size_t ChunkReferenceManager::size() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return entries.size();
        }

        void ChunkReferenceManager::rebuild(const std::vector<Metadata::FileMetadata> &files)
        {
            std::unordered_map<std::string, Entry> rebuilt;
            for (const auto &file : files)
            {
                for (const auto &hash : file.distinctHashes())
                {
                    auto &entry = rebuilt[hash];
                    if (entry.handle.empty())
                    {
                        for (const auto &part : file.parts)
                        {
                            if (part.hash == hash)
                            {
                                entry.handle = part.handle;
                                break;
                            }
                        }
                    }
                    entry.refs++;
                }
            }

            std::lock_guard<std::mutex> lock(mtx);
            entries.swap(rebuilt);
        }

    } // namespace Chunks
} // namespace ChunkDrive
