// src/inventory_store.cpp
#include "inventory_store.hpp"
#include "drive_errors.hpp"
#include "drive_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace ChunkDrive
{
    namespace Inventory
    {

        InventoryStore::InventoryStore(std::shared_ptr<InventoryBackend> backend)
            : backend_(std::move(backend))
        {
            if (!backend_)
            {
                throw std::invalid_argument("InventoryStore requires a persistence backend.");
            }

            owners_ = backend_->loadAll();
            orphans_ = backend_->loadOrphans();

            std::vector<Metadata::FileMetadata> all_files;
            for (const auto &owner : owners_)
            {
                for (const auto &kv : owner.second)
                {
                    all_files.push_back(kv.second);
                }
            }
            ref_manager_.rebuild(all_files);

            Logging::info("INVENTORY", "", "Loaded " + std::to_string(all_files.size()) + " file(s) for " +
                                               std::to_string(owners_.size()) + " owner(s), " +
                                               std::to_string(ref_manager_.size()) + " unique part(s), " +
                                               std::to_string(orphans_.size()) + " orphan(s).");
        }

        namespace
        {
            bool hasControl(const std::string &s)
            {
                return std::any_of(s.begin(), s.end(), [](char c)
                                   { return static_cast<unsigned char>(c) < 0x20 || c == 0x7F; });
            }

            // Well-formed UTF-8: shortest encodings only, no surrogates, nothing above U+10FFFF.
            bool isValidUtf8(const std::string &s)
            {
                size_t i = 0;
                while (i < s.size())
                {
                    unsigned char c = static_cast<unsigned char>(s[i]);
                    size_t extra = 0;
                    unsigned char lo = 0x80, hi = 0xBF; // allowed range of the first continuation byte
                    if (c < 0x80)
                    {
                        ++i;
                        continue;
                    }
                    else if (c >= 0xC2 && c <= 0xDF)
                    {
                        extra = 1;
                    }
                    else if (c >= 0xE0 && c <= 0xEF)
                    {
                        extra = 2;
                        if (c == 0xE0)
                            lo = 0xA0;
                        else if (c == 0xED)
                            hi = 0x9F;
                    }
                    else if (c >= 0xF0 && c <= 0xF4)
                    {
                        extra = 3;
                        if (c == 0xF0)
                            lo = 0x90;
                        else if (c == 0xF4)
                            hi = 0x8F;
                    }
                    else
                    {
                        return false;
                    }

                    if (i + extra >= s.size())
                    {
                        return false;
                    }
                    for (size_t k = 1; k <= extra; ++k)
                    {
                        unsigned char cc = static_cast<unsigned char>(s[i + k]);
                        unsigned char min = k == 1 ? lo : 0x80;
                        unsigned char max = k == 1 ? hi : 0xBF;
                        if (cc < min || cc > max)
                        {
                            return false;
                        }
                    }
                    i += extra + 1;
                }
                return true;
            }
        } // namespace

        void InventoryStore::validateKey(const std::string &owner, const std::string &name)
        {
            if (owner.empty() || hasControl(owner))
            {
                throw InvalidName("Owner id must be non-empty and printable.");
            }
            if (!isValidUtf8(owner))
            {
                throw InvalidName("Owner id must be valid UTF-8.");
            }
            if (name.empty() || hasControl(name))
            {
                throw InvalidName("File name must be non-empty and printable.");
            }
            if (!isValidUtf8(name))
            {
                throw InvalidName("File name must be valid UTF-8.");
            }
        }

        Metadata::FileMetadata InventoryStore::get(const std::string &owner, const std::string &name) const
        {
            auto file = find(owner, name);
            if (!file)
            {
                throw FileNotFound(owner, name);
            }
            return *file;
        }

        std::optional<Metadata::FileMetadata> InventoryStore::find(const std::string &owner, const std::string &name) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto owner_it = owners_.find(owner);
            if (owner_it == owners_.end())
            {
                return std::nullopt;
            }
            auto file_it = owner_it->second.find(name);
            if (file_it == owner_it->second.end())
            {
                return std::nullopt;
            }
            return file_it->second;
        }

        bool InventoryStore::contains(const std::string &owner, const std::string &name) const
        {
            return find(owner, name).has_value();
        }

        std::vector<Metadata::FileMetadata> InventoryStore::list(const std::string &owner) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<Metadata::FileMetadata> files;
            auto owner_it = owners_.find(owner);
            if (owner_it != owners_.end())
            {
                for (const auto &kv : owner_it->second)
                {
                    files.push_back(kv.second);
                }
            }
            return files;
        }

        std::vector<std::string> InventoryStore::releaseReferences(const Metadata::FileMetadata &file)
        {
            std::vector<std::string> released;
            for (const auto &hash : file.distinctHashes())
            {
                if (auto handle = ref_manager_.decrement(hash))
                {
                    released.push_back(*handle);
                }
            }
            return released;
        }

        CommitResult InventoryStore::commit(const Metadata::FileMetadata &file, Config::OverwritePolicy policy)
        {
            validateKey(file.owner, file.name);
            if (!file.isConsistent() || file.parts.empty())
            {
                throw std::logic_error("Refusing to commit inconsistent file record '" + file.name + "'");
            }

            std::lock_guard<std::mutex> lock(mtx_);

            OwnerFiles updated;
            auto owner_it = owners_.find(file.owner);
            if (owner_it != owners_.end())
            {
                updated = owner_it->second;
            }

            CommitResult result;
            auto existing = updated.find(file.name);
            if (existing != updated.end())
            {
                if (policy == Config::OverwritePolicy::Reject)
                {
                    throw DuplicateName(file.owner, file.name);
                }
                result.replaced = existing->second;
            }
            for (const auto &hash : file.distinctHashes())
            {
                if (ref_manager_.getPins(hash) <= 0)
                {
                    throw std::logic_error("Committing part " + hash + " without holding a pin");
                }
            }

            updated[file.name] = file;

            // Persist first; a throw here leaves memory and reference counts unchanged.
            backend_->saveOwner(file.owner, updated);
            owners_[file.owner] = std::move(updated);

            for (const auto &hash : file.distinctHashes())
            {
                ref_manager_.promotePin(hash);
            }
            if (result.replaced)
            {
                result.released_handles = releaseReferences(*result.replaced);
            }
            return result;
        }

        RemoveResult InventoryStore::remove(const std::string &owner, const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mtx_);

            auto owner_it = owners_.find(owner);
            if (owner_it == owners_.end() || owner_it->second.find(name) == owner_it->second.end())
            {
                throw FileNotFound(owner, name);
            }

            OwnerFiles updated = owner_it->second;
            RemoveResult result;
            result.removed = updated.at(name);
            updated.erase(name);

            backend_->saveOwner(owner, updated);
            if (updated.empty())
            {
                owners_.erase(owner_it);
            }
            else
            {
                owner_it->second = std::move(updated);
            }

            result.released_handles = releaseReferences(result.removed);
            return result;
        }

        std::vector<RemoveResult> InventoryStore::removeAll(const std::string &owner)
        {
            std::lock_guard<std::mutex> lock(mtx_);

            std::vector<RemoveResult> results;
            auto owner_it = owners_.find(owner);
            if (owner_it == owners_.end())
            {
                return results;
            }

            backend_->saveOwner(owner, OwnerFiles{});
            OwnerFiles removed = std::move(owner_it->second);
            owners_.erase(owner_it);

            for (auto &kv : removed)
            {
                RemoveResult result;
                result.released_handles = releaseReferences(kv.second);
                result.removed = std::move(kv.second);
                results.push_back(std::move(result));
            }
            return results;
        }

        std::optional<std::string> InventoryStore::findByHash(const std::string &hash) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return ref_manager_.findHandle(hash);
        }

        std::optional<std::string> InventoryStore::pinExisting(const std::string &hash)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return ref_manager_.pinExisting(hash);
        }

        std::string InventoryStore::pinStored(const std::string &hash, const std::string &handle)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return ref_manager_.pinStored(hash, handle);
        }

        std::vector<std::string> InventoryStore::unpin(const std::vector<std::string> &hashes)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<std::string> released;
            for (const auto &hash : hashes)
            {
                if (auto handle = ref_manager_.unpin(hash))
                {
                    released.push_back(*handle);
                }
            }
            return released;
        }

        int InventoryStore::referenceCount(const std::string &hash) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return ref_manager_.getCount(hash);
        }

        int InventoryStore::pinCount(const std::string &hash) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return ref_manager_.getPins(hash);
        }

        bool InventoryStore::isHandleReferenced(const std::string &handle) const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return ref_manager_.isHandleReferenced(handle);
        }

        void InventoryStore::persistOrphans(const std::vector<std::string> &handles)
        {
            backend_->saveOrphans(handles);
            orphans_ = handles;
        }

        void InventoryStore::recordOrphans(const std::vector<std::string> &handles)
        {
            if (handles.empty())
            {
                return;
            }
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<std::string> updated = orphans_;
            for (const auto &handle : handles)
            {
                if (std::find(updated.begin(), updated.end(), handle) == updated.end())
                {
                    updated.push_back(handle);
                }
            }
            persistOrphans(updated);
        }

        std::vector<std::string> InventoryStore::orphans() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return orphans_;
        }

        void InventoryStore::clearOrphans(const std::vector<std::string> &handles)
        {
            if (handles.empty())
            {
                return;
            }
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<std::string> updated;
            for (const auto &handle : orphans_)
            {
                if (std::find(handles.begin(), handles.end(), handle) == handles.end())
                {
                    updated.push_back(handle);
                }
            }
            persistOrphans(updated);
        }

    } // namespace Inventory
} // namespace ChunkDrive
