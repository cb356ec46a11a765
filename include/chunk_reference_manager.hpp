// include/chunk_reference_manager.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <vector>

#include "file_metadata.hpp"

namespace ChunkDrive
{
    namespace Chunks
    {

        // ChunkReferenceManager is the dedup table: chunk CID -> stored handle plus
        // reference counts. It is derived state; InventoryStore rebuilds it from the
        // persisted inventory on startup and updates it under its own lock so the
        // counts never disagree with the committed file records.
        //
        // refs counts committed files (across all owners) that contain the CID.
        // pins counts in-flight uploads holding the CID before they commit.
        // An entry is dropped, and its handle released, once both reach zero.
        class ChunkReferenceManager
        {
        public:
            struct Entry
            {
                std::string handle;
                int refs = 0;
                int pins = 0;
            };

            ChunkReferenceManager();

            // Dedup lookup. Returns the handle and pins the entry, or nullopt on a miss.
            std::optional<std::string> pinExisting(const std::string &chunk_cid);

            // Registers a freshly stored blob and pins it. If the CID is already known
            // the existing handle wins and is returned; the caller owns the redundant blob.
            std::string pinStored(const std::string &chunk_cid, const std::string &handle);

            // Drops one pin. Returns the handle when nothing references the chunk anymore.
            std::optional<std::string> unpin(const std::string &chunk_cid);

            // Converts a pin held by an upload into a committed file reference.
            void promotePin(const std::string &chunk_cid);

            // Decrement the reference count for a given chunk CID.
            // Returns the handle to discard when the chunk became unreferenced.
            std::optional<std::string> decrement(const std::string &chunk_cid);

            // Get the number of committed files referencing a given chunk CID.
            int getCount(const std::string &chunk_cid) const;
            int getPins(const std::string &chunk_cid) const;

            std::optional<std::string> findHandle(const std::string &chunk_cid) const;

            // True if any live entry points at this handle.
            bool isHandleReferenced(const std::string &handle) const;

            size_t size() const;

            // Replace all counts with those implied by the given files.
            void rebuild(const std::vector<Metadata::FileMetadata> &files);

        private:
            std::optional<std::string> releaseIfUnused(std::unordered_map<std::string, Entry>::iterator it);

            // Map to store chunk CID to its handle and reference counts
            std::unordered_map<std::string, Entry> entries;
            mutable std::mutex mtx; // Mutex for thread-safe access to entries
        };

    } // namespace Chunks
} // namespace ChunkDrive
