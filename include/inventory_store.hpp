// include/inventory_store.hpp
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunk_config.hpp"
#include "chunk_reference_manager.hpp"
#include "file_metadata.hpp"
#include "inventory_backend.hpp"

namespace ChunkDrive
{
    namespace Inventory
    {

        struct CommitResult
        {
            std::optional<Metadata::FileMetadata> replaced;
            std::vector<std::string> released_handles; // no longer referenced, safe to discard
        };

        struct RemoveResult
        {
            Metadata::FileMetadata removed;
            std::vector<std::string> released_handles;
        };

        // Single source of truth for what each owner has stored and how to rebuild it.
        //
        // Every mutation of the file records and of the dedup reference table happens
        // under one mutex, and the backend is written before the in-memory state is
        // swapped, so a failed write leaves both untouched. No transport I/O is done here.
        class InventoryStore
        {
        public:
            explicit InventoryStore(std::shared_ptr<InventoryBackend> backend);

            // Throws FileNotFound.
            Metadata::FileMetadata get(const std::string &owner, const std::string &name) const;
            std::optional<Metadata::FileMetadata> find(const std::string &owner, const std::string &name) const;
            bool contains(const std::string &owner, const std::string &name) const;

            // Owner's files in lexical name order.
            std::vector<Metadata::FileMetadata> list(const std::string &owner) const;

            // Atomically record file, converting the upload's pins on its distinct part
            // hashes into references. Each distinct hash must have been pinned once by
            // the caller. With Reject policy an existing name throws DuplicateName and
            // leaves the pins in place for the caller to release.
            CommitResult commit(const Metadata::FileMetadata &file, Config::OverwritePolicy policy);

            // Throws FileNotFound.
            RemoveResult remove(const std::string &owner, const std::string &name);
            std::vector<RemoveResult> removeAll(const std::string &owner);

            // Dedup support
            std::optional<std::string> findByHash(const std::string &hash) const;
            std::optional<std::string> pinExisting(const std::string &hash);
            std::string pinStored(const std::string &hash, const std::string &handle);
            std::vector<std::string> unpin(const std::vector<std::string> &hashes);
            int referenceCount(const std::string &hash) const;
            int pinCount(const std::string &hash) const;
            bool isHandleReferenced(const std::string &handle) const;

            // Blobs that still need a discard from the transport.
            void recordOrphans(const std::vector<std::string> &handles);
            std::vector<std::string> orphans() const;
            void clearOrphans(const std::vector<std::string> &handles);

            // Throws InvalidName for an empty owner or name, or control characters in either.
            static void validateKey(const std::string &owner, const std::string &name);

        private:
            std::vector<std::string> releaseReferences(const Metadata::FileMetadata &file);
            void persistOrphans(const std::vector<std::string> &handles);

            std::shared_ptr<InventoryBackend> backend_;
            std::map<std::string, OwnerFiles> owners_;
            std::vector<std::string> orphans_;
            Chunks::ChunkReferenceManager ref_manager_;
            mutable std::mutex mtx_;
        };

    } // namespace Inventory
} // namespace ChunkDrive
