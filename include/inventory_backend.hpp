// include/inventory_backend.hpp
#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "file_metadata.hpp"

namespace ChunkDrive
{
    namespace Inventory
    {

        // name -> file record for a single owner. Ordered, so listings are lexical.
        using OwnerFiles = std::map<std::string, Metadata::FileMetadata>;

        // Durable storage for the inventory. One record per owner, replaced atomically.
        class InventoryBackend
        {
        public:
            virtual ~InventoryBackend() = default;

            virtual std::map<std::string, OwnerFiles> loadAll() = 0;

            // Replace the whole record for owner. An empty map removes the record.
            virtual void saveOwner(const std::string &owner, const OwnerFiles &files) = 0;

            virtual std::vector<std::string> loadOrphans() = 0;
            virtual void saveOrphans(const std::vector<std::string> &handles) = 0;
        };

        // One "owners/<owner>.json" document per owner inside the metadata directory, and the
        // orphan ledger in "orphans.json" beside it, so no owner id can collide with the ledger.
        // Each write goes to a temp file that is renamed over the old one.
        class JsonDirectoryBackend : public InventoryBackend
        {
        public:
            explicit JsonDirectoryBackend(std::filesystem::path metadata_dir);

            std::map<std::string, OwnerFiles> loadAll() override;
            void saveOwner(const std::string &owner, const OwnerFiles &files) override;
            std::vector<std::string> loadOrphans() override;
            void saveOrphans(const std::vector<std::string> &handles) override;

            // Owner ids become file names; characters outside [A-Za-z0-9_-] are %XX escaped.
            static std::string encodeOwner(const std::string &owner);
            static std::string decodeOwner(const std::string &encoded);

            std::filesystem::path ownerPath(const std::string &owner) const;

        private:
            void writeAtomically(const std::filesystem::path &path, const std::string &contents);

            std::filesystem::path metadata_dir_;
            std::filesystem::path owners_dir_;
        };

        class MemoryInventoryBackend : public InventoryBackend
        {
        public:
            std::map<std::string, OwnerFiles> loadAll() override;
            void saveOwner(const std::string &owner, const OwnerFiles &files) override;
            std::vector<std::string> loadOrphans() override;
            void saveOrphans(const std::vector<std::string> &handles) override;

            // Makes the next n saves throw std::runtime_error.
            void failNextSaves(int n);
            size_t saveCount() const;

        private:
            mutable std::mutex mtx;
            std::map<std::string, OwnerFiles> owners;
            std::vector<std::string> orphans;
            int failures_pending = 0;
            size_t saves = 0;
        };

    } // namespace Inventory
} // namespace ChunkDrive
