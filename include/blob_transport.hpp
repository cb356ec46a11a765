// include/blob_transport.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ChunkDrive
{
    namespace Transport
    {

        // Opaque store/fetch of single bounded-size blobs, e.g. one attachment per
        // message on a chat platform. Every call must return or throw TransportError
        // within the given timeout.
        class BlobTransport
        {
        public:
            virtual ~BlobTransport() = default;

            // Returns an opaque handle for the stored bytes.
            virtual std::string store(const std::vector<char> &data, std::chrono::milliseconds timeout) = 0;

            virtual std::vector<char> fetch(const std::string &handle, std::chrono::milliseconds timeout) = 0;

            // Deleting an already missing blob is not an error.
            virtual void discard(const std::string &handle, std::chrono::milliseconds timeout) = 0;

            // Hard per-blob ceiling of the host platform.
            virtual size_t maxBlobSize() const = 0;
        };

        // Keeps every blob as a file named by a random 128-bit handle inside a directory.
        class DirectoryBlobTransport : public BlobTransport
        {
        public:
            DirectoryBlobTransport(std::filesystem::path blob_dir, size_t max_blob_size);

            std::string store(const std::vector<char> &data, std::chrono::milliseconds timeout) override;
            std::vector<char> fetch(const std::string &handle, std::chrono::milliseconds timeout) override;
            void discard(const std::string &handle, std::chrono::milliseconds timeout) override;
            size_t maxBlobSize() const override { return max_blob_size_; }

            // Get the full path where a blob with this handle is stored
            std::filesystem::path getFullPath(const std::string &handle) const;

            size_t blobCount() const;

        private:
            std::filesystem::path blob_dir_;
            size_t max_blob_size_;
        };

    } // namespace Transport
} // namespace ChunkDrive
