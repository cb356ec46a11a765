// src/blob_transport.cpp
#include "blob_transport.hpp"
#include "cid_utility.hpp"
#include "drive_errors.hpp"
#include <fstream>

namespace fs = std::filesystem;

namespace ChunkDrive
{
    namespace Transport
    {

        namespace
        {
            const size_t HANDLE_BYTES = 16;
        } // namespace

        DirectoryBlobTransport::DirectoryBlobTransport(fs::path blob_dir, size_t max_blob_size)
            : blob_dir_(std::move(blob_dir)), max_blob_size_(max_blob_size)
        {
            fs::create_directories(blob_dir_);
        }

        fs::path DirectoryBlobTransport::getFullPath(const std::string &handle) const
        {
            // Handles are generated here as hex; anything else could walk out of blob_dir_.
            if (handle.size() != HANDLE_BYTES * 2 ||
                handle.find_first_not_of("0123456789abcdef") != std::string::npos)
            {
                throw TransportError("Malformed blob handle: " + handle, false);
            }
            return blob_dir_ / handle;
        }

        std::string DirectoryBlobTransport::store(const std::vector<char> &data, std::chrono::milliseconds)
        {
            if (data.size() > max_blob_size_)
            {
                throw TransportError("Blob of " + std::to_string(data.size()) + " bytes exceeds transport limit of " +
                                         std::to_string(max_blob_size_),
                                     false);
            }

            std::string handle = CID::CIDUtility::randomHex(HANDLE_BYTES);
            fs::path blob_path = getFullPath(handle);
            fs::path temp_path = blob_path;
            temp_path += ".tmp";

            {
                std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw TransportError("Failed to open file for writing blob: " + temp_path.string());
                }
                ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
                ofs.flush();
                if (!ofs.good())
                {
                    ofs.close();
                    std::error_code ec;
                    fs::remove(temp_path, ec);
                    throw TransportError("Failed to write all data to blob file: " + temp_path.string());
                }
            }

            std::error_code ec;
            fs::rename(temp_path, blob_path, ec);
            if (ec)
            {
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                throw TransportError("Failed to publish blob " + handle + ": " + ec.message());
            }
            return handle;
        }

        std::vector<char> DirectoryBlobTransport::fetch(const std::string &handle, std::chrono::milliseconds)
        {
            fs::path blob_path = getFullPath(handle);

            if (!fs::exists(blob_path))
            {
                throw TransportError("Blob not found: " + handle, false);
            }

            std::ifstream ifs(blob_path, std::ios::binary | std::ios::ate);
            if (!ifs.is_open())
            {
                throw TransportError("Failed to open blob file for reading: " + blob_path.string());
            }

            std::streamsize size = ifs.tellg();
            if (size == -1)
            {
                throw TransportError("Failed to get size of blob file: " + blob_path.string());
            }
            ifs.seekg(0, std::ios::beg);

            std::vector<char> buffer(static_cast<size_t>(size));
            if (size > 0 && !ifs.read(buffer.data(), size))
            {
                throw TransportError("Failed to read all data from blob file: " + blob_path.string());
            }
            return buffer;
        }

        void DirectoryBlobTransport::discard(const std::string &handle, std::chrono::milliseconds)
        {
            fs::path blob_path = getFullPath(handle);
            std::error_code ec;
            fs::remove(blob_path, ec);
            if (ec)
            {
                throw TransportError("Error deleting blob file " + blob_path.string() + ": " + ec.message());
            }
        }

        size_t DirectoryBlobTransport::blobCount() const
        {
            size_t count = 0;
            for (const auto &entry : fs::directory_iterator(blob_dir_))
            {
                if (entry.is_regular_file() && entry.path().extension() != ".tmp")
                {
                    count++;
                }
            }
            return count;
        }

    } // namespace Transport
} // namespace ChunkDrive
