// include/chunk_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <chrono>
#include <filesystem> // For std::filesystem::path

#include <nlohmann/json.hpp>

namespace ChunkDrive
{
    namespace Config
    {

        // What happens when an owner uploads a name that already exists.
        enum class OverwritePolicy
        {
            Replace, // last write wins, displaced parts are released
            Reject   // DuplicateName
        };

        class DriveConfig
        {
        public:
            // Discord's attachment ceiling is a little above this (10MB).
            static const size_t DEFAULT_MAX_PART_SIZE = 10000000;

            size_t max_part_size = DEFAULT_MAX_PART_SIZE;

            std::filesystem::path data_dir = ".";
            std::string chunks_dir_name = "chunks";
            std::string metadata_dir_name = "metadata";
            std::string upload_dir_name = "upload";
            std::string download_dir_name = "download";
            std::filesystem::path log_file;

            size_t worker_threads = 4;
            size_t max_parallel_parts = 4;

            size_t retry_attempts = 3;
            std::chrono::milliseconds retry_backoff{200};
            std::chrono::milliseconds transport_timeout{30000};

            OverwritePolicy overwrite_policy = OverwritePolicy::Replace;

            unsigned short listen_port = 8080;

            DriveConfig();

            // Throws std::invalid_argument for out-of-range values.
            void validate() const;

            // Missing keys keep their defaults.
            static DriveConfig fromJson(const nlohmann::json &j);
            static DriveConfig load(const std::filesystem::path &path);
            nlohmann::json toJson() const;

            // Get the absolute path for each directory.
            // These will create the directory if it doesn't exist
            std::filesystem::path getChunksDirPath() const;
            std::filesystem::path getMetadataDirPath() const;
            std::filesystem::path getUploadDirPath() const;
            std::filesystem::path getDownloadDirPath() const;

        private:
            // Helper to ensure directories exist
            std::filesystem::path ensureDirectoryExists(const std::string &dir_name) const;
        };

        OverwritePolicy parseOverwritePolicy(const std::string &value);
        std::string toString(OverwritePolicy policy);

    } // namespace Config
} // namespace ChunkDrive
