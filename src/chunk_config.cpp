// src/chunk_config.cpp
#include "chunk_config.hpp"
#include "drive_log.hpp"
#include <fstream>
#include <thread>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace ChunkDrive
{
    namespace Config
    {

        const size_t DriveConfig::DEFAULT_MAX_PART_SIZE;

        DriveConfig::DriveConfig()
        {
            const size_t hw = std::thread::hardware_concurrency();
            worker_threads = hw == 0 ? 4 : hw;
        }

        OverwritePolicy parseOverwritePolicy(const std::string &value)
        {
            if (value == "replace")
            {
                return OverwritePolicy::Replace;
            }
            if (value == "reject")
            {
                return OverwritePolicy::Reject;
            }
            throw std::invalid_argument("Unknown overwrite_policy: " + value);
        }

        std::string toString(OverwritePolicy policy)
        {
            return policy == OverwritePolicy::Reject ? "reject" : "replace";
        }

        void DriveConfig::validate() const
        {
            if (max_part_size == 0)
            {
                throw std::invalid_argument("max_part_size must be greater than zero");
            }
            if (worker_threads == 0)
            {
                throw std::invalid_argument("worker_threads must be greater than zero");
            }
            if (max_parallel_parts == 0)
            {
                throw std::invalid_argument("max_parallel_parts must be greater than zero");
            }
            if (retry_attempts == 0)
            {
                throw std::invalid_argument("retry_attempts must be at least 1");
            }
            if (transport_timeout.count() <= 0)
            {
                throw std::invalid_argument("transport_timeout_ms must be positive");
            }
            if (retry_backoff.count() < 0)
            {
                throw std::invalid_argument("retry_backoff_ms must not be negative");
            }
        }

        DriveConfig DriveConfig::fromJson(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("Configuration root must be a JSON object");
            }

            DriveConfig config;
            try
            {
                config.max_part_size = j.value("max_part_size", config.max_part_size);
                config.data_dir = j.value("data_dir", config.data_dir.string());
                config.chunks_dir_name = j.value("chunks_dir_name", config.chunks_dir_name);
                config.metadata_dir_name = j.value("metadata_dir_name", config.metadata_dir_name);
                config.upload_dir_name = j.value("upload_dir_name", config.upload_dir_name);
                config.download_dir_name = j.value("download_dir_name", config.download_dir_name);
                config.log_file = j.value("log_file", config.log_file.string());
                config.worker_threads = j.value("worker_threads", config.worker_threads);
                config.max_parallel_parts = j.value("max_parallel_parts", config.max_parallel_parts);
                config.retry_attempts = j.value("retry_attempts", config.retry_attempts);
                config.retry_backoff = std::chrono::milliseconds(
                    j.value("retry_backoff_ms", static_cast<long long>(config.retry_backoff.count())));
                config.transport_timeout = std::chrono::milliseconds(
                    j.value("transport_timeout_ms", static_cast<long long>(config.transport_timeout.count())));
                config.overwrite_policy = parseOverwritePolicy(
                    j.value("overwrite_policy", toString(config.overwrite_policy)));
                config.listen_port = j.value("listen_port", config.listen_port);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
            }

            config.validate();
            return config;
        }

        DriveConfig DriveConfig::load(const fs::path &path)
        {
            std::ifstream ifs(path);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open configuration file: " + path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Error parsing configuration file " + path.string() + ": " + e.what());
            }
            return fromJson(j);
        }

        nlohmann::json DriveConfig::toJson() const
        {
            return nlohmann::json{
                {"max_part_size", max_part_size},
                {"data_dir", data_dir.string()},
                {"chunks_dir_name", chunks_dir_name},
                {"metadata_dir_name", metadata_dir_name},
                {"upload_dir_name", upload_dir_name},
                {"download_dir_name", download_dir_name},
                {"log_file", log_file.string()},
                {"worker_threads", worker_threads},
                {"max_parallel_parts", max_parallel_parts},
                {"retry_attempts", retry_attempts},
                {"retry_backoff_ms", retry_backoff.count()},
                {"transport_timeout_ms", transport_timeout.count()},
                {"overwrite_policy", toString(overwrite_policy)},
                {"listen_port", listen_port}};
        }

        fs::path DriveConfig::ensureDirectoryExists(const std::string &dir_name) const
        {
            fs::path dir_path = fs::absolute(data_dir / dir_name);

            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        Logging::info("CONFIG", "", "Created directory: " + dir_path.string());
                    }
                    else if (!fs::exists(dir_path))
                    {
                        // Another process may have created it in the meantime.
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        fs::path DriveConfig::getChunksDirPath() const
        {
            return ensureDirectoryExists(chunks_dir_name);
        }

        fs::path DriveConfig::getMetadataDirPath() const
        {
            return ensureDirectoryExists(metadata_dir_name);
        }

        fs::path DriveConfig::getUploadDirPath() const
        {
            return ensureDirectoryExists(upload_dir_name);
        }

        fs::path DriveConfig::getDownloadDirPath() const
        {
            return ensureDirectoryExists(download_dir_name);
        }

    } // namespace Config
} // namespace ChunkDrive
