// src/inventory_backend.cpp
#include "inventory_backend.hpp"
#include "cid_utility.hpp"
#include "drive_log.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept> // For std::runtime_error

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace ChunkDrive
{
    namespace Inventory
    {

        namespace
        {
            const char *const OWNERS_DIR = "owners";
            const char *const OWNER_SUFFIX = ".json";
            const char *const ORPHANS_FILE = "orphans.json";

            nlohmann::json readJsonFile(const fs::path &path)
            {
                std::ifstream ifs(path);
                if (!ifs.is_open())
                {
                    throw std::runtime_error("Failed to open metadata file for reading: " + path.string());
                }

                nlohmann::json j;
                try
                {
                    ifs >> j;
                }
                catch (const nlohmann::json::parse_error &e)
                {
                    throw std::runtime_error("Error parsing JSON metadata file " + path.string() + ": " + e.what());
                }
                return j;
            }
        } // namespace

        JsonDirectoryBackend::JsonDirectoryBackend(fs::path metadata_dir)
            : metadata_dir_(std::move(metadata_dir)),
              owners_dir_(metadata_dir_ / OWNERS_DIR)
        {
            fs::create_directories(owners_dir_);
        }

        std::string JsonDirectoryBackend::encodeOwner(const std::string &owner)
        {
            static const char HEX[] = "0123456789ABCDEF";
            std::string encoded;
            for (unsigned char c : owner)
            {
                if (std::isalnum(c) || c == '_' || c == '-')
                {
                    encoded.push_back(static_cast<char>(c));
                }
                else
                {
                    encoded.push_back('%');
                    encoded.push_back(HEX[c >> 4]);
                    encoded.push_back(HEX[c & 0x0F]);
                }
            }
            return encoded;
        }

        std::string JsonDirectoryBackend::decodeOwner(const std::string &encoded)
        {
            std::string owner;
            for (size_t i = 0; i < encoded.size(); ++i)
            {
                if (encoded[i] == '%' && i + 2 < encoded.size() &&
                    std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) &&
                    std::isxdigit(static_cast<unsigned char>(encoded[i + 2])))
                {
                    owner.push_back(static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16)));
                    i += 2;
                }
                else
                {
                    owner.push_back(encoded[i]);
                }
            }
            return owner;
        }

        fs::path JsonDirectoryBackend::ownerPath(const std::string &owner) const
        {
            return owners_dir_ / (encodeOwner(owner) + OWNER_SUFFIX);
        }

        std::map<std::string, OwnerFiles> JsonDirectoryBackend::loadAll()
        {
            std::map<std::string, OwnerFiles> owners;
            for (const auto &dir_entry : fs::directory_iterator(owners_dir_))
            {
                const fs::path &path = dir_entry.path();
                if (!dir_entry.is_regular_file() || path.extension() != OWNER_SUFFIX)
                {
                    continue;
                }

                nlohmann::json j = readJsonFile(path);
                std::string owner = j.value("owner", decodeOwner(path.stem().string()));

                OwnerFiles files;
                for (const auto &record : j.value("files", nlohmann::json::array()))
                {
                    Metadata::FileMetadata file = Metadata::FileMetadata::fromJson(record);
                    if (file.owner != owner)
                    {
                        throw std::runtime_error("File record '" + file.name + "' in " + path.string() +
                                                 " belongs to another owner");
                    }
                    files[file.name] = std::move(file);
                }
                if (!files.empty())
                {
                    owners[owner] = std::move(files);
                }
            }
            return owners;
        }

        void JsonDirectoryBackend::writeAtomically(const fs::path &path, const std::string &contents)
        {
            fs::path temp_path = path;
            temp_path += ".tmp-" + CID::CIDUtility::randomHex(4);

            {
                std::ofstream ofs(temp_path, std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw std::runtime_error("Failed to open file for writing metadata: " + temp_path.string());
                }
                ofs << contents;
                ofs.flush();
                if (!ofs.good())
                {
                    ofs.close();
                    std::error_code ec;
                    fs::remove(temp_path, ec);
                    throw std::runtime_error("Failed to write all data to metadata file: " + temp_path.string());
                }
            }

            std::error_code ec;
            fs::rename(temp_path, path, ec);
            if (ec)
            {
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                throw std::runtime_error("Failed to replace metadata file " + path.string() + ": " + ec.message());
            }
        }

        void JsonDirectoryBackend::saveOwner(const std::string &owner, const OwnerFiles &files)
        {
            fs::path path = ownerPath(owner);
            if (files.empty())
            {
                std::error_code ec;
                fs::remove(path, ec);
                if (ec)
                {
                    throw std::runtime_error("Failed to remove metadata file " + path.string() + ": " + ec.message());
                }
                return;
            }

            nlohmann::json records = nlohmann::json::array();
            for (const auto &kv : files)
            {
                records.push_back(kv.second.toJson());
            }
            nlohmann::json j{{"owner", owner}, {"files", records}};
            writeAtomically(path, j.dump(4)); // Pretty print with 4 spaces
        }

        std::vector<std::string> JsonDirectoryBackend::loadOrphans()
        {
            fs::path path = metadata_dir_ / ORPHANS_FILE;
            if (!fs::exists(path))
            {
                return {};
            }
            nlohmann::json j = readJsonFile(path);
            return j.value("handles", std::vector<std::string>{});
        }

        void JsonDirectoryBackend::saveOrphans(const std::vector<std::string> &handles)
        {
            nlohmann::json j{{"handles", handles}};
            writeAtomically(metadata_dir_ / ORPHANS_FILE, j.dump(4));
        }

        std::map<std::string, OwnerFiles> MemoryInventoryBackend::loadAll()
        {
            std::lock_guard<std::mutex> lock(mtx);
            return owners;
        }

        void MemoryInventoryBackend::saveOwner(const std::string &owner, const OwnerFiles &files)
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (failures_pending > 0)
            {
                failures_pending--;
                throw std::runtime_error("Simulated persistence failure for owner " + owner);
            }
            saves++;
            if (files.empty())
            {
                owners.erase(owner);
            }
            else
            {
                owners[owner] = files;
            }
        }

        std::vector<std::string> MemoryInventoryBackend::loadOrphans()
        {
            std::lock_guard<std::mutex> lock(mtx);
            return orphans;
        }

        void MemoryInventoryBackend::saveOrphans(const std::vector<std::string> &handles)
        {
            std::lock_guard<std::mutex> lock(mtx);
            orphans = handles;
        }

        void MemoryInventoryBackend::failNextSaves(int n)
        {
            std::lock_guard<std::mutex> lock(mtx);
            failures_pending = n;
        }

        size_t MemoryInventoryBackend::saveCount() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return saves;
        }

    } // namespace Inventory
} // namespace ChunkDrive
