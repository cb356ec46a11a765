// src/file_metadata.cpp
#include "file_metadata.hpp"
#include <chrono>    // For timestamps
#include <ctime>
#include <set>
#include <stdexcept> // For std::runtime_error

namespace ChunkDrive {
namespace Metadata {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm utc_tm{};
    gmtime_r(&now_c, &utc_tm);
    char buf[32];
    // Format as YYYY-MM-DDTHH:MM:SSZ
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc_tm);
    return buf;
}

FileMetadata::FileMetadata(std::string file_owner, std::string file_name, std::vector<PartRecord> file_parts)
    : owner(std::move(file_owner)),
      name(std::move(file_name)),
      created_at(currentTimestamp()),
      parts(std::move(file_parts)) {
    for (const auto& part : parts) {
        total_size += part.size;
    }
}

bool FileMetadata::isConsistent() const {
    uint64_t sum = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].ordinal != i) {
            return false;
        }
        sum += parts[i].size;
    }
    return sum == total_size;
}

std::vector<std::string> FileMetadata::distinctHashes() const {
    std::set<std::string> seen;
    std::vector<std::string> hashes;
    for (const auto& part : parts) {
        if (seen.insert(part.hash).second) {
            hashes.push_back(part.hash);
        }
    }
    return hashes;
}

void to_json(nlohmann::json& j, const PartRecord& p) {
    j = nlohmann::json{
        {"ordinal", p.ordinal},
        {"size", p.size},
        {"hash", p.hash},
        {"handle", p.handle}
    };
}

void from_json(const nlohmann::json& j, PartRecord& p) {
    j.at("ordinal").get_to(p.ordinal);
    j.at("size").get_to(p.size);
    j.at("hash").get_to(p.hash);
    j.at("handle").get_to(p.handle);
}

void to_json(nlohmann::json& j, const FileMetadata& m) {
    j = nlohmann::json{
        {"owner", m.owner},
        {"name", m.name},
        {"size", m.total_size},
        {"created_at", m.created_at},
        {"parts", m.parts}
    };
}

void from_json(const nlohmann::json& j, FileMetadata& m) {
    j.at("owner").get_to(m.owner);
    j.at("name").get_to(m.name);
    j.at("size").get_to(m.total_size);
    j.at("created_at").get_to(m.created_at);
    j.at("parts").get_to(m.parts);
}

nlohmann::json FileMetadata::toJson() const {
    return *this; // Uses the to_json helper function
}

FileMetadata FileMetadata::fromJson(const nlohmann::json& j) {
    FileMetadata metadata;
    try {
        j.get_to(metadata); // Uses the from_json helper function
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed file record: ") + e.what());
    }
    if (!metadata.isConsistent()) {
        throw std::runtime_error("Inconsistent part list in file record '" + metadata.name + "'");
    }
    return metadata;
}

} // namespace Metadata
} // namespace ChunkDrive
