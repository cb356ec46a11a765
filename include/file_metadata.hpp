// include/file_metadata.hpp
#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <nlohmann/json.hpp> // For JSON handling

namespace ChunkDrive {
namespace Metadata {

// One stored part of a file. Immutable once recorded.
struct PartRecord {
    size_t ordinal = 0;
    uint64_t size = 0;
    std::string hash;   // SHA-256 CID of the part bytes
    std::string handle; // Opaque reference returned by the blob transport

    bool operator==(const PartRecord& other) const {
        return ordinal == other.ordinal && size == other.size &&
               hash == other.hash && handle == other.handle;
    }
};

class FileMetadata {
public:
    std::string owner;
    std::string name;
    uint64_t total_size = 0;
    std::string created_at;         // ISO 8601 format (e.g., "YYYY-MM-DDTHH:MM:SSZ")
    std::vector<PartRecord> parts;  // Ordered by ordinal

    FileMetadata() = default;

    // Stamps created_at with the current UTC time
    FileMetadata(std::string file_owner, std::string file_name, std::vector<PartRecord> file_parts);

    // Ordinals are 0..n-1 and part sizes add up to total_size.
    bool isConsistent() const;

    // Distinct part hashes, each listed once even if the file repeats a part.
    std::vector<std::string> distinctHashes() const;

    // Convert FileMetadata object to nlohmann::json object
    nlohmann::json toJson() const;

    // Create FileMetadata object from nlohmann::json object.
    // Throws std::runtime_error if the record violates the part invariants.
    static FileMetadata fromJson(const nlohmann::json& j);
};

void to_json(nlohmann::json& j, const PartRecord& p);
void from_json(const nlohmann::json& j, PartRecord& p);
void to_json(nlohmann::json& j, const FileMetadata& m);
void from_json(const nlohmann::json& j, FileMetadata& m);

std::string currentTimestamp();

} // namespace Metadata
} // namespace ChunkDrive
