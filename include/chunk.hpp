// include/chunk.hpp
#pragma once

#include <vector>
#include <string>
#include <istream>
#include <ostream>
#include <cstddef>

#include "cid_utility.hpp"

namespace ChunkDrive {
namespace Chunks {

class Chunk {
public:
    size_t ordinal = 0;     // Position of the chunk within its file
    std::vector<char> data; // The actual content of the chunk
    std::string cid;        // The Content Identifier (SHA-256 hash)

    // Constructor to create a chunk from data and generate its CID
    Chunk(size_t chunk_ordinal, std::vector<char> chunk_data)
        : ordinal(chunk_ordinal), data(std::move(chunk_data)) {
        cid = CID::CIDUtility::generateSHA256(data);
    }

    Chunk() = default;

    size_t size() const { return data.size(); }
};

// Lazily splits a byte stream into ordered chunks of at most max_part_size bytes.
// Every chunk but the last is exactly max_part_size; empty input yields no chunks.
class ChunkReader {
public:
    ChunkReader(std::istream& source, size_t max_part_size);

    // Reads the next chunk into out. Returns false once the stream is exhausted.
    bool next(Chunk& out);

    // Restart from the first byte. Throws std::runtime_error if the stream cannot seek.
    void rewind();

    size_t chunksRead() const { return next_ordinal_; }
    size_t bytesRead() const { return bytes_read_; }
    size_t maxPartSize() const { return max_part_size_; }

private:
    std::istream& source_;
    size_t max_part_size_;
    std::streampos start_;
    size_t next_ordinal_ = 0;
    size_t bytes_read_ = 0;
    bool exhausted_ = false;
};

// Throws PartSizeExceeded when a chunk is larger than max_part_size.
void enforcePartSize(const Chunk& chunk, size_t max_part_size);

// In-memory form of ChunkReader.
std::vector<Chunk> splitBuffer(const std::vector<char>& buffer, size_t max_part_size);

// Concatenates parts in the order given. Throws std::runtime_error on a stream write failure.
void joinChunks(const std::vector<std::vector<char>>& parts, std::ostream& out);
std::vector<char> joinChunks(const std::vector<std::vector<char>>& parts);

} // namespace Chunks
} // namespace ChunkDrive
