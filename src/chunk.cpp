// src/chunk.cpp
#include "chunk.hpp"
#include "drive_errors.hpp"
#include <sstream>
#include <stdexcept>

namespace ChunkDrive
{
    namespace Chunks
    {

        ChunkReader::ChunkReader(std::istream &source, size_t max_part_size)
            : source_(source), max_part_size_(max_part_size)
        {
            if (max_part_size_ == 0)
            {
                throw std::invalid_argument("Chunk size must be greater than zero.");
            }
            start_ = source_.tellg();
        }

        bool ChunkReader::next(Chunk &out)
        {
            if (exhausted_)
            {
                return false;
            }

            std::vector<char> buffer(max_part_size_);
            source_.read(buffer.data(), static_cast<std::streamsize>(max_part_size_));
            std::streamsize count = source_.gcount();

            if (source_.bad())
            {
                throw std::runtime_error("Read error while splitting input into chunks.");
            }
            if (count < static_cast<std::streamsize>(max_part_size_))
            {
                // Short read means end of input, the last partial chunk (if any) follows
                exhausted_ = true;
            }
            if (count <= 0)
            {
                return false;
            }

            buffer.resize(static_cast<size_t>(count));
            out = Chunk(next_ordinal_, std::move(buffer));
            enforcePartSize(out, max_part_size_);

            next_ordinal_++;
            bytes_read_ += out.size();
            return true;
        }

        void ChunkReader::rewind()
        {
            if (start_ == std::streampos(-1))
            {
                throw std::runtime_error("Chunk source is not seekable.");
            }
            source_.clear();
            source_.seekg(start_);
            if (!source_)
            {
                throw std::runtime_error("Failed to rewind chunk source.");
            }
            next_ordinal_ = 0;
            bytes_read_ = 0;
            exhausted_ = false;
        }

        void enforcePartSize(const Chunk &chunk, size_t max_part_size)
        {
            if (chunk.size() > max_part_size)
            {
                throw PartSizeExceeded(chunk.ordinal, chunk.size(), max_part_size);
            }
        }

        std::vector<Chunk> splitBuffer(const std::vector<char> &buffer, size_t max_part_size)
        {
            std::istringstream iss(std::string(buffer.begin(), buffer.end()));
            ChunkReader reader(iss, max_part_size);

            std::vector<Chunk> chunks;
            Chunk chunk;
            while (reader.next(chunk))
            {
                chunks.push_back(std::move(chunk));
            }
            return chunks;
        }

        void joinChunks(const std::vector<std::vector<char>> &parts, std::ostream &out)
        {
            for (const auto &part : parts)
            {
                out.write(part.data(), static_cast<std::streamsize>(part.size()));
                if (!out.good())
                {
                    throw std::runtime_error("Failed to write chunk data while joining parts.");
                }
            }
        }

        std::vector<char> joinChunks(const std::vector<std::vector<char>> &parts)
        {
            size_t total = 0;
            for (const auto &part : parts)
            {
                total += part.size();
            }

            std::vector<char> joined;
            joined.reserve(total);
            for (const auto &part : parts)
            {
                joined.insert(joined.end(), part.begin(), part.end());
            }
            return joined;
        }

    } // namespace Chunks
} // namespace ChunkDrive
