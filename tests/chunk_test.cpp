#include "chunk.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "drive_errors.hpp"
#include "test_support.hpp"

using ChunkDrive::Chunks::Chunk;
using ChunkDrive::Chunks::ChunkReader;
using ChunkDrive::Chunks::joinChunks;
using ChunkDrive::Chunks::splitBuffer;
using ChunkDriveTest::Check;

namespace {

std::vector<std::vector<char>> Payloads(const std::vector<Chunk>& chunks) {
  std::vector<std::vector<char>> parts;
  for (const auto& chunk : chunks) {
    parts.push_back(chunk.data);
  }
  return parts;
}

}  // namespace

int main() {
  {
    // Join(Split(S, M)) == S across sizes around the part boundary
    const std::vector<size_t> part_sizes = {1, 3, 7, 64, 1000};
    const std::vector<size_t> input_sizes = {1, 2, 63, 64, 65, 999, 1000, 1001, 4096};
    for (size_t m : part_sizes) {
      for (size_t n : input_sizes) {
        const auto data = ChunkDriveTest::RandomBytes(n, static_cast<std::uint32_t>(n * 31 + m));
        const auto chunks = splitBuffer(data, m);

        if (!Check(chunks.size() == (n + m - 1) / m, "part count for n=" + std::to_string(n))) {
          return 1;
        }
        for (size_t i = 0; i < chunks.size(); ++i) {
          if (!Check(chunks[i].ordinal == i, "ordinals are sequential")) {
            return 1;
          }
          if (!Check(chunks[i].size() <= m, "part within bound")) {
            return 1;
          }
          if (i + 1 < chunks.size() && !Check(chunks[i].size() == m, "non-final part is full")) {
            return 1;
          }
          if (!Check(chunks[i].cid == ChunkDrive::CID::CIDUtility::generateSHA256(chunks[i].data),
                     "cid matches part bytes")) {
            return 1;
          }
        }
        if (!Check(!chunks.empty() && !chunks.back().data.empty(), "last part is non-empty")) {
          return 1;
        }
        if (!Check(joinChunks(Payloads(chunks)) == data, "round trip")) {
          return 1;
        }
      }
    }
  }

  {
    // Empty input yields zero parts
    std::istringstream empty("");
    ChunkReader reader(empty, 16);
    Chunk chunk;
    if (!Check(!reader.next(chunk), "empty input has no parts")) {
      return 1;
    }
    if (!Check(reader.chunksRead() == 0 && reader.bytesRead() == 0, "empty reader counters")) {
      return 1;
    }
  }

  {
    // Exact multiple: no trailing empty part
    std::istringstream input(std::string(30, 'x'));
    ChunkReader reader(input, 10);
    Chunk chunk;
    size_t count = 0;
    while (reader.next(chunk)) {
      count++;
    }
    if (!Check(count == 3 && reader.bytesRead() == 30, "exact multiple gives three parts")) {
      return 1;
    }
    if (!Check(!reader.next(chunk), "reader stays exhausted")) {
      return 1;
    }
  }

  {
    // Restartable from the start
    std::istringstream input("abcdefghij");
    ChunkReader reader(input, 4);
    Chunk first;
    Chunk chunk;
    if (!reader.next(first)) {
      return 1;
    }
    while (reader.next(chunk)) {
    }
    reader.rewind();
    Chunk again;
    if (!Check(reader.next(again) && again.data == first.data && again.ordinal == 0, "rewind restarts")) {
      return 1;
    }
  }

  {
    // Zero part size is a programming error
    std::istringstream input("abc");
    bool threw = false;
    try {
      ChunkReader reader(input, 0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!Check(threw, "zero part size rejected")) {
      return 1;
    }
  }

  {
    // Oversized part fails fast instead of being truncated
    Chunk oversized(0, std::vector<char>(11, 'z'));
    bool threw = false;
    try {
      ChunkDrive::Chunks::enforcePartSize(oversized, 10);
    } catch (const ChunkDrive::PartSizeExceeded&) {
      threw = true;
    }
    if (!Check(threw, "oversized part rejected")) {
      return 1;
    }
  }

  {
    // Stream join writes parts in the given order
    std::ostringstream out;
    joinChunks({ChunkDriveTest::Bytes("ab"), ChunkDriveTest::Bytes("cd"), ChunkDriveTest::Bytes("e")}, out);
    if (!Check(out.str() == "abcde", "stream join")) {
      return 1;
    }
  }

  return 0;
}
