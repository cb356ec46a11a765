#include "chunk_reference_manager.hpp"

#include <string>
#include <vector>

#include "test_support.hpp"

using ChunkDrive::Chunks::ChunkReferenceManager;
using ChunkDrive::Metadata::FileMetadata;
using ChunkDrive::Metadata::PartRecord;
using ChunkDriveTest::Check;

namespace {

PartRecord Part(size_t ordinal, const std::string& hash, const std::string& handle) {
  PartRecord part;
  part.ordinal = ordinal;
  part.size = 1;
  part.hash = hash;
  part.handle = handle;
  return part;
}

}  // namespace

int main() {
  {
    ChunkReferenceManager refs;
    if (!Check(!refs.pinExisting("h1").has_value(), "miss on empty table")) {
      return 1;
    }

    // First store registers the handle, a racing second store gets the first handle back
    if (!Check(refs.pinStored("h1", "blob-a") == "blob-a", "first store wins")) {
      return 1;
    }
    if (!Check(refs.pinStored("h1", "blob-b") == "blob-a", "racing store reuses handle")) {
      return 1;
    }
    if (!Check(refs.getPins("h1") == 2 && refs.getCount("h1") == 0, "two pins, no refs")) {
      return 1;
    }

    refs.promotePin("h1");
    if (!Check(refs.getCount("h1") == 1 && refs.getPins("h1") == 1, "pin promoted to ref")) {
      return 1;
    }
    if (!Check(!refs.unpin("h1").has_value(), "unpin keeps referenced entry")) {
      return 1;
    }

    auto released = refs.decrement("h1");
    if (!Check(released && *released == "blob-a", "last decrement releases handle")) {
      return 1;
    }
    if (!Check(!refs.findHandle("h1").has_value() && refs.size() == 0, "entry dropped")) {
      return 1;
    }
  }

  {
    // A dedup pin keeps the blob alive while the last file referencing it is removed
    ChunkReferenceManager refs;
    refs.pinStored("h2", "blob-c");
    refs.promotePin("h2");
    auto handle = refs.pinExisting("h2");
    if (!Check(handle && *handle == "blob-c", "dedup hit")) {
      return 1;
    }
    if (!Check(!refs.decrement("h2").has_value(), "pinned chunk survives decrement")) {
      return 1;
    }
    auto released = refs.unpin("h2");
    if (!Check(released && *released == "blob-c", "unpin releases once unused")) {
      return 1;
    }
  }

  {
    // Decrementing an unknown chunk is tolerated
    ChunkReferenceManager refs;
    if (!Check(!refs.decrement("missing").has_value() && refs.getCount("missing") == 0, "unknown decrement")) {
      return 1;
    }
  }

  {
    // Rebuild counts each file once per distinct hash
    FileMetadata a("alice", "a.bin", {Part(0, "x", "blob-x"), Part(1, "x", "blob-x"), Part(2, "y", "blob-y")});
    FileMetadata b("bob", "b.bin", {Part(0, "x", "blob-x")});
    ChunkReferenceManager refs;
    refs.rebuild({a, b});
    if (!Check(refs.getCount("x") == 2 && refs.getCount("y") == 1, "rebuilt counts")) {
      return 1;
    }
    if (!Check(refs.isHandleReferenced("blob-y") && !refs.isHandleReferenced("blob-z"), "handle lookup")) {
      return 1;
    }
  }

  return 0;
}
