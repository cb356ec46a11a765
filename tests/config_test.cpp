#include "chunk_config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "test_support.hpp"

using ChunkDrive::Config::DriveConfig;
using ChunkDrive::Config::OverwritePolicy;
using ChunkDriveTest::Check;

static void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

static bool Rejects(const std::string& json_text) {
  try {
    DriveConfig::fromJson(nlohmann::json::parse(json_text));
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

int main() {
  {
    DriveConfig defaults;
    if (!Check(defaults.max_part_size == 10000000, "default part size")) {
      return 1;
    }
    if (!Check(defaults.overwrite_policy == OverwritePolicy::Replace, "default policy")) {
      return 1;
    }
    if (!Check(defaults.worker_threads > 0 && defaults.retry_attempts == 3, "default workers and retries")) {
      return 1;
    }
    defaults.validate();
  }

  {
    const auto dir = ChunkDriveTest::TempDir("config_load");
    const auto path = dir / "drive.json";
    WriteFile(path,
              "{\n"
              "  \"max_part_size\": 2048,\n"
              "  \"data_dir\": \"" + dir.string() + "\",\n"
              "  \"retry_attempts\": 5,\n"
              "  \"retry_backoff_ms\": 10,\n"
              "  \"transport_timeout_ms\": 1500,\n"
              "  \"overwrite_policy\": \"reject\",\n"
              "  \"listen_port\": 9090\n"
              "}\n");

    DriveConfig cfg = DriveConfig::load(path);
    if (!Check(cfg.max_part_size == 2048 && cfg.retry_attempts == 5, "numeric keys loaded")) {
      return 1;
    }
    if (!Check(cfg.retry_backoff.count() == 10 && cfg.transport_timeout.count() == 1500, "durations loaded")) {
      return 1;
    }
    if (!Check(cfg.overwrite_policy == OverwritePolicy::Reject && cfg.listen_port == 9090, "policy and port")) {
      return 1;
    }
    if (!Check(cfg.chunks_dir_name == "chunks", "missing keys keep defaults")) {
      return 1;
    }

    const auto chunks = cfg.getChunksDirPath();
    if (!Check(std::filesystem::is_directory(chunks) && chunks.parent_path() == std::filesystem::absolute(dir),
               "chunks dir created under data_dir")) {
      return 1;
    }

    DriveConfig again = DriveConfig::fromJson(cfg.toJson());
    if (!Check(again.max_part_size == cfg.max_part_size && again.overwrite_policy == cfg.overwrite_policy,
               "toJson feeds fromJson")) {
      return 1;
    }
  }

  {
    if (!Check(Rejects("{\"max_part_size\": 0}"), "zero part size")) {
      return 1;
    }
    if (!Check(Rejects("{\"retry_attempts\": 0}"), "zero attempts")) {
      return 1;
    }
    if (!Check(Rejects("{\"overwrite_policy\": \"merge\"}"), "unknown policy")) {
      return 1;
    }
    if (!Check(Rejects("{\"max_part_size\": \"big\"}"), "wrong type")) {
      return 1;
    }
    if (!Check(Rejects("[1, 2]"), "non-object root")) {
      return 1;
    }
  }

  {
    bool threw = false;
    try {
      DriveConfig::load("/nonexistent/chunkdrive.json");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!Check(threw, "missing file")) {
      return 1;
    }
  }

  return 0;
}
