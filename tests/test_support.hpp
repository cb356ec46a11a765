// tests/test_support.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "blob_transport.hpp"
#include "cid_utility.hpp"
#include "drive_errors.hpp"

namespace ChunkDriveTest {

inline bool Check(bool cond, const std::string& what) {
  if (!cond) {
    std::cerr << "FAILED: " << what << std::endl;
  }
  return cond;
}

inline std::filesystem::path TempDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("chunkdrive_" + name);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

inline std::vector<char> RandomBytes(size_t size, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> byte_dist(0, 255);
  std::vector<char> data(size);
  for (auto& b : data) {
    b = static_cast<char>(byte_dist(rng));
  }
  return data;
}

inline std::vector<char> Bytes(const std::string& s) {
  return std::vector<char>(s.begin(), s.end());
}

// In-memory transport with knobs for injecting the failures a chat platform produces.
class MemoryBlobTransport : public ChunkDrive::Transport::BlobTransport {
 public:
  explicit MemoryBlobTransport(size_t max_blob_size) : max_blob_size_(max_blob_size) {}

  std::string store(const std::vector<char>& data, std::chrono::milliseconds) override {
    if (store_delay_.count() > 0) {
      std::this_thread::sleep_for(store_delay_);
    }
    std::lock_guard<std::mutex> lock(mtx_);
    store_calls_++;
    if (data.size() > max_blob_size_) {
      throw ChunkDrive::TransportError("blob too large", false);
    }
    if (fail_store_at_ != 0 && store_calls_ == fail_store_at_) {
      throw ChunkDrive::TransportError("injected store failure", false);
    }
    if (transient_store_failures_ > 0) {
      transient_store_failures_--;
      throw ChunkDrive::TransportError("injected transient store failure", true);
    }
    std::string handle = "blob-" + std::to_string(next_id_++);
    blobs_[handle] = data;
    return handle;
  }

  std::vector<char> fetch(const std::string& handle, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mtx_);
    fetch_calls_++;
    if (transient_fetch_failures_ > 0) {
      transient_fetch_failures_--;
      throw ChunkDrive::TransportError("injected transient fetch failure", true);
    }
    auto it = blobs_.find(handle);
    if (it == blobs_.end()) {
      throw ChunkDrive::TransportError("no such blob " + handle, false);
    }
    return it->second;
  }

  void discard(const std::string& handle, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mtx_);
    discard_calls_++;
    if (fail_discards_) {
      throw ChunkDrive::TransportError("injected discard failure", false);
    }
    blobs_.erase(handle);
    discarded_.insert(handle);
  }

  size_t maxBlobSize() const override { return max_blob_size_; }

  // Store call number n (1-based) fails permanently.
  void FailStoreAt(size_t n) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_store_at_ = n;
  }
  void TransientStoreFailures(int n) {
    std::lock_guard<std::mutex> lock(mtx_);
    transient_store_failures_ = n;
  }
  void TransientFetchFailures(int n) {
    std::lock_guard<std::mutex> lock(mtx_);
    transient_fetch_failures_ = n;
  }
  void FailDiscards(bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_discards_ = fail;
  }
  void StoreDelay(std::chrono::milliseconds delay) { store_delay_ = delay; }

  // Flip one byte of a stored blob.
  bool Corrupt(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = blobs_.find(handle);
    if (it == blobs_.end() || it->second.empty()) {
      return false;
    }
    it->second[0] = static_cast<char>(it->second[0] ^ 0x5A);
    return true;
  }

  bool Has(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return blobs_.count(handle) != 0;
  }
  bool WasDiscarded(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return discarded_.count(handle) != 0;
  }
  size_t BlobCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return blobs_.size();
  }
  size_t StoreCalls() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return store_calls_;
  }
  size_t FetchCalls() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return fetch_calls_;
  }

 private:
  size_t max_blob_size_;
  mutable std::mutex mtx_;
  std::map<std::string, std::vector<char>> blobs_;
  std::set<std::string> discarded_;
  size_t next_id_ = 1;
  size_t store_calls_ = 0;
  size_t fetch_calls_ = 0;
  size_t discard_calls_ = 0;
  size_t fail_store_at_ = 0;
  int transient_store_failures_ = 0;
  int transient_fetch_failures_ = 0;
  bool fail_discards_ = false;
  std::chrono::milliseconds store_delay_{0};
};

}  // namespace ChunkDriveTest
