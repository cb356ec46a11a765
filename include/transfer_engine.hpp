// include/transfer_engine.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "blob_transport.hpp"
#include "chunk.hpp"
#include "chunk_config.hpp"
#include "file_metadata.hpp"
#include "inventory_store.hpp"
#include "source_resolver.hpp"
#include "thread_pool.hpp"

namespace ChunkDrive
{

    enum class TransferState
    {
        Pending,
        Splitting,
        Storing,
        Fetching,
        Verifying,
        Committed,
        Assembled,
        Aborted
    };

    std::string toString(TransferState state);

    // parts_total is 0 while the number of parts is not known yet.
    using ProgressCallback = std::function<void(TransferState state, size_t parts_done, size_t parts_total)>;

    class CancellationToken
    {
    public:
        void cancel() { cancelled_.store(true); }
        bool cancelled() const { return cancelled_.load(); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    struct TransferOptions
    {
        const CancellationToken *cancel = nullptr;
        ProgressCallback progress;
    };

    struct FileSummary
    {
        std::string name;
        uint64_t size = 0;
        size_t parts = 0;
        std::string created_at;
    };

    struct BatchResult
    {
        std::vector<std::string> succeeded;
        std::vector<std::string> failed;
    };

    class TransferEngine
    {
    public:
        TransferEngine(Config::DriveConfig config,
                       std::shared_ptr<Transport::BlobTransport> transport,
                       std::shared_ptr<Inventory::InventoryStore> inventory,
                       std::shared_ptr<Sources::SourceResolver> resolver = nullptr);

        // Split source into parts, store the parts that are not already known by hash,
        // then commit the file record. All or nothing: on any failure no record exists
        // afterwards and blobs stored for this upload are discarded or ledgered as orphans.
        Metadata::FileMetadata upload(const std::string &owner,
                                      const std::string &name,
                                      std::istream &source,
                                      const TransferOptions &options = {});

        // Resolve link through the source resolver and upload it. An empty name uses the
        // name suggested by the resolver.
        Metadata::FileMetadata uploadFromSource(const std::string &owner,
                                                const std::string &link,
                                                const std::string &name = "",
                                                const TransferOptions &options = {});

        // Fetch and verify every part, then join them in ordinal order.
        // Throws FileNotFound, CorruptPart or TransportError; never returns partial bytes.
        std::vector<char> download(const std::string &owner,
                                   const std::string &name,
                                   const TransferOptions &options = {});

        // Streams the parts into "<path>.partial" and renames it to path on success.
        void downloadToFile(const std::string &owner,
                            const std::string &name,
                            const std::filesystem::path &path,
                            const TransferOptions &options = {});

        // Several links in one call, each under its resolver-suggested name. Continues past failures.
        BatchResult uploadSources(const std::string &owner, const std::vector<std::string> &links);

        // Named files of owner into directory, continuing past failures.
        BatchResult downloadFiles(const std::string &owner,
                                  const std::vector<std::string> &names,
                                  const std::filesystem::path &directory);
        BatchResult downloadAll(const std::string &owner, const std::filesystem::path &directory);

        // Returns the number of files removed. Throws FileNotFound.
        size_t remove(const std::string &owner, const std::string &name);
        BatchResult removeFiles(const std::string &owner, const std::vector<std::string> &names);
        size_t removeAll(const std::string &owner);

        std::vector<FileSummary> list(const std::string &owner) const;

        // Retry discarding ledgered orphan blobs. Returns how many were reclaimed.
        size_t sweep();

        // Name of the local file a download of name is written to.
        static std::string localFileName(const std::string &name);

        const Config::DriveConfig &config() const { return config_; }
        Inventory::InventoryStore &inventory() { return *inventory_; }

    private:
        template <class Op>
        auto withRetry(const std::string &func, const std::string &owner, const std::string &what, Op op)
            -> decltype(op());

        std::string storePart(const std::vector<char> &data, const std::string &owner,
                              const std::string &name, size_t ordinal);
        std::vector<char> fetchVerified(const std::string &owner, const Metadata::FileMetadata &file,
                                        const Metadata::PartRecord &part);

        // Discard blobs nobody references anymore; failures go to the orphan ledger.
        void releaseBlobs(const std::vector<std::string> &handles, const std::string &owner);

        Config::DriveConfig config_;
        std::shared_ptr<Transport::BlobTransport> transport_;
        std::shared_ptr<Inventory::InventoryStore> inventory_;
        std::shared_ptr<Sources::SourceResolver> resolver_;
        Concurrency::ThreadPool thread_pool_; // declared last so workers stop before the rest is destroyed
    };

} // namespace ChunkDrive
