// src/transfer_engine.cpp
#include "transfer_engine.hpp"
#include "cid_utility.hpp"
#include "drive_errors.hpp"
#include "drive_log.hpp"
#include <deque>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace ChunkDrive
{

    namespace
    {
        void report(const TransferOptions &options, TransferState state, size_t done, size_t total)
        {
            if (options.progress)
            {
                options.progress(state, done, total);
            }
        }

        void checkCancelled(const TransferOptions &options, const std::string &name)
        {
            if (options.cancel && options.cancel->cancelled())
            {
                throw TransferCancelled(name);
            }
        }

        // Bytes left in a seekable stream, or nullopt if it cannot seek.
        std::optional<uint64_t> remainingBytes(std::istream &source)
        {
            std::streampos start = source.tellg();
            if (start == std::streampos(-1))
            {
                return std::nullopt;
            }
            source.seekg(0, std::ios::end);
            std::streampos end = source.tellg();
            source.seekg(start);
            if (end == std::streampos(-1) || !source)
            {
                source.clear();
                source.seekg(start);
                return std::nullopt;
            }
            return static_cast<uint64_t>(end - start);
        }

        struct InFlightStore
        {
            std::string hash;
            std::future<std::string> handle;
        };
    } // namespace

    std::string toString(TransferState state)
    {
        switch (state)
        {
        case TransferState::Pending:
            return "pending";
        case TransferState::Splitting:
            return "splitting";
        case TransferState::Storing:
            return "storing";
        case TransferState::Fetching:
            return "fetching";
        case TransferState::Verifying:
            return "verifying";
        case TransferState::Committed:
            return "committed";
        case TransferState::Assembled:
            return "assembled";
        case TransferState::Aborted:
            return "aborted";
        }
        return "unknown";
    }

    TransferEngine::TransferEngine(Config::DriveConfig config,
                                   std::shared_ptr<Transport::BlobTransport> transport,
                                   std::shared_ptr<Inventory::InventoryStore> inventory,
                                   std::shared_ptr<Sources::SourceResolver> resolver)
        : config_(std::move(config)),
          transport_(std::move(transport)),
          inventory_(std::move(inventory)),
          resolver_(std::move(resolver)),
          thread_pool_(config_.worker_threads)
    {
        config_.validate();
        if (!transport_ || !inventory_)
        {
            throw std::invalid_argument("TransferEngine requires a blob transport and an inventory store.");
        }
        if (config_.max_part_size > transport_->maxBlobSize())
        {
            throw std::invalid_argument("max_part_size " + std::to_string(config_.max_part_size) +
                                        " exceeds the transport blob limit of " +
                                        std::to_string(transport_->maxBlobSize()));
        }
        Logging::info("ENGINE", "", "TransferEngine initialized (part size " +
                                        std::to_string(config_.max_part_size) + " bytes, policy " +
                                        Config::toString(config_.overwrite_policy) + ").");
    }

    template <class Op>
    auto TransferEngine::withRetry(const std::string &func, const std::string &owner, const std::string &what, Op op)
        -> decltype(op())
    {
        std::chrono::milliseconds delay = config_.retry_backoff;
        for (size_t attempt = 1;; ++attempt)
        {
            try
            {
                return op();
            }
            catch (const TransportError &e)
            {
                if (!e.retryable() || attempt >= config_.retry_attempts)
                {
                    Logging::error(func, owner, what + " failed after " + std::to_string(attempt) +
                                                    " attempt(s): " + e.what());
                    throw;
                }
                Logging::warn(func, owner, what + " failed (attempt " + std::to_string(attempt) + "/" +
                                               std::to_string(config_.retry_attempts) + "), retrying in " +
                                               std::to_string(delay.count()) + " ms: " + e.what());
            }
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

    std::string TransferEngine::storePart(const std::vector<char> &data, const std::string &owner,
                                          const std::string &name, size_t ordinal)
    {
        std::string what = "Store of part " + std::to_string(ordinal) + " of `" + name + "`";
        return withRetry("UPLOAD", owner, what, [&]()
                         { return transport_->store(data, config_.transport_timeout); });
    }

    std::vector<char> TransferEngine::fetchVerified(const std::string &owner, const Metadata::FileMetadata &file,
                                                    const Metadata::PartRecord &part)
    {
        std::string what = "Fetch of part " + std::to_string(part.ordinal) + " of `" + file.name + "`";
        std::vector<char> data = withRetry("DOWNLOAD", owner, what, [&]()
                                           { return transport_->fetch(part.handle, config_.transport_timeout); });

        // Integrity failures are not retried
        if (data.size() != part.size)
        {
            throw CorruptPart(file.name, part.ordinal, "expected " + std::to_string(part.size) + " bytes, got " +
                                                           std::to_string(data.size()));
        }
        if (!CID::CIDUtility::verify(data, part.hash))
        {
            throw CorruptPart(file.name, part.ordinal, "hash mismatch");
        }
        return data;
    }

    void TransferEngine::releaseBlobs(const std::vector<std::string> &handles, const std::string &owner)
    {
        std::vector<std::string> failed;
        for (const auto &handle : handles)
        {
            try
            {
                withRetry("RELEASE", owner, "Discard of blob " + handle, [&]()
                          { transport_->discard(handle, config_.transport_timeout); });
                Logging::info("RELEASE", owner, "Discarded unreferenced blob " + handle);
            }
            catch (const TransportError &)
            {
                failed.push_back(handle);
            }
            catch (const std::exception &e)
            {
                Logging::error("RELEASE", owner, "Discard of blob " + handle + " failed: " + e.what());
                failed.push_back(handle);
            }
        }

        if (failed.empty())
        {
            return;
        }
        try
        {
            inventory_->recordOrphans(failed);
            Logging::warn("RELEASE", owner, std::to_string(failed.size()) + " blob(s) left for the orphan sweep.");
        }
        catch (const std::runtime_error &e)
        {
            Logging::error("RELEASE", owner, "Failed to record " + std::to_string(failed.size()) +
                                                 " orphan blob(s): " + e.what());
        }
    }

    Metadata::FileMetadata TransferEngine::upload(const std::string &owner,
                                                  const std::string &name,
                                                  std::istream &source,
                                                  const TransferOptions &options)
    {
        Inventory::InventoryStore::validateKey(owner, name);
        report(options, TransferState::Pending, 0, 0);

        if (config_.overwrite_policy == Config::OverwritePolicy::Reject && inventory_->contains(owner, name))
        {
            Logging::error("UPLOAD", owner, "File `" + name + "` already exists.");
            throw DuplicateName(owner, name);
        }

        size_t total_parts = 0;
        if (auto size = remainingBytes(source))
        {
            total_parts = static_cast<size_t>((*size + config_.max_part_size - 1) / config_.max_part_size);
        }
        Logging::info("UPLOAD", owner, "Starting upload: `" + name + "` (" +
                                           (total_parts ? std::to_string(total_parts) : std::string("?")) +
                                           " part(s)).");

        std::vector<Metadata::PartRecord> parts;
        std::vector<std::string> pinned;              // distinct hashes this upload holds a pin on
        std::map<std::string, std::string> resolved;  // hash -> handle recorded in the file
        std::set<std::string> in_flight_hashes;       // hashes with a store queued but not drained
        std::deque<InFlightStore> in_flight;
        size_t parts_done = 0;
        Metadata::FileMetadata file;
        Inventory::CommitResult commit;

        // Wait for the oldest queued store and register the blob in the dedup table.
        auto drainOne = [&]()
        {
            InFlightStore store = std::move(in_flight.front());
            in_flight.pop_front();
            in_flight_hashes.erase(store.hash);

            std::string handle = store.handle.get();
            std::string canonical = inventory_->pinStored(store.hash, handle);
            pinned.push_back(store.hash);
            resolved[store.hash] = canonical;
            if (canonical != handle)
            {
                // A concurrent upload registered the same content first
                releaseBlobs({handle}, owner);
            }
        };

        try
        {
            report(options, TransferState::Splitting, 0, total_parts);
            Chunks::ChunkReader reader(source, config_.max_part_size);
            Chunks::Chunk chunk;

            while (reader.next(chunk))
            {
                checkCancelled(options, name);

                Metadata::PartRecord part;
                part.ordinal = chunk.ordinal;
                part.size = chunk.size();
                part.hash = chunk.cid;
                parts.push_back(part);

                if (resolved.count(chunk.cid) || in_flight_hashes.count(chunk.cid))
                {
                    // Repeated content within this file
                    report(options, TransferState::Storing, ++parts_done, total_parts);
                    continue;
                }

                if (auto handle = inventory_->pinExisting(chunk.cid))
                {
                    pinned.push_back(chunk.cid);
                    resolved[chunk.cid] = *handle;
                    Logging::info("UPLOAD", owner, "Part " + std::to_string(chunk.ordinal + 1) + " of `" + name +
                                                       "` already stored, reusing " + *handle);
                    report(options, TransferState::Storing, ++parts_done, total_parts);
                    continue;
                }

                size_t ordinal = chunk.ordinal;
                auto data = std::make_shared<std::vector<char>>(std::move(chunk.data));
                InFlightStore store;
                store.hash = chunk.cid;
                store.handle = thread_pool_.enqueue([this, data, owner, name, ordinal]()
                                                    { return storePart(*data, owner, name, ordinal); });
                in_flight_hashes.insert(chunk.cid);
                in_flight.push_back(std::move(store));

                while (in_flight.size() >= config_.max_parallel_parts)
                {
                    drainOne();
                    report(options, TransferState::Storing, ++parts_done, total_parts);
                }
            }

            if (parts.empty())
            {
                Logging::error("UPLOAD", owner, "Source for `" + name + "` is empty.");
                throw EmptyInput(name);
            }

            while (!in_flight.empty())
            {
                drainOne();
                report(options, TransferState::Storing, ++parts_done, parts.size());
            }

            checkCancelled(options, name);

            for (auto &part : parts)
            {
                part.handle = resolved.at(part.hash);
            }
            file = Metadata::FileMetadata(owner, name, parts);
            commit = inventory_->commit(file, config_.overwrite_policy);
        }
        catch (const std::exception &e)
        {
            // Blobs whose store finished but were never registered belong to nobody
            std::vector<std::string> abandoned;
            for (auto &store : in_flight)
            {
                try
                {
                    abandoned.push_back(store.handle.get());
                }
                catch (const std::exception &store_error)
                {
                    Logging::warn("UPLOAD", owner, "Queued store for `" + name + "` also failed: " + store_error.what());
                }
            }
            in_flight.clear();

            std::vector<std::string> released = inventory_->unpin(pinned);
            abandoned.insert(abandoned.end(), released.begin(), released.end());
            releaseBlobs(abandoned, owner);

            report(options, TransferState::Aborted, parts_done, parts.size());
            Logging::error("UPLOAD", owner, "Upload of `" + name + "` aborted: " + e.what());
            throw;
        }

        // The file is committed and its pins are now references. Nothing below may fail the upload.
        try
        {
            report(options, TransferState::Committed, parts.size(), parts.size());
        }
        catch (const std::exception &e)
        {
            Logging::warn("UPLOAD", owner, "Progress callback failed after `" + name + "` was committed: " + e.what());
        }

        if (commit.replaced)
        {
            Logging::info("UPLOAD", owner, "Replaced previous version of `" + name + "` (" +
                                               std::to_string(commit.released_handles.size()) +
                                               " part(s) no longer referenced).");
            releaseBlobs(commit.released_handles, owner);
        }
        Logging::info("UPLOAD", owner, "File `" + name + "` saved to drive with " +
                                           std::to_string(parts.size()) + " part(s).");
        return file;
    }

    Metadata::FileMetadata TransferEngine::uploadFromSource(const std::string &owner,
                                                            const std::string &link,
                                                            const std::string &name,
                                                            const TransferOptions &options)
    {
        if (!resolver_)
        {
            throw std::logic_error("No source resolver configured.");
        }

        Sources::ResolvedSource source = resolver_->resolve(link);
        std::string target = name.empty() ? source.suggested_name : name;
        Logging::info("UPLOAD", owner, "Resolved `" + link + "` as `" + target + "`");
        return upload(owner, target, *source.stream, options);
    }

    std::vector<char> TransferEngine::download(const std::string &owner,
                                               const std::string &name,
                                               const TransferOptions &options)
    {
        Inventory::InventoryStore::validateKey(owner, name);
        report(options, TransferState::Pending, 0, 0);

        Metadata::FileMetadata file;
        try
        {
            file = inventory_->get(owner, name);
        }
        catch (const FileNotFound &)
        {
            Logging::error("DOWNLOAD", owner, "File `" + name + "` not found.");
            report(options, TransferState::Aborted, 0, 0);
            throw;
        }

        const size_t total = file.parts.size();
        Logging::info("DOWNLOAD", owner, "Starting download for `" + name + "` (" + std::to_string(total) + " parts)");
        report(options, TransferState::Fetching, 0, total);

        std::vector<std::vector<char>> blobs(total);
        std::deque<std::pair<size_t, std::future<std::vector<char>>>> in_flight;
        size_t done = 0;

        try
        {
            for (size_t i = 0; i < total; ++i)
            {
                checkCancelled(options, name);
                in_flight.emplace_back(i, thread_pool_.enqueue([this, &file, &owner, i]()
                                                               { return fetchVerified(owner, file, file.parts[i]); }));

                while (in_flight.size() >= config_.max_parallel_parts || (i + 1 == total && !in_flight.empty()))
                {
                    auto front = std::move(in_flight.front());
                    in_flight.pop_front();
                    blobs[front.first] = front.second.get();
                    report(options, TransferState::Fetching, ++done, total);
                }
            }
        }
        catch (const std::exception &e)
        {
            // Workers still reference file; let them finish before it goes out of scope
            for (auto &pending : in_flight)
            {
                if (pending.second.valid())
                {
                    pending.second.wait();
                }
            }
            report(options, TransferState::Aborted, done, total);
            Logging::error("DOWNLOAD", owner, "Download of `" + name + "` aborted: " + e.what());
            throw;
        }

        report(options, TransferState::Verifying, total, total);
        std::vector<char> joined = Chunks::joinChunks(blobs);
        if (joined.size() != file.total_size)
        {
            report(options, TransferState::Aborted, total, total);
            throw CorruptPart(name, total == 0 ? 0 : total - 1, "reassembled size does not match the file record");
        }

        report(options, TransferState::Assembled, total, total);
        Logging::info("DOWNLOAD", owner, "Downloaded file `" + name + "` successfully.");
        return joined;
    }

    void TransferEngine::downloadToFile(const std::string &owner,
                                        const std::string &name,
                                        const fs::path &path,
                                        const TransferOptions &options)
    {
        Inventory::InventoryStore::validateKey(owner, name);
        Metadata::FileMetadata file = inventory_->get(owner, name);

        const size_t total = file.parts.size();
        fs::path partial_path = path;
        partial_path += ".partial";
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path());
        }

        Logging::info("DOWNLOAD", owner, "Starting download for `" + name + "` (" + std::to_string(total) +
                                             " parts) to " + path.string());
        report(options, TransferState::Fetching, 0, total);

        try
        {
            std::ofstream ofs(partial_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw std::runtime_error("Failed to open output file for writing: " + partial_path.string());
            }

            for (size_t i = 0; i < total; ++i)
            {
                checkCancelled(options, name);
                std::vector<char> data = fetchVerified(owner, file, file.parts[i]);
                ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
                if (!ofs.good())
                {
                    throw std::runtime_error("Failed to write chunk data to output file during retrieval.");
                }
                report(options, TransferState::Fetching, i + 1, total);
            }
            ofs.close();
            if (!ofs)
            {
                throw std::runtime_error("Failed to finish output file: " + partial_path.string());
            }

            fs::rename(partial_path, path);
        }
        catch (const std::exception &e)
        {
            // Clean up partially written file
            std::error_code ec;
            fs::remove(partial_path, ec);
            report(options, TransferState::Aborted, 0, total);
            Logging::error("DOWNLOAD", owner, "Failed to download `" + name + "`: " + e.what());
            throw;
        }

        report(options, TransferState::Assembled, total, total);
        Logging::info("DOWNLOAD", owner, "File `" + name + "` saved to " + path.string());
    }

    std::string TransferEngine::localFileName(const std::string &name)
    {
        std::string local = name;
        for (char &c : local)
        {
            if (c == '/' || c == '\\' || c == '\0')
            {
                c = '_';
            }
        }
        if (local == "." || local == "..")
        {
            local = "_" + local;
        }
        return local;
    }

    BatchResult TransferEngine::uploadSources(const std::string &owner, const std::vector<std::string> &links)
    {
        BatchResult result;
        for (const auto &link : links)
        {
            try
            {
                uploadFromSource(owner, link);
                result.succeeded.push_back(link);
            }
            catch (const std::exception &e)
            {
                Logging::error("UPLOAD", owner, "Skipping `" + link + "`: " + e.what());
                result.failed.push_back(link);
            }
        }

        Logging::info("UPLOAD", owner, "Uploaded " + std::to_string(result.succeeded.size()) + " file(s), " +
                                           std::to_string(result.failed.size()) + " failed.");
        return result;
    }

    BatchResult TransferEngine::downloadFiles(const std::string &owner,
                                              const std::vector<std::string> &names,
                                              const fs::path &directory)
    {
        BatchResult result;
        for (const auto &name : names)
        {
            try
            {
                downloadToFile(owner, name, directory / localFileName(name));
                result.succeeded.push_back(name);
            }
            catch (const FileNotFound &)
            {
                Logging::error("DOWNLOAD", owner, "File `" + name + "` not found.");
                result.failed.push_back(name);
            }
            catch (const std::exception &)
            {
                // downloadToFile already logged the cause
                result.failed.push_back(name);
            }
        }

        Logging::info("DOWNLOAD", owner, "Downloaded " + std::to_string(result.succeeded.size()) + " file(s), " +
                                             std::to_string(result.failed.size()) + " failed.");
        return result;
    }

    BatchResult TransferEngine::downloadAll(const std::string &owner, const fs::path &directory)
    {
        std::vector<std::string> names;
        for (const auto &file : inventory_->list(owner))
        {
            names.push_back(file.name);
        }
        if (names.empty())
        {
            Logging::info("DOWNLOAD", owner, "Drive is empty, nothing to download.");
            return {};
        }
        return downloadFiles(owner, names, directory);
    }

    size_t TransferEngine::remove(const std::string &owner, const std::string &name)
    {
        Inventory::InventoryStore::validateKey(owner, name);

        Inventory::RemoveResult removed = inventory_->remove(owner, name);
        Logging::info("REMOVE", owner, "Removed `" + name + "` (" + std::to_string(removed.removed.parts.size()) +
                                           " part(s), " + std::to_string(removed.released_handles.size()) +
                                           " unreferenced).");
        releaseBlobs(removed.released_handles, owner);
        return 1;
    }

    BatchResult TransferEngine::removeFiles(const std::string &owner, const std::vector<std::string> &names)
    {
        BatchResult result;
        for (const auto &name : names)
        {
            try
            {
                remove(owner, name);
                result.succeeded.push_back(name);
            }
            catch (const std::exception &e)
            {
                Logging::error("REMOVE", owner, "Could not remove `" + name + "`: " + e.what());
                result.failed.push_back(name);
            }
        }
        return result;
    }

    size_t TransferEngine::removeAll(const std::string &owner)
    {
        std::vector<Inventory::RemoveResult> removed = inventory_->removeAll(owner);
        if (removed.empty())
        {
            Logging::info("REMOVE", owner, "Drive is already empty.");
            return 0;
        }

        for (const auto &result : removed)
        {
            releaseBlobs(result.released_handles, owner);
        }
        Logging::info("REMOVE", owner, "Removed all " + std::to_string(removed.size()) + " file(s).");
        return removed.size();
    }

    std::vector<FileSummary> TransferEngine::list(const std::string &owner) const
    {
        std::vector<FileSummary> summaries;
        for (const auto &file : inventory_->list(owner))
        {
            FileSummary summary;
            summary.name = file.name;
            summary.size = file.total_size;
            summary.parts = file.parts.size();
            summary.created_at = file.created_at;
            summaries.push_back(summary);
        }
        return summaries;
    }

    size_t TransferEngine::sweep()
    {
        std::vector<std::string> orphans = inventory_->orphans();
        std::vector<std::string> settled;
        size_t reclaimed = 0;

        for (const auto &handle : orphans)
        {
            if (inventory_->isHandleReferenced(handle))
            {
                Logging::warn("SWEEP", "", "Orphan " + handle + " is referenced again, keeping blob.");
                settled.push_back(handle);
                continue;
            }
            try
            {
                withRetry("SWEEP", "", "Discard of orphan " + handle, [&]()
                          { transport_->discard(handle, config_.transport_timeout); });
                settled.push_back(handle);
                reclaimed++;
            }
            catch (const TransportError &)
            {
                // Stays in the ledger for the next sweep
            }
        }

        inventory_->clearOrphans(settled);
        Logging::info("SWEEP", "", "Reclaimed " + std::to_string(reclaimed) + " of " +
                                       std::to_string(orphans.size()) + " orphan blob(s).");
        return reclaimed;
    }

} // namespace ChunkDrive
