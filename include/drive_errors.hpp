// include/drive_errors.hpp
#pragma once

#include <string>
#include <stdexcept> // For std::runtime_error

namespace ChunkDrive
{

    // Base class for every error the transfer engine reports to its callers.
    class DriveError : public std::runtime_error
    {
    public:
        explicit DriveError(const std::string &message) : std::runtime_error(message) {}
    };

    // Upload source contained zero bytes.
    class EmptyInput : public DriveError
    {
    public:
        explicit EmptyInput(const std::string &name)
            : DriveError("Refusing to upload empty input: " + name) {}
    };

    // Store, fetch or discard failed inside the blob transport.
    // Retryable failures are retried by the engine with exponential backoff.
    class TransportError : public DriveError
    {
    public:
        TransportError(const std::string &message, bool retryable = true)
            : DriveError(message), retryable_(retryable) {}

        bool retryable() const { return retryable_; }

    private:
        bool retryable_;
    };

    // Fetched part does not match the hash or size recorded at upload time.
    class CorruptPart : public DriveError
    {
    public:
        CorruptPart(const std::string &name, size_t ordinal, const std::string &detail)
            : DriveError("Corrupt part " + std::to_string(ordinal) + " of '" + name + "': " + detail),
              ordinal_(ordinal) {}

        size_t ordinal() const { return ordinal_; }

    private:
        size_t ordinal_;
    };

    class FileNotFound : public DriveError
    {
    public:
        FileNotFound(const std::string &owner, const std::string &name)
            : DriveError("File '" + name + "' not found for owner '" + owner + "'") {}
    };

    // Raised only when the overwrite policy is "reject".
    class DuplicateName : public DriveError
    {
    public:
        DuplicateName(const std::string &owner, const std::string &name)
            : DriveError("File '" + name + "' already exists for owner '" + owner + "'") {}
    };

    // A part came out of the chunker larger than the configured bound. Internal bug.
    class PartSizeExceeded : public DriveError
    {
    public:
        PartSizeExceeded(size_t ordinal, size_t size, size_t limit)
            : DriveError("Part " + std::to_string(ordinal) + " has " + std::to_string(size) +
                         " bytes, limit is " + std::to_string(limit)) {}
    };

    class TransferCancelled : public DriveError
    {
    public:
        explicit TransferCancelled(const std::string &name)
            : DriveError("Transfer of '" + name + "' was cancelled") {}
    };

    class InvalidName : public DriveError
    {
    public:
        explicit InvalidName(const std::string &message) : DriveError(message) {}
    };

} // namespace ChunkDrive
