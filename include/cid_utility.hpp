// include/cid_utility.hpp
#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace ChunkDrive
{
    namespace CID
    {

        class CIDUtility
        {
        public:
            static const size_t DIGEST_HEX_LENGTH = 64;

            // Generates SHA-256 hash of data and returns as lowercase hex string.
            // This string serves as the Content Identifier (CID) of a part and as its dedup key.
            static std::string generateSHA256(const std::vector<char> &data_buffer);
            static std::string generateSHA256(const char *data, size_t size);

            // Recomputes the digest of data and compares it with expected_cid.
            static bool verify(const std::vector<char> &data_buffer, const std::string &expected_cid);

            // True for a 64 character lowercase hex string.
            static bool isValidCID(const std::string &cid);

            // Hex-encodes size random bytes from the OpenSSL CSPRNG.
            static std::string randomHex(size_t size);
        };

    } // namespace CID
} // namespace ChunkDrive
