// src/cid_utility.cpp
#include "cid_utility.hpp"
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <memory>
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// Linked through OpenSSL::Crypto in CMakeLists.txt
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace ChunkDrive
{
    namespace CID
    {

        namespace
        {
            // Helper for managing EVP_MD_CTX lifetime
            using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

            std::string toHex(const unsigned char *bytes, size_t size)
            {
                std::stringstream ss;
                for (size_t i = 0; i < size; i++)
                {
                    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
                }
                return ss.str();
            }
        } // namespace

        const size_t CIDUtility::DIGEST_HEX_LENGTH;

        std::string CIDUtility::generateSHA256(const char *data, size_t size)
        {
            EVP_MD_CTX_ptr mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if (!mdctx)
            {
                throw std::runtime_error("Failed to allocate SHA256 context.");
            }
            if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1)
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
            // An empty buffer still finalizes to the well-known SHA256("") digest.
            if (size > 0 && EVP_DigestUpdate(mdctx.get(), data, size) != 1)
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }

            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;
            if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1)
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            return toHex(hash, hash_len);
        }

        std::string CIDUtility::generateSHA256(const std::vector<char> &data_buffer)
        {
            return generateSHA256(data_buffer.data(), data_buffer.size());
        }

        bool CIDUtility::verify(const std::vector<char> &data_buffer, const std::string &expected_cid)
        {
            return generateSHA256(data_buffer) == expected_cid;
        }

        bool CIDUtility::isValidCID(const std::string &cid)
        {
            if (cid.size() != DIGEST_HEX_LENGTH)
            {
                return false;
            }
            for (char c : cid)
            {
                bool hex_digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
                if (!hex_digit)
                {
                    return false;
                }
            }
            return true;
        }

        std::string CIDUtility::randomHex(size_t size)
        {
            std::vector<unsigned char> bytes(size);
            if (size > 0 && RAND_bytes(bytes.data(), static_cast<int>(size)) != 1)
            {
                throw std::runtime_error("Failed to generate random bytes.");
            }
            return toHex(bytes.data(), bytes.size());
        }

    } // namespace CID
} // namespace ChunkDrive
