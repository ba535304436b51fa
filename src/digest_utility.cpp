// src/digest_utility.cpp
#include "digest_utility.hpp"
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// Ensure OpenSSL::Crypto is linked in CMakeLists.txt
#include <openssl/sha.h>

namespace PageStitch
{
    namespace Digest
    {

        std::string DigestUtility::generateSHA256(const std::string &text)
        {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256_CTX sha256;

            if (!SHA256_Init(&sha256))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
            // An empty update is valid: SHA256("") is well defined.
            if (!text.empty() && !SHA256_Update(&sha256, text.data(), text.size()))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            if (!SHA256_Final(hash, &sha256))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }

            std::stringstream ss;
            for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return ss.str();
        }

    } // namespace Digest
} // namespace PageStitch
