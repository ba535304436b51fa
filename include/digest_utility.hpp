// include/digest_utility.hpp
#pragma once

#include <string>

namespace PageStitch
{
    namespace Digest
    {

        class DigestUtility
        {
        public:
            // Generates SHA-256 hash of text and returns as lowercase hex string.
            // Stored next to staged payloads so a tampered or truncated payload
            // is detected on load.
            static std::string generateSHA256(const std::string &text);
        };

    } // namespace Digest
} // namespace PageStitch
