// include/staging_records.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp> // For JSON handling

namespace PageStitch
{
    namespace Records
    {

        // Conversion parameters recorded for staleness detection.
        // Any differing field invalidates every cached chunk of a staging area.
        struct Manifest
        {
            int version = 0;
            double source_mtime = 0.0;      // seconds since epoch
            std::uint64_t source_size = 0;  // bytes
            int total_pages = 0;
            int pages_per_chunk = 0;
            std::optional<int> max_pages;   // page cap, empty = all pages
            std::string model_id;
            int num_chunks = 0;

            bool operator==(const Manifest &other) const;
            bool operator!=(const Manifest &other) const { return !(*this == other); }
        };

        // Per-chunk token usage, cost and timing (chunk_NN_meta.json).
        // Written last when a chunk is staged; its presence marks the chunk complete.
        struct ChunkUsage
        {
            int index = 0;       // 0-based chunk index
            int page_start = 0;  // 1-indexed first page
            int page_end = 0;    // 1-indexed last page (inclusive)
            std::int64_t input_tokens = 0;
            std::int64_t output_tokens = 0;
            std::int64_t cache_creation_tokens = 0;
            std::int64_t cache_read_tokens = 0;
            double cost = 0.0;   // USD, as reported by the extraction service
            double elapsed_seconds = 0.0;
            std::string payload_sha256; // empty for records staged without a digest
        };

        // Aggregate usage for one document (chunks/stats.json).
        struct DocumentStats
        {
            std::string doc_name;
            int pages = 0;
            int chunks = 1;
            std::int64_t input_tokens = 0;
            std::int64_t output_tokens = 0;
            std::int64_t cache_creation_tokens = 0;
            std::int64_t cache_read_tokens = 0;
            double cost = 0.0;
            double elapsed_seconds = 0.0;

            // Input tokens including cache writes and reads
            std::int64_t totalInputTokens() const
            {
                return input_tokens + cache_creation_tokens + cache_read_tokens;
            }
        };

        void to_json(nlohmann::json &j, const Manifest &m);
        void from_json(const nlohmann::json &j, Manifest &m);

        void to_json(nlohmann::json &j, const ChunkUsage &u);
        void from_json(const nlohmann::json &j, ChunkUsage &u);

        void to_json(nlohmann::json &j, const DocumentStats &s);
        void from_json(const nlohmann::json &j, DocumentStats &s);

        // Format a duration as "45s", "2m 15s" or "1h 03m 12s".
        std::string formatDuration(double seconds);

    } // namespace Records
} // namespace PageStitch
