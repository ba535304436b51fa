// include/chunk_plan.hpp
#pragma once

#include <vector>

namespace PageStitch
{
    namespace Chunks
    {

        // A planned window of PDF pages converted by one extraction call.
        struct ChunkPlan
        {
            int index;       // 0-based chunk index
            int page_start;  // 1-indexed first page (inclusive)
            int page_end;    // 1-indexed last page (inclusive)
            bool is_first;
            bool is_last;

            int pageCount() const { return page_end - page_start + 1; }
        };

        // Split [1, total_pages] into disjoint windows of pages_per_chunk pages;
        // only the last window may be shorter.
        //
        //   planChunks(88, 20) -> 1-20, 21-40, 41-60, 61-80, 81-88
        //
        // Throws std::invalid_argument for non-positive arguments.
        std::vector<ChunkPlan> planChunks(int total_pages, int pages_per_chunk);

        // Throws std::invalid_argument if pages_per_chunk exceeds the extraction
        // service's per-request page limit.
        void validateWindow(int pages_per_chunk, int hard_limit);

    } // namespace Chunks
} // namespace PageStitch
