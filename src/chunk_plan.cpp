// src/chunk_plan.cpp
#include "chunk_plan.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace PageStitch
{
    namespace Chunks
    {

        std::vector<ChunkPlan> planChunks(int total_pages, int pages_per_chunk)
        {
            if (total_pages <= 0)
            {
                throw std::invalid_argument("total_pages must be positive, got " + std::to_string(total_pages));
            }
            if (pages_per_chunk <= 0)
            {
                throw std::invalid_argument("pages_per_chunk must be positive, got " + std::to_string(pages_per_chunk));
            }

            if (total_pages <= pages_per_chunk)
            {
                return {ChunkPlan{0, 1, total_pages, true, true}};
            }

            std::vector<ChunkPlan> chunks;
            chunks.reserve(static_cast<size_t>((total_pages + pages_per_chunk - 1) / pages_per_chunk));
            int index = 0;
            for (int page_start = 1; page_start <= total_pages; page_start += pages_per_chunk)
            {
                int page_end = std::min(page_start + pages_per_chunk - 1, total_pages);
                chunks.push_back(ChunkPlan{index, page_start, page_end, index == 0, page_end == total_pages});
                ++index;
            }
            return chunks;
        }

        void validateWindow(int pages_per_chunk, int hard_limit)
        {
            if (pages_per_chunk > hard_limit)
            {
                throw std::invalid_argument("pages_per_chunk (" + std::to_string(pages_per_chunk) +
                                            ") exceeds API limit of " + std::to_string(hard_limit) +
                                            " pages per request");
            }
        }

    } // namespace Chunks
} // namespace PageStitch
