// include/context_extractor.hpp
#pragma once

#include <string>

#include "staging_config.hpp"

namespace PageStitch
{
    namespace Chunks
    {

        // Return the trailing whole pages of a chunk's markdown, passed to the next
        // chunk for continuity.
        //
        // Starts with the last min_pages pages (all of them if fewer exist) and adds
        // one more page at a time while the excerpt has fewer than min_lines
        // newlines. The excerpt always begins at a PAGE_BEGIN sentinel. Without any
        // page sentinels the last min_lines lines are returned instead.
        std::string extractContextTail(const std::string &markdown,
                                       int min_pages = Config::StagingConfig::CONTEXT_MIN_PAGES,
                                       int min_lines = Config::StagingConfig::CONTEXT_MIN_LINES);

    } // namespace Chunks
} // namespace PageStitch
