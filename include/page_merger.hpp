// include/page_merger.hpp
#pragma once

#include <map>
#include <string>
#include <vector>

namespace PageStitch
{
    namespace Merge
    {

        // Page number -> full page block (PAGE_BEGIN through the next PAGE_END,
        // sentinels included). If a page occurs twice, the first block wins.
        std::map<int, std::string> extractPages(const std::string &markdown);

        // Merge chunk outputs into one document ordered by page number.
        //
        // Pages are collected chunk by chunk; a page number already seen is never
        // overwritten (first writer wins). Blocks are emitted by ascending page
        // number, not chunk order, separated by a blank line. Without any page
        // sentinels the trimmed chunk texts are joined in order instead.
        // A single chunk is returned unchanged; no chunks give "".
        std::string mergeChunks(const std::vector<std::string> &parts);

    } // namespace Merge
} // namespace PageStitch
