// src/page_merger.cpp
#include "page_merger.hpp"
#include "markers.hpp"

#include <re2/re2.h>

#include <iostream>

namespace PageStitch
{
    namespace Merge
    {

        namespace
        {

            const char *const PAGE_SEPARATOR = "\n\n";

            // PAGE_BEGIN N ... first following PAGE_END (non-greedy, across lines)
            const RE2 &pageBlockRe()
            {
                static const RE2 re(
                    "(?s)<!--\\s*PDF_PAGE_BEGIN\\s+(\\d{1,9})\\s*-->"
                    ".*?"
                    "<!--\\s*PDF_PAGE_END\\s+\\d{1,9}\\s*-->");
                return re;
            }

        } // namespace

        std::map<int, std::string> extractPages(const std::string &markdown)
        {
            std::map<int, std::string> pages;
            re2::StringPiece input(markdown);
            re2::StringPiece groups[2];
            size_t pos = 0;
            while (pos < markdown.size() &&
                   pageBlockRe().Match(input, pos, markdown.size(), RE2::UNANCHORED, groups, 2))
            {
                int page = std::stoi(std::string(groups[1].data(), groups[1].size()));
                pages.emplace(page, std::string(groups[0].data(), groups[0].size()));
                pos = static_cast<size_t>(groups[0].data() - markdown.data()) + groups[0].size();
            }
            return pages;
        }

        std::string mergeChunks(const std::vector<std::string> &parts)
        {
            if (parts.empty())
            {
                return "";
            }
            if (parts.size() == 1)
            {
                return parts.front();
            }

            std::cout << "Merging " << parts.size() << " chunks by page markers..." << std::endl;

            std::map<int, std::string> all_pages;
            for (size_t i = 0; i < parts.size(); ++i)
            {
                auto chunk_pages = extractPages(parts[i]);
                size_t new_pages = 0;
                for (auto &entry : chunk_pages)
                {
                    if (all_pages.emplace(entry.first, std::move(entry.second)).second)
                    {
                        ++new_pages;
                    }
                }
                std::cout << "  Chunk " << (i + 1) << ": " << chunk_pages.size() << " pages ("
                          << new_pages << " new)" << std::endl;
            }

            if (all_pages.empty())
            {
                std::cerr << "Warning: no page markers found, falling back to simple join" << std::endl;
                std::string joined;
                for (const auto &part : parts)
                {
                    std::string stripped = Markers::trim(part);
                    if (stripped.empty())
                    {
                        continue;
                    }
                    if (!joined.empty())
                    {
                        joined += PAGE_SEPARATOR;
                    }
                    joined += stripped;
                }
                return joined;
            }

            std::cout << "  Total: " << all_pages.size() << " unique pages ("
                      << all_pages.begin()->first << "-" << all_pages.rbegin()->first << ")" << std::endl;

            std::string merged;
            for (const auto &entry : all_pages)
            {
                if (!merged.empty())
                {
                    merged += PAGE_SEPARATOR;
                }
                merged += entry.second;
            }
            return merged;
        }

    } // namespace Merge
} // namespace PageStitch
