// src/context_extractor.cpp
#include "context_extractor.hpp"
#include "markers.hpp"

#include <algorithm>
#include <vector>

namespace PageStitch
{
    namespace Chunks
    {

        namespace
        {

            long countNewlines(const std::string &s, size_t from)
            {
                return static_cast<long>(std::count(s.begin() + static_cast<long>(from), s.end(), '\n'));
            }

            // Last min_lines lines of the text, joined back with '\n'
            std::string lastLines(const std::string &markdown, int min_lines)
            {
                if (min_lines <= 0)
                {
                    return "";
                }
                // Walk back over min_lines line separators
                size_t cut = markdown.size();
                int seen = 0;
                while (cut > 0)
                {
                    if (markdown[cut - 1] == '\n')
                    {
                        if (++seen == min_lines)
                        {
                            break;
                        }
                    }
                    --cut;
                }
                return markdown.substr(cut);
            }

        } // namespace

        std::string extractContextTail(const std::string &markdown, int min_pages, int min_lines)
        {
            auto begins = Markers::findPageBegins(markdown);
            if (begins.empty())
            {
                return lastLines(markdown, min_lines);
            }

            const size_t available = begins.size();
            size_t take = std::min(static_cast<size_t>(std::max(min_pages, 1)), available);
            while (take < available)
            {
                if (countNewlines(markdown, begins[available - take].offset) >= min_lines)
                {
                    break;
                }
                ++take;
            }
            return markdown.substr(begins[available - take].offset);
        }

    } // namespace Chunks
} // namespace PageStitch
