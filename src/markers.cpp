// src/markers.cpp
#include "markers.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <iostream>

namespace PageStitch
{
    namespace Markers
    {

        const std::string PAGE_BEGIN_TAG = "PDF_PAGE_BEGIN";
        const std::string PAGE_END_TAG = "PDF_PAGE_END";
        const std::string TABLE_CONTINUE = "<!-- TABLE_CONTINUE -->";

        namespace
        {
            // Page numbers are capped at nine digits so they always fit an int.
            const RE2 &pageBeginRe()
            {
                static const RE2 re("<!--\\s*PDF_PAGE_BEGIN\\s+(\\d{1,9})\\s*-->");
                return re;
            }

            const RE2 &pageEndRe()
            {
                static const RE2 re("<!--\\s*PDF_PAGE_END\\s+(\\d{1,9})\\s*-->");
                return re;
            }

            const RE2 &continueRe()
            {
                static const RE2 re("<!--\\s*TABLE_CONTINUE\\s*-->");
                return re;
            }

            std::vector<MarkerMatch> findAll(const RE2 &re, const std::string &text)
            {
                std::vector<MarkerMatch> out;
                const int ngroups = 1 + re.NumberOfCapturingGroups();
                re2::StringPiece input(text);
                re2::StringPiece groups[2];
                size_t pos = 0;
                while (pos <= text.size() &&
                       re.Match(input, pos, text.size(), RE2::UNANCHORED, groups, ngroups))
                {
                    MarkerMatch m{static_cast<size_t>(groups[0].data() - text.data()), groups[0].size(), 0};
                    if (ngroups > 1 && groups[1].data() != nullptr)
                    {
                        m.page = std::stoi(std::string(groups[1].data(), groups[1].size()));
                    }
                    out.push_back(m);
                    pos = m.offset + std::max<size_t>(m.length, 1);
                }
                return out;
            }

            // Offset and length of the number inside each page sentinel
            struct NumberSpan
            {
                size_t offset;
                size_t length;
                int value;
            };

            void collectNumbers(const RE2 &re, const std::string &text, std::vector<NumberSpan> &out)
            {
                re2::StringPiece input(text);
                re2::StringPiece groups[2];
                size_t pos = 0;
                while (pos <= text.size() &&
                       re.Match(input, pos, text.size(), RE2::UNANCHORED, groups, 2))
                {
                    NumberSpan span{static_cast<size_t>(groups[1].data() - text.data()), groups[1].size(),
                                    std::stoi(std::string(groups[1].data(), groups[1].size()))};
                    out.push_back(span);
                    pos = static_cast<size_t>(groups[0].data() - text.data()) + groups[0].size();
                }
            }
        } // namespace

        std::string formatPageBegin(int page)
        {
            return "<!-- " + PAGE_BEGIN_TAG + " " + std::to_string(page) + " -->";
        }

        std::string formatPageEnd(int page)
        {
            return "<!-- " + PAGE_END_TAG + " " + std::to_string(page) + " -->";
        }

        std::vector<MarkerMatch> findPageBegins(const std::string &text)
        {
            return findAll(pageBeginRe(), text);
        }

        std::vector<MarkerMatch> findPageEnds(const std::string &text)
        {
            return findAll(pageEndRe(), text);
        }

        std::vector<MarkerMatch> findContinueMarkers(const std::string &text)
        {
            return findAll(continueRe(), text);
        }

        std::vector<MarkerMatch> findPageMarkers(const std::string &text)
        {
            std::vector<MarkerMatch> markers = findPageBegins(text);
            std::vector<MarkerMatch> ends = findPageEnds(text);
            markers.insert(markers.end(), ends.begin(), ends.end());
            std::sort(markers.begin(), markers.end(),
                      [](const MarkerMatch &a, const MarkerMatch &b) { return a.offset < b.offset; });
            return markers;
        }

        std::string remapPageMarkers(const std::string &text, int page_start)
        {
            auto begins = findPageBegins(text);
            if (begins.empty() || begins.front().page >= page_start)
            {
                return text;
            }

            const int offset = page_start - 1;
            std::cerr << "Warning: page markers use sub-document numbering (first="
                      << begins.front().page << ", expected>=" << page_start
                      << "), remapping with offset +" << offset << std::endl;

            std::vector<NumberSpan> spans;
            collectNumbers(pageBeginRe(), text, spans);
            collectNumbers(pageEndRe(), text, spans);
            std::sort(spans.begin(), spans.end(),
                      [](const NumberSpan &a, const NumberSpan &b) { return a.offset < b.offset; });

            std::string out;
            out.reserve(text.size() + spans.size() * 2);
            size_t cursor = 0;
            for (const auto &span : spans)
            {
                out.append(text, cursor, span.offset - cursor);
                out += std::to_string(span.value + offset);
                cursor = span.offset + span.length;
            }
            out.append(text, cursor, std::string::npos);
            return out;
        }

        std::string trim(const std::string &s)
        {
            const char *ws = " \t\r\n";
            auto a = s.find_first_not_of(ws);
            if (a == std::string::npos)
            {
                return "";
            }
            auto b = s.find_last_not_of(ws);
            return s.substr(a, b - a + 1);
        }

    } // namespace Markers
} // namespace PageStitch
