// src/table_splicer.cpp
#include "table_splicer.hpp"
#include "markers.hpp"

#include <algorithm>
#include <cctype>  // For std::tolower, std::isspace
#include <iostream>

namespace PageStitch
{
    namespace Merge
    {

        namespace
        {

            const std::string TABLE_CLOSE = "</table>";
            const std::string TBODY_CLOSE = "</tbody>";

            // Scans a lowercased copy of the document; ASCII lowercasing keeps byte
            // offsets identical to the original.
            class TagScanner
            {
            public:
                explicit TagScanner(const std::string &text) : lower(text)
                {
                    std::transform(lower.begin(), lower.end(), lower.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                }

                // Position of the next "<name" open tag at or after from, or npos.
                // The name must be followed by whitespace, '>' or '/'.
                size_t findOpen(const std::string &name, size_t from) const
                {
                    const std::string needle = "<" + name;
                    size_t pos = lower.find(needle, from);
                    while (pos != std::string::npos && !isTagBoundary(pos + needle.size()))
                    {
                        pos = lower.find(needle, pos + 1);
                    }
                    return pos;
                }

                // Last "<name" open tag starting before `before`, or npos.
                size_t rfindOpen(const std::string &name, size_t before) const
                {
                    const std::string needle = "<" + name;
                    if (before == 0)
                    {
                        return std::string::npos;
                    }
                    size_t pos = lower.rfind(needle, before - 1);
                    while (pos != std::string::npos && !isTagBoundary(pos + needle.size()))
                    {
                        if (pos == 0)
                        {
                            return std::string::npos;
                        }
                        pos = lower.rfind(needle, pos - 1);
                    }
                    return pos;
                }

                size_t find(const std::string &literal, size_t from) const
                {
                    return lower.find(literal, from);
                }

                // Last occurrence of literal that ends at or before `before`.
                size_t rfind(const std::string &literal, size_t before) const
                {
                    if (before < literal.size())
                    {
                        return std::string::npos;
                    }
                    return lower.rfind(literal, before - literal.size());
                }

                int countOpen(const std::string &name, size_t end) const
                {
                    int n = 0;
                    for (size_t pos = findOpen(name, 0); pos != std::string::npos && pos < end;
                         pos = findOpen(name, pos + 1))
                    {
                        ++n;
                    }
                    return n;
                }

                int count(const std::string &literal, size_t end) const
                {
                    int n = 0;
                    for (size_t pos = lower.find(literal); pos != std::string::npos && pos + literal.size() <= end;
                         pos = lower.find(literal, pos + literal.size()))
                    {
                        ++n;
                    }
                    return n;
                }

            private:
                std::string lower;

                bool isTagBoundary(size_t pos) const
                {
                    if (pos >= lower.size())
                    {
                        return false;
                    }
                    char c = lower[pos];
                    return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
                }
            };

            // Page sentinels from the region between two tables, in order, even
            // when several share a line. Everything else (the continuation
            // sentinel, "(continued)" titles, blank lines) is dropped.
            std::vector<std::string> collectPageMarkers(const std::string &between)
            {
                std::vector<std::string> markers;
                for (const auto &match : Markers::findPageMarkers(between))
                {
                    markers.push_back(between.substr(match.offset, match.length));
                }
                return markers;
            }

            std::string join(const std::vector<std::string> &items, const std::string &sep)
            {
                std::string out;
                for (size_t i = 0; i < items.size(); ++i)
                {
                    if (i > 0)
                    {
                        out += sep;
                    }
                    out += items[i];
                }
                return out;
            }

            void warn(SpliceReport &report, size_t offset, const std::string &what)
            {
                std::string message = "TABLE_CONTINUE at offset " + std::to_string(offset) + ": " + what + ", skipping";
                std::cerr << "Warning: " << message << std::endl;
                report.warnings.push_back(message);
                ++report.skipped;
            }

        } // namespace

        SpliceReport mergeContinuedTables(const std::string &markdown)
        {
            SpliceReport report;
            report.text = markdown;

            auto sentinels = Markers::findContinueMarkers(markdown);
            if (sentinels.empty())
            {
                return report;
            }

            std::cout << "Merging " << sentinels.size() << " continued table(s)..." << std::endl;

            std::string &text = report.text;
            for (auto it = sentinels.rbegin(); it != sentinels.rend(); ++it)
            {
                const size_t marker_start = it->offset;
                const size_t marker_end = it->offset + it->length;
                TagScanner scanner(text);

                // 1. Inside a table that is still open: the table already spans the
                //    boundary, only the sentinel has to go.
                if (scanner.countOpen("table", marker_start) > scanner.count(TABLE_CLOSE, marker_start))
                {
                    std::cout << "  TABLE_CONTINUE inside open table, removing marker only" << std::endl;
                    text.erase(marker_start, marker_end - marker_start);
                    ++report.stripped;
                    continue;
                }

                // 2. Preceding table and the closing tag of its row container.
                size_t preceding_table_end = scanner.rfind(TABLE_CLOSE, marker_start);
                if (preceding_table_end == std::string::npos)
                {
                    warn(report, marker_start, "no preceding </table>");
                    continue;
                }
                size_t preceding_table_start = scanner.rfindOpen("table", preceding_table_end);
                size_t preceding_tbody_end = scanner.rfind(TBODY_CLOSE, preceding_table_end);
                if (preceding_tbody_end == std::string::npos ||
                    (preceding_table_start != std::string::npos && preceding_tbody_end < preceding_table_start))
                    {
                    warn(report, marker_start, "preceding table has no </tbody>");
                    continue;
                }

                // 3. Continuation table and its body rows.
                size_t cont_table_start = scanner.findOpen("table", marker_end);
                size_t cont_table_close = cont_table_start == std::string::npos
                                              ? std::string::npos
                                              : scanner.find(TABLE_CLOSE, cont_table_start);
                if (cont_table_close == std::string::npos)
                {
                    warn(report, marker_start, "no continuation <table> found");
                    continue;
                }
                const size_t cont_table_end = cont_table_close + TABLE_CLOSE.size();

                size_t tbody_open = scanner.findOpen("tbody", cont_table_start);
                size_t tbody_open_end = tbody_open == std::string::npos ? std::string::npos : text.find('>', tbody_open);
                size_t tbody_close = tbody_open_end == std::string::npos
                                         ? std::string::npos
                                         : scanner.find(TBODY_CLOSE, tbody_open_end);
                if (tbody_open >= cont_table_close || tbody_close == std::string::npos || tbody_close > cont_table_close)
                {
                    warn(report, marker_start, "continuation table has no <tbody>");
                    continue;
                }
                const std::string rows = Markers::trim(text.substr(tbody_open_end + 1, tbody_close - tbody_open_end - 1));
                const int row_count = TagScanner(rows).countOpen("tr", rows.size());

                // 4. Page sentinels between the two tables.
                const size_t after_preceding_table = preceding_table_end + TABLE_CLOSE.size();
                const auto page_markers =
                    collectPageMarkers(text.substr(after_preceding_table, cont_table_start - after_preceding_table));

                std::string insert_text = join(page_markers, "\n\n");
                if (!insert_text.empty())
                {
                    insert_text += "\n\n";
                }
                insert_text += rows;

                // 5. Rows go right before the preceding </tbody>; everything from the
                //    preceding </table> through the continuation </table> is dropped.
                std::string spliced;
                spliced.reserve(text.size() + insert_text.size());
                spliced.append(text, 0, preceding_tbody_end);
                spliced += "\n";
                spliced += insert_text;
                spliced += "\n";
                spliced.append(text, preceding_tbody_end, after_preceding_table - preceding_tbody_end);
                spliced.append(text, cont_table_end, std::string::npos);
                text = std::move(spliced);
                ++report.merged;

                std::cout << "  Merged continuation table (" << row_count << " rows";
                if (page_markers.size() >= 2)
                {
                    std::cout << ", boundary " << page_markers.front() << " -> " << page_markers.back();
                }
                std::cout << ")" << std::endl;
            }

            report.remaining = static_cast<int>(Markers::findContinueMarkers(text).size());
            if (report.remaining > 0)
            {
                std::string message = std::to_string(report.remaining) + " TABLE_CONTINUE marker(s) still present after merging";
                std::cerr << "Warning: " << message << std::endl;
                report.warnings.push_back(message);
            }
            return report;
        }

    } // namespace Merge
} // namespace PageStitch
