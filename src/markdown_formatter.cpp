// src/markdown_formatter.cpp
#include "markdown_formatter.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <cctype> // For std::isalpha, std::isalnum, std::tolower
#include <set>
#include <vector>

namespace PageStitch
{
    namespace Format
    {

        namespace
        {
            const std::size_t INDENT_WIDTH = 2;

            const std::set<std::string> BLOCK_TAGS = {"table", "thead", "tbody", "tfoot", "tr", "th",
                                                      "td", "caption", "colgroup", "col"};
            const std::set<std::string> VOID_TAGS = {"br", "col", "img", "hr"};

            const RE2 &tableBlockRe()
            {
                static const RE2 re("(?ms)^(<table\\b[^>]*>.*?</table>)");
                return re;
            }

            const RE2 &trailingSpaceRe()
            {
                static const RE2 re("(?m)[ \\t]+$");
                return re;
            }

            const RE2 &blankRunRe()
            {
                static const RE2 re("\\n{3,}");
                return re;
            }

            bool isCell(const std::string &name)
            {
                return name == "td" || name == "th";
            }

            std::string trim(const std::string &s)
            {
                const char *ws = " \t\r\n\f\v";
                size_t first = s.find_first_not_of(ws);
                if (first == std::string::npos)
                {
                    return "";
                }
                return s.substr(first, s.find_last_not_of(ws) - first + 1);
            }

            std::string rtrim(const std::string &s)
            {
                size_t last = s.find_last_not_of(" \t\r\n\f\v");
                return last == std::string::npos ? "" : s.substr(0, last + 1);
            }

            // Lowercased tag name starting at pos (just after "<" or "</")
            std::string tagName(const std::string &html, size_t pos)
            {
                std::string name;
                while (pos < html.size() && std::isalnum(static_cast<unsigned char>(html[pos])))
                {
                    name += static_cast<char>(std::tolower(static_cast<unsigned char>(html[pos])));
                    ++pos;
                }
                return name;
            }

            class TablePrettifier
            {
            public:
                std::string prettify(const std::string &html)
                {
                    std::string text;
                    size_t pos = 0;
                    while (pos < html.size())
                    {
                        size_t consumed = html[pos] == '<' ? readMarkup(html, pos, text) : 0;
                        if (consumed == 0)
                        {
                            text += html[pos];
                            consumed = 1;
                        }
                        pos += consumed;
                    }
                    handleText(text);
                    flushLine();

                    std::string out;
                    for (size_t i = 0; i < lines.size(); ++i)
                    {
                        if (i > 0)
                        {
                            out += "\n";
                        }
                        out += lines[i];
                    }
                    return out;
                }

            private:
                std::vector<std::string> lines;
                std::string current;
                size_t depth = 0;
                bool in_cell = false;

                std::string indent() const { return std::string(depth * INDENT_WIDTH, ' '); }

                void flushLine()
                {
                    std::string stripped = rtrim(current);
                    if (!stripped.empty())
                    {
                        lines.push_back(stripped);
                    }
                    current.clear();
                }

                // Handles a comment or tag at pos and returns its length, or 0 if
                // the "<" does not open markup. Pending text is handled first.
                size_t readMarkup(const std::string &html, size_t pos, std::string &text)
                {
                    if (html.compare(pos, 4, "<!--") == 0)
                    {
                        size_t close = html.find("-->", pos + 4);
                        if (close == std::string::npos)
                        {
                            return 0;
                        }
                        handleText(text);
                        handleComment(html.substr(pos, close + 3 - pos));
                        return close + 3 - pos;
                    }

                    bool closing = pos + 1 < html.size() && html[pos + 1] == '/';
                    size_t name_pos = pos + (closing ? 2 : 1);
                    if (name_pos >= html.size() || !std::isalpha(static_cast<unsigned char>(html[name_pos])))
                    {
                        return 0;
                    }
                    size_t gt = html.find('>', name_pos);
                    if (gt == std::string::npos)
                    {
                        return 0;
                    }

                    handleText(text);
                    const std::string name = tagName(html, name_pos);
                    if (closing)
                    {
                        handleEndTag(name);
                    }
                    else
                    {
                        std::string raw = html.substr(pos, gt + 1 - pos);
                        std::replace(raw.begin(), raw.end(), '\n', ' ');
                        bool self_closing = raw.size() >= 2 && raw[raw.size() - 2] == '/';
                        handleStartTag(name, raw, self_closing);
                    }
                    return gt + 1 - pos;
                }

                void handleStartTag(const std::string &name, const std::string &raw, bool self_closing)
                {
                    if (!BLOCK_TAGS.count(name))
                    {
                        current += raw;
                        return;
                    }
                    if (self_closing)
                    {
                        flushLine();
                        lines.push_back(indent() + raw);
                        return;
                    }
                    if (in_cell && !isCell(name))
                    {
                        current += raw;
                        return;
                    }

                    flushLine();
                    if (isCell(name))
                    {
                        current = indent() + raw;
                        in_cell = true;
                    }
                    else
                    {
                        lines.push_back(indent() + raw);
                    }
                    if (!VOID_TAGS.count(name))
                    {
                        ++depth;
                    }
                }

                void handleEndTag(const std::string &name)
                {
                    const std::string tag = "</" + name + ">";
                    if (!BLOCK_TAGS.count(name) || (in_cell && !isCell(name)))
                    {
                        current += tag;
                        return;
                    }

                    depth = depth > 0 ? depth - 1 : 0;
                    if (isCell(name))
                    {
                        current += tag;
                        flushLine();
                        in_cell = false;
                    }
                    else
                    {
                        flushLine();
                        lines.push_back(indent() + tag);
                    }
                }

                void handleText(std::string &text)
                {
                    if (text.empty())
                    {
                        return;
                    }
                    if (in_cell)
                    {
                        std::replace(text.begin(), text.end(), '\n', ' ');
                        current += text;
                    }
                    else
                    {
                        std::string stripped = trim(text);
                        if (!stripped.empty())
                        {
                            flushLine();
                            current = indent() + stripped;
                        }
                    }
                    text.clear();
                }

                void handleComment(const std::string &comment)
                {
                    if (in_cell)
                    {
                        current += comment;
                        return;
                    }
                    flushLine();
                    lines.push_back(indent() + comment);
                }
            };

            std::string prettifyTables(const std::string &text)
            {
                std::string out;
                re2::StringPiece input(text);
                re2::StringPiece match;
                size_t pos = 0;
                while (pos < text.size() && tableBlockRe().Match(input, pos, text.size(), RE2::UNANCHORED, &match, 1))
                {
                    size_t start = static_cast<size_t>(match.data() - text.data());
                    out.append(text, pos, start - pos);
                    out += prettifyTable(std::string(match.data(), match.size()));
                    pos = start + match.size();
                }
                if (pos < text.size())
                {
                    out.append(text, pos, std::string::npos);
                }
                return out;
            }
        } // namespace

        std::string prettifyTable(const std::string &html)
        {
            return TablePrettifier().prettify(html);
        }

        std::string formatMarkdown(const std::string &text)
        {
            std::string out = prettifyTables(text);
            RE2::GlobalReplace(&out, trailingSpaceRe(), "");
            RE2::GlobalReplace(&out, blankRunRe(), "\n\n");

            size_t last = out.find_last_not_of('\n');
            out.erase(last == std::string::npos ? 0 : last + 1);
            return out + "\n";
        }

    } // namespace Format
} // namespace PageStitch
