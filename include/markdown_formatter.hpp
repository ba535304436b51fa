// include/markdown_formatter.hpp
#pragma once

#include <string>

namespace PageStitch
{
    namespace Format
    {

        // Re-indent one <table>...</table> block. Every table structure tag
        // (table, thead, tbody, tfoot, tr, caption, colgroup, col) gets its own
        // line, indented two spaces per level. A cell (td, th) stays on one
        // line with its inline content, and newlines inside it become spaces.
        // Comments outside cells, page sentinels included, get their own line
        // at the current depth. Tags are copied as written.
        std::string prettifyTable(const std::string &html);

        // Deterministic layout pass over a whole document:
        //   1. prettify every <table> block that starts at the beginning of a line
        //   2. strip trailing spaces and tabs from every line
        //   3. collapse three or more consecutive newlines to one blank line
        //   4. end the text with exactly one newline
        // formatMarkdown(formatMarkdown(x)) == formatMarkdown(x).
        std::string formatMarkdown(const std::string &text);

    } // namespace Format
} // namespace PageStitch
