// tests/test_markdown_formatter.cpp
#include <catch2/catch.hpp>

#include "markdown_formatter.hpp"
#include "markers.hpp"

using namespace PageStitch;

TEST_CASE("table structure is indented two spaces per level", "[format]")
{
    const std::string html = "<table><thead><tr><th>Name</th></tr></thead>"
                             "<tbody><tr><td>a\nb</td></tr></tbody></table>";

    REQUIRE(Format::prettifyTable(html) == "<table>\n"
                                           "  <thead>\n"
                                           "    <tr>\n"
                                           "      <th>Name</th>\n"
                                           "    </tr>\n"
                                           "  </thead>\n"
                                           "  <tbody>\n"
                                           "    <tr>\n"
                                           "      <td>a b</td>\n"
                                           "    </tr>\n"
                                           "  </tbody>\n"
                                           "</table>");
}

TEST_CASE("cells keep inline markup, attributes and comments on one line", "[format]")
{
    const std::string html = "<table><tr><td colspan=\"2\"><b>x</b><br/>y <!-- note --></td></tr></table>";

    REQUIRE(Format::prettifyTable(html) == "<table>\n"
                                           "  <tr>\n"
                                           "    <td colspan=\"2\"><b>x</b><br/>y <!-- note --></td>\n"
                                           "  </tr>\n"
                                           "</table>");
}

TEST_CASE("page sentinels inside a table get their own lines", "[format]")
{
    const std::string html = "<table>\n<tr><td>1</td></tr>\n" + Markers::formatPageEnd(1) + "\n" +
                             Markers::formatPageBegin(2) + "\n<tr><td>2</td></tr>\n</table>";

    REQUIRE(Format::prettifyTable(html) == "<table>\n"
                                           "  <tr>\n"
                                           "    <td>1</td>\n"
                                           "  </tr>\n"
                                           "  " + Markers::formatPageEnd(1) + "\n"
                                           "  " + Markers::formatPageBegin(2) + "\n"
                                           "  <tr>\n"
                                           "    <td>2</td>\n"
                                           "  </tr>\n"
                                           "</table>");
}

TEST_CASE("formatMarkdown normalizes blank lines and trailing whitespace", "[format]")
{
    REQUIRE(Format::formatMarkdown("# Title   \n\n\n\n\nBody\t\n\n\n") == "# Title\n\nBody\n");
    REQUIRE(Format::formatMarkdown("a\n  \n\n\nb") == "a\n\nb\n");
    REQUIRE(Format::formatMarkdown("") == "\n");
}

TEST_CASE("only tables starting a line are prettified", "[format]")
{
    const std::string inline_table = "see <table><tr><td>x</td></tr></table>";
    REQUIRE(Format::formatMarkdown(inline_table) == inline_table + "\n");

    const std::string doc = "Intro\n<table><tr><td>x</td></tr></table>\nOutro";
    REQUIRE(Format::formatMarkdown(doc) == "Intro\n<table>\n  <tr>\n    <td>x</td>\n  </tr>\n</table>\nOutro\n");
}

TEST_CASE("formatting twice changes nothing", "[format]")
{
    const std::string doc = Markers::formatPageBegin(1) + "\n\n## Results  \n\n\n\n" +
                            "<table>\n<thead><tr><th>Key</th><th>Value</th></tr></thead>\n<tbody>\n"
                            "<tr><td>a\n  b</td><td><i>1</i></td></tr>\n" +
                            Markers::formatPageEnd(1) + "\n" + Markers::formatPageBegin(2) + "\n" +
                            "<tr><td>c</td><td>2</td></tr>\n</tbody>\n</table>\n\n\n" +
                            Markers::formatPageEnd(2) + "\n\n\n";

    const std::string once = Format::formatMarkdown(doc);

    REQUIRE(Format::formatMarkdown(once) == once);
    REQUIRE(once.find("      <td>a   b</td>") != std::string::npos);
    REQUIRE(once.find("    " + Markers::formatPageEnd(1)) != std::string::npos);
}
