// tests/test_context_extractor.cpp
#include <catch2/catch.hpp>

#include "context_extractor.hpp"
#include "markers.hpp"
#include "test_support.hpp"

using namespace PageStitch;

TEST_CASE("context tail starts at a page boundary", "[context]")
{
    const std::string markdown = Testing::pages(1, 5);

    const std::string tail = Chunks::extractContextTail(markdown, 2, 0);

    REQUIRE(tail.rfind(Markers::formatPageBegin(4), 0) == 0);
    REQUIRE(tail.find("Page 5") != std::string::npos);
    REQUIRE(tail.find("Page 3") == std::string::npos);
}

TEST_CASE("context tail grows until it has enough lines", "[context]")
{
    const std::string markdown = Testing::pages(1, 5);

    // Each page block is three lines; six newlines need the last three pages.
    const std::string tail = Chunks::extractContextTail(markdown, 1, 6);

    REQUIRE(tail.rfind(Markers::formatPageBegin(3), 0) == 0);
}

TEST_CASE("context tail takes every page when there are too few", "[context]")
{
    const std::string markdown = "preamble\n" + Testing::pages(1, 2);

    const std::string tail = Chunks::extractContextTail(markdown, 3, 200);

    REQUIRE(tail.rfind(Markers::formatPageBegin(1), 0) == 0);
}

TEST_CASE("context tail without sentinels is the last lines", "[context]")
{
    const std::string markdown = "a\nb\nc\nd\ne";

    REQUIRE(Chunks::extractContextTail(markdown, 3, 2) == "d\ne");
    REQUIRE(Chunks::extractContextTail("short", 3, 200) == "short");
}
