// tests/test_chunk_plan.cpp
#include <catch2/catch.hpp>

#include "chunk_plan.hpp"
#include "staging_config.hpp"

#include <stdexcept>

using PageStitch::Chunks::planChunks;
using PageStitch::Chunks::validateWindow;

TEST_CASE("planChunks splits 88 pages into windows of 20", "[plan]")
{
    auto chunks = planChunks(88, 20);

    REQUIRE(chunks.size() == 5);
    const int expected[5][2] = {{1, 20}, {21, 40}, {41, 60}, {61, 80}, {81, 88}};
    for (int i = 0; i < 5; ++i)
    {
        REQUIRE(chunks[i].index == i);
        REQUIRE(chunks[i].page_start == expected[i][0]);
        REQUIRE(chunks[i].page_end == expected[i][1]);
    }
    REQUIRE(chunks.front().is_first);
    REQUIRE_FALSE(chunks.front().is_last);
    REQUIRE(chunks.back().is_last);
    REQUIRE(chunks.back().pageCount() == 8);
}

TEST_CASE("planChunks covers every page exactly once", "[plan]")
{
    for (int total = 1; total <= 45; ++total)
    {
        for (int window = 1; window <= 12; ++window)
        {
            auto chunks = planChunks(total, window);
            int next = 1;
            for (const auto &c : chunks)
            {
                REQUIRE(c.page_start == next);
                REQUIRE(c.pageCount() <= window);
                next = c.page_end + 1;
            }
            REQUIRE(next == total + 1);
        }
    }
}

TEST_CASE("planChunks returns one chunk for a short document", "[plan]")
{
    auto chunks = planChunks(7, 10);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].page_start == 1);
    REQUIRE(chunks[0].page_end == 7);
    REQUIRE(chunks[0].is_first);
    REQUIRE(chunks[0].is_last);
}

TEST_CASE("planChunks rejects non-positive arguments", "[plan]")
{
    REQUIRE_THROWS_AS(planChunks(0, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(planChunks(10, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(planChunks(-3, 5), std::invalid_argument);
}

TEST_CASE("validateWindow enforces the per-request page limit", "[plan]")
{
    const int limit = PageStitch::Config::StagingConfig::MAX_PAGES_PER_CHUNK;
    REQUIRE_NOTHROW(validateWindow(limit, limit));
    REQUIRE_THROWS_WITH(validateWindow(limit + 1, limit), Catch::Contains("exceeds API limit"));
}
