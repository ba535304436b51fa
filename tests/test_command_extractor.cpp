// tests/test_command_extractor.cpp
#include <catch2/catch.hpp>

#include "command_runner.hpp"
#include "errors.hpp"
#include "extractor.hpp"
#include "source_document.hpp"
#include "test_support.hpp"

using namespace PageStitch;

namespace
{

    // Echoes the window arguments and the context file content back as markdown
    const char *const ECHO_SCRIPT = R"SH(#!/bin/sh
ctx=""
while [ $# -gt 0 ]; do
  case "$1" in
    --first) first=$2; shift ;;
    --last) last=$2; shift ;;
    --position) pos=$2; shift ;;
    --chunk) chunk=$2; shift ;;
    --model) model=$2; shift ;;
    --context) ctx=$(cat "$2"); shift ;;
  esac
  shift
done
printf '{"markdown": "%s-%s %s %s %s [%s]", "stop_reason": "end_turn", "input_tokens": 7, "cost": 0.5}\n' \
  "$first" "$last" "$pos" "$chunk" "$model" "$ctx"
)SH";

    Extraction::ExtractionRequest request(int index, int first, int last, const std::string &context)
    {
        Extraction::ExtractionRequest r;
        r.source = "/tmp/some file.pdf";
        r.plan = Chunks::ChunkPlan{index, first, last, index == 0, false};
        r.total_chunks = 4;
        r.previous_context = context;
        r.position = Extraction::positionFor(r.plan);
        return r;
    }

} // namespace

TEST_CASE("parseResponse reads markdown, usage and stop reason", "[extractor]")
{
    auto response = Extraction::parseResponse(
        R"({"markdown": "# Title", "stop_reason": "max_tokens", "input_tokens": 10,
            "output_tokens": 20, "cache_read_tokens": 5, "cost": 1.25})");

    REQUIRE(response.markdown == "# Title");
    REQUIRE(response.stop_reason == Extraction::STOP_MAX_TOKENS);
    REQUIRE(response.input_tokens == 10);
    REQUIRE(response.output_tokens == 20);
    REQUIRE(response.cache_creation_tokens == 0);
    REQUIRE(response.cache_read_tokens == 5);
    REQUIRE(response.cost == Approx(1.25));
}

TEST_CASE("parseResponse rejects unusable output", "[extractor]")
{
    REQUIRE_THROWS_AS(Extraction::parseResponse("not json"), ExtractionError);
    REQUIRE_THROWS_AS(Extraction::parseResponse("[1, 2]"), ExtractionError);
    REQUIRE_THROWS_AS(Extraction::parseResponse(R"({"stop_reason": "end_turn"})"), ExtractionError);
}

TEST_CASE("positionFor distinguishes first, middle and last chunks", "[extractor]")
{
    REQUIRE(Extraction::positionFor(Chunks::ChunkPlan{0, 1, 10, true, true}) == Extraction::Position::First);
    REQUIRE(Extraction::positionFor(Chunks::ChunkPlan{1, 11, 20, false, false}) == Extraction::Position::Middle);
    REQUIRE(Extraction::positionFor(Chunks::ChunkPlan{2, 21, 25, false, true}) == Extraction::Position::Last);
    REQUIRE(Extraction::positionName(Extraction::Position::Middle) == "middle");
}

TEST_CASE("CommandExtractor passes the window and context to the command", "[extractor]")
{
    Testing::TempDir tmp;
    auto script = tmp.path() / "echo_extractor.sh";
    Testing::writeFile(script, ECHO_SCRIPT);

    Extraction::CommandExtractor extractor("sh " + Process::shellQuote(script.string()), "model-x");
    REQUIRE(extractor.modelId() == "model-x");

    auto first = extractor.extract(request(0, 1, 10, ""));
    REQUIRE(first.markdown == "1-10 first 1/4 model-x []");
    REQUIRE(first.input_tokens == 7);

    auto second = extractor.extract(request(1, 11, 20, "previous tail"));
    REQUIRE(second.markdown == "11-20 middle 2/4 model-x [previous tail]");
}

TEST_CASE("CommandExtractor reports failing commands", "[extractor]")
{
    SECTION("non-zero exit")
    {
        Extraction::CommandExtractor extractor("sh -c 'exit 3'", "m");
        REQUIRE_THROWS_WITH(extractor.extract(request(0, 1, 10, "")), Catch::Contains("exit code 3"));
    }

    SECTION("missing command")
    {
        Extraction::CommandExtractor extractor("/nonexistent/pagestitch-extractor", "m");
        REQUIRE_THROWS_AS(extractor.extract(request(0, 1, 10, "")), ExtractionError);
    }

    SECTION("output that is not JSON")
    {
        Extraction::CommandExtractor extractor("echo", "m");
        REQUIRE_THROWS_AS(extractor.extract(request(0, 1, 10, "")), ExtractionError);
    }

    SECTION("empty command")
    {
        REQUIRE_THROWS_AS(Extraction::CommandExtractor("", "m"), ExtractionError);
    }
}

TEST_CASE("pdfinfo output yields the page count", "[source]")
{
    const std::string output =
        "Title:          Report\n"
        "Producer:       Writer\n"
        "Pages:          88\n"
        "Encrypted:      no\n";

    REQUIRE(Source::parsePdfinfoPages(output) == 88);
    REQUIRE(Source::parsePdfinfoPages("Title: x\n") == 0);
}

TEST_CASE("source identity reflects size on disk", "[source]")
{
    Testing::TempDir tmp;
    auto file = tmp.path() / "doc.pdf";
    Testing::writeFile(file, "12345");

    auto identity = Source::identify(file);
    REQUIRE(identity.size == 5);
    REQUIRE(identity.mtime > 0.0);

    REQUIRE_THROWS_AS(Source::identify(tmp.path() / "missing.pdf"), std::runtime_error);
}
