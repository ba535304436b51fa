// tests/test_pipeline.cpp
#include <catch2/catch.hpp>

#include "chunk_converter.hpp"
#include "conversion_pipeline.hpp"
#include "markdown_formatter.hpp"
#include "markers.hpp"
#include "page_merger.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace PageStitch;
namespace fs = std::filesystem;

namespace
{

    const Source::SourceIdentity IDENTITY{2048, 1700000000.0};

    // Stage a converted document without running pdfinfo
    void stage(Pipeline::ConversionPipeline &pipeline, const fs::path &pdf, int pages_per_chunk, int total_pages,
               const std::string &model = "test-model")
    {
        Testing::ScriptedExtractor extractor(model);
        Conversion::ChunkConverter converter(extractor);
        converter.convertDocument(pdf, pipeline.getStaging(), pages_per_chunk, total_pages, IDENTITY);
    }

} // namespace

TEST_CASE("resolveOutput places the markdown beside the PDF or in the output directory", "[pipeline]")
{
    REQUIRE(Pipeline::resolveOutput("/data/in/report.pdf", std::nullopt) == fs::path("/data/in/report.md"));
    REQUIRE(Pipeline::resolveOutput("/data/in/report.pdf", fs::path("/out")) == fs::path("/out/report.md"));
}

TEST_CASE("the staging area sits beside the output file", "[pipeline]")
{
    Pipeline::ConversionPipeline pipeline("/data/in/report.pdf", "/out/report.md");
    REQUIRE(pipeline.getStaging().path() == fs::path("/out/report.staging"));
}

TEST_CASE("remerge rebuilds the output from staged chunks", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    fs::path output = tmp.path() / "out" / "report.md";
    Pipeline::ConversionPipeline pipeline(pdf, output);
    stage(pipeline, pdf, 2, 5);

    auto result = pipeline.remerge();

    REQUIRE(fs::exists(output));
    const std::string merged = Merge::mergeChunks({Testing::pages(1, 2), Testing::pages(3, 4), Testing::pages(5, 5)});
    REQUIRE(Testing::readFile(output) == Format::formatMarkdown(merged));
    REQUIRE(pipeline.getStaging().loadOutput() == merged);
    REQUIRE(result.cached_chunks == 3);
    REQUIRE(result.fresh_chunks == 0);
    REQUIRE(result.stats.pages == 5);
}

TEST_CASE("remerge splices continuation tables across chunk boundaries", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    fs::path output = tmp.path() / "report.md";
    Pipeline::ConversionPipeline pipeline(pdf, output);

    Testing::ScriptedExtractor extractor;
    extractor.respond = [](const Extraction::ExtractionRequest &r)
    {
        const std::string row = "<tr><td>R" + std::to_string(r.plan.page_start) + "</td></tr>";
        const std::string table = "<table>\n<tbody>\n" + row + "\n</tbody>\n</table>";
        const std::string body = r.plan.is_first ? table : Markers::TABLE_CONTINUE + "\n" + table;
        return Testing::page(r.plan.page_start, body);
    };
    Conversion::ChunkConverter converter(extractor);
    converter.convertDocument(pdf, pipeline.getStaging(), 1, 3, IDENTITY);

    auto result = pipeline.remerge();

    REQUIRE(result.splice.merged == 2);
    REQUIRE(result.splice.remaining == 0);
    const std::string text = Testing::readFile(output);
    REQUIRE(text.find("TABLE_CONTINUE") == std::string::npos);
    REQUIRE(text.find("<table", text.find("<table") + 1) == std::string::npos);
    REQUIRE(text.find("R1") < text.find("R2"));
    REQUIRE(text.find("R2") < text.find("R3"));
}

TEST_CASE("remerge prettifies tables unless formatting is off", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    fs::path output = tmp.path() / "report.md";
    Pipeline::ConversionPipeline pipeline(pdf, output);

    Testing::ScriptedExtractor extractor;
    extractor.respond = [](const Extraction::ExtractionRequest &r)
    {
        return Testing::page(r.plan.page_start, "<table><tr><td>A</td></tr></table>   ");
    };
    Conversion::ChunkConverter converter(extractor);
    converter.convertDocument(pdf, pipeline.getStaging(), 1, 1, IDENTITY);

    pipeline.remerge();
    const std::string expected = Markers::formatPageBegin(1) + "\n" +
                                 "<table>\n"
                                 "  <tr>\n"
                                 "    <td>A</td>\n"
                                 "  </tr>\n"
                                 "</table>\n" +
                                 Markers::formatPageEnd(1) + "\n";
    REQUIRE(Testing::readFile(output) == expected);

    pipeline.setFormatOutput(false);
    pipeline.remerge();
    REQUIRE(Testing::readFile(output) == *pipeline.getStaging().loadOutput());
}

TEST_CASE("loadCachedStats reports the last completed conversion", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    Pipeline::ConversionPipeline pipeline(pdf, tmp.path() / "report.md");

    REQUIRE_FALSE(pipeline.loadCachedStats().has_value());

    stage(pipeline, pdf, 2, 6);

    auto stats = pipeline.loadCachedStats();
    REQUIRE(stats.has_value());
    REQUIRE(stats->pages == 6);
    REQUIRE(stats->chunks == 3);
    REQUIRE(stats->cost == Approx(0.75));
}

TEST_CASE("remerge needs a complete staging area", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    Pipeline::ConversionPipeline pipeline(pdf, tmp.path() / "report.md");

    REQUIRE_THROWS_WITH(pipeline.remerge(), Catch::Contains("Staging directory not found"));

    stage(pipeline, pdf, 2, 6);
    fs::remove(pipeline.getStaging().getConfig().metaPath(0));
    fs::remove(pipeline.getStaging().getConfig().metaPath(2));

    REQUIRE_THROWS_WITH(pipeline.remerge(), Catch::Contains("Missing chunks: 1, 3"));
}

TEST_CASE("an existing manifest decides the window unless forced", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    Pipeline::ConversionPipeline pipeline(pdf, tmp.path() / "report.md");

    REQUIRE(pipeline.resolvePagesPerChunk(10, false) == 10);

    stage(pipeline, pdf, 4, 12);

    REQUIRE(pipeline.resolvePagesPerChunk(10, false) == 4);
    REQUIRE(pipeline.resolvePagesPerChunk(10, true) == 10);
}

TEST_CASE("needsConversion checks output presence and model", "[pipeline]")
{
    Testing::TempDir tmp;
    fs::path pdf = tmp.path() / "report.pdf";
    fs::path output = tmp.path() / "report.md";
    Pipeline::ConversionPipeline pipeline(pdf, output);

    REQUIRE(pipeline.needsConversion(false, "test-model"));

    stage(pipeline, pdf, 5, 5);
    pipeline.remerge();

    REQUIRE_FALSE(pipeline.needsConversion(false, "test-model"));
    REQUIRE(pipeline.needsConversion(false, "other-model"));
    REQUIRE(pipeline.needsConversion(true, "test-model"));

    // Output without staging is left alone
    pipeline.getStaging().invalidate();
    REQUIRE_FALSE(pipeline.needsConversion(false, "other-model"));
}
