// tests/test_batch_runner.cpp
#include <catch2/catch.hpp>

#include "batch_runner.hpp"
#include "chunk_converter.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace PageStitch;
namespace fs = std::filesystem;

namespace
{

    const Source::SourceIdentity IDENTITY{2048, 1700000000.0};

    // Stage and merge a document beside its PDF, as a finished earlier run would
    void convertEarlier(const fs::path &pdf, int total_pages)
    {
        Testing::writeFile(pdf, "%PDF-1.4");
        Pipeline::ConversionPipeline pipeline(pdf, Pipeline::resolveOutput(pdf, std::nullopt));
        Testing::ScriptedExtractor extractor;
        Conversion::ChunkConverter converter(extractor);
        converter.convertDocument(pdf, pipeline.getStaging(), 2, total_pages, IDENTITY);
        pipeline.remerge();
    }

} // namespace

TEST_CASE("resolvePdfPaths sorts by file name and rejects bad paths", "[batch]")
{
    Testing::TempDir tmp;
    fs::create_directories(tmp.path() / "x");
    fs::create_directories(tmp.path() / "y");
    Testing::writeFile(tmp.path() / "y" / "alpha.pdf", "");
    Testing::writeFile(tmp.path() / "x" / "beta.PDF", "");
    Testing::writeFile(tmp.path() / "notes.txt", "");

    auto paths = Batch::resolvePdfPaths({(tmp.path() / "x" / "beta.PDF").string(),
                                         (tmp.path() / "y" / "alpha.pdf").string()});
    REQUIRE(paths.size() == 2);
    REQUIRE(paths[0].filename().string() == "alpha.pdf");
    REQUIRE(paths[1].filename().string() == "beta.PDF");

    REQUIRE_THROWS_WITH(Batch::resolvePdfPaths({(tmp.path() / "missing.pdf").string()}),
                        Catch::Contains("PDF not found"));
    REQUIRE_THROWS_WITH(Batch::resolvePdfPaths({(tmp.path() / "x").string()}), Catch::Contains("Not a file"));
    REQUIRE_THROWS_AS(Batch::resolvePdfPaths({(tmp.path() / "notes.txt").string()}), std::invalid_argument);
}

TEST_CASE("one failing document does not stop the batch", "[batch]")
{
    Testing::TempDir tmp;
    convertEarlier(tmp.path() / "a.pdf", 4);
    convertEarlier(tmp.path() / "b.pdf", 3);
    Testing::writeFile(tmp.path() / "c.pdf", "%PDF-1.4");

    Batch::BatchOptions options;
    options.remerge = true;
    auto summary = Batch::runBatch({tmp.path() / "a.pdf", tmp.path() / "c.pdf", tmp.path() / "b.pdf"}, nullptr,
                                   options);

    REQUIRE(summary.converted == 2);
    REQUIRE(summary.failed == 1);
    REQUIRE(summary.cached == 0);
    REQUIRE(summary.exitCode() == 1);
    REQUIRE(summary.documents.size() == 3);
    REQUIRE(summary.documents[1].status == Batch::DocumentStatus::Failed);
    REQUIRE(summary.documents[1].error.find("Staging directory not found") != std::string::npos);
    REQUIRE(summary.documents[2].status == Batch::DocumentStatus::Converted);
    REQUIRE(summary.documents[2].stats->pages == 3);
    REQUIRE(fs::exists(tmp.path() / "b.md"));
}

TEST_CASE("an up-to-date document is reported as cached with its stats", "[batch]")
{
    Testing::TempDir tmp;
    convertEarlier(tmp.path() / "a.pdf", 6);

    Testing::ScriptedExtractor extractor;
    Batch::BatchOptions options;
    auto summary = Batch::runBatch({tmp.path() / "a.pdf"}, &extractor, options);

    REQUIRE(summary.exitCode() == 0);
    REQUIRE(summary.cached == 1);
    REQUIRE(summary.converted == 0);
    REQUIRE(extractor.requests.empty());
    const auto &doc = summary.documents.front();
    REQUIRE(doc.status == Batch::DocumentStatus::Cached);
    REQUIRE(doc.stats.has_value());
    REQUIRE(doc.stats->chunks == 3);
    REQUIRE(doc.stats->cost == Approx(0.75));
}

TEST_CASE("converting without an extractor fails that document only", "[batch]")
{
    Testing::TempDir tmp;
    Testing::writeFile(tmp.path() / "a.pdf", "%PDF-1.4");

    Batch::BatchOptions options;
    Batch::DocumentOutcome outcome;
    REQUIRE_NOTHROW(outcome = Batch::processDocument(tmp.path() / "a.pdf", nullptr, options));

    REQUIRE(outcome.status == Batch::DocumentStatus::Failed);
    REQUIRE_FALSE(outcome.error.empty());
    REQUIRE_FALSE(outcome.stats.has_value());
}
