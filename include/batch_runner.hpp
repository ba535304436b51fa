// include/batch_runner.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "conversion_pipeline.hpp"
#include "extractor.hpp"
#include "staging_config.hpp"
#include "staging_records.hpp"

namespace PageStitch
{
    namespace Batch
    {

        enum class DocumentStatus
        {
            Converted,
            Cached,
            Failed
        };

        struct DocumentOutcome
        {
            std::filesystem::path pdf_path;
            DocumentStatus status = DocumentStatus::Failed;
            std::optional<Records::DocumentStats> stats;
            std::string error; // set when status is Failed
        };

        struct BatchOptions
        {
            std::optional<std::filesystem::path> output_dir;
            int pages_per_chunk = Config::StagingConfig::DEFAULT_PAGES_PER_CHUNK;
            std::optional<int> max_pages;
            bool force = false;
            bool remerge = false;
            bool format_output = true;
        };

        struct BatchSummary
        {
            std::vector<DocumentOutcome> documents;
            int converted = 0;
            int cached = 0;
            int failed = 0;
            double elapsed_seconds = 0.0;

            int exitCode() const { return failed > 0 ? 1 : 0; }
        };

        // Check every path names an existing regular ".pdf" file (suffix compared
        // case-insensitively) and return them sorted by file name.
        // Throws std::invalid_argument naming the first offending path.
        std::vector<std::filesystem::path> resolvePdfPaths(const std::vector<std::string> &raw_paths);

        // Convert (or re-merge) one document. Any error is reported on stderr and
        // returned as a Failed outcome so the rest of a batch keeps going.
        // extractor may be null only in remerge mode.
        DocumentOutcome processDocument(const std::filesystem::path &pdf_path,
                                        Extraction::Extractor *extractor,
                                        const BatchOptions &options);

        // Process every document in order and print the closing summary.
        BatchSummary runBatch(const std::vector<std::filesystem::path> &pdf_paths,
                              Extraction::Extractor *extractor,
                              const BatchOptions &options);

        void printResult(const Pipeline::PipelineResult &result);
        void printSummary(const BatchSummary &summary);

    } // namespace Batch
} // namespace PageStitch
