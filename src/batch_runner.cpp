// src/batch_runner.cpp
#include "batch_runner.hpp"
#include "chunk_converter.hpp"

#include <algorithm>
#include <cctype> // For std::tolower
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Batch
    {

        namespace
        {
            const std::string SUMMARY_SEP(60, '=');

            std::string lowercase(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            std::string money(double cost)
            {
                std::ostringstream out;
                out << "$" << std::fixed << std::setprecision(2) << cost;
                return out.str();
            }
        } // namespace

        std::vector<fs::path> resolvePdfPaths(const std::vector<std::string> &raw_paths)
        {
            std::vector<fs::path> resolved;
            for (const auto &raw : raw_paths)
            {
                fs::path p(raw);
                if (!fs::exists(p))
                {
                    throw std::invalid_argument("PDF not found: " + raw);
                }
                if (!fs::is_regular_file(p))
                {
                    throw std::invalid_argument("Not a file: " + raw);
                }
                if (lowercase(p.extension().string()) != ".pdf")
                {
                    std::string ext = p.extension().empty() ? "(no extension)" : p.extension().string();
                    throw std::invalid_argument("Expected a .pdf file, got " + ext + ": " + raw);
                }
                resolved.push_back(p);
            }
            std::stable_sort(resolved.begin(), resolved.end(),
                             [](const fs::path &a, const fs::path &b) { return a.filename() < b.filename(); });
            return resolved;
        }

        DocumentOutcome processDocument(const fs::path &pdf_path,
                                        Extraction::Extractor *extractor,
                                        const BatchOptions &options)
        {
            DocumentOutcome outcome;
            outcome.pdf_path = pdf_path;
            const std::string doc_name = pdf_path.stem().string();

            try
            {
                fs::path output_file = Pipeline::resolveOutput(pdf_path, options.output_dir);
                Pipeline::ConversionPipeline pipeline(pdf_path, output_file);
                pipeline.setFormatOutput(options.format_output);

                if (options.remerge)
                {
                    Pipeline::PipelineResult result = pipeline.remerge();
                    printResult(result);
                    outcome.status = DocumentStatus::Converted;
                    outcome.stats = result.stats;
                    return outcome;
                }

                if (!extractor)
                {
                    throw std::invalid_argument("No extractor configured for " + doc_name);
                }

                if (!pipeline.needsConversion(options.force, extractor->modelId()))
                {
                    outcome.stats = pipeline.loadCachedStats();
                    std::cout << "Up to date: " << doc_name;
                    if (outcome.stats)
                    {
                        std::cout << " (cached, " << money(outcome.stats->cost) << ")";
                    }
                    else
                    {
                        std::cout << " (cached)";
                    }
                    std::cout << std::endl;
                    outcome.status = DocumentStatus::Cached;
                    return outcome;
                }

                std::cout << "Converting " << doc_name << "..." << std::endl;
                Conversion::ChunkConverter converter(*extractor);
                int effective_ppc = pipeline.resolvePagesPerChunk(options.pages_per_chunk, options.force);
                Pipeline::PipelineResult result = pipeline.convert(converter, effective_ppc, options.max_pages,
                                                                   options.force);
                printResult(result);
                outcome.status = DocumentStatus::Converted;
                outcome.stats = result.stats;
            }
            catch (const std::exception &ex)
            {
                std::cerr << "Failed: " << doc_name << ": " << ex.what() << std::endl;
                outcome.status = DocumentStatus::Failed;
                outcome.error = ex.what();
            }
            return outcome;
        }

        BatchSummary runBatch(const std::vector<fs::path> &pdf_paths,
                              Extraction::Extractor *extractor,
                              const BatchOptions &options)
        {
            auto start = std::chrono::steady_clock::now();
            std::cout << "Found " << pdf_paths.size() << " PDF(s) to process" << std::endl;

            BatchSummary summary;
            for (const auto &pdf_path : pdf_paths)
            {
                DocumentOutcome outcome = processDocument(pdf_path, extractor, options);
                switch (outcome.status)
                {
                case DocumentStatus::Converted:
                    summary.converted++;
                    break;
                case DocumentStatus::Cached:
                    summary.cached++;
                    break;
                case DocumentStatus::Failed:
                    summary.failed++;
                    break;
                }
                summary.documents.push_back(std::move(outcome));
            }

            summary.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            printSummary(summary);
            return summary;
        }

        void printResult(const Pipeline::PipelineResult &result)
        {
            const auto &stats = result.stats;
            std::cout << "Done: " << result.output_file.string() << std::endl;
            std::cout << "  Chunks: " << stats.chunks << " (" << result.cached_chunks << " cached, "
                      << result.fresh_chunks << " converted)" << std::endl;
            std::cout << "  Tokens: " << stats.totalInputTokens() << " input, " << stats.output_tokens
                      << " output" << std::endl;
            std::cout << "  Cost: " << money(stats.cost) << ", time "
                      << Records::formatDuration(stats.elapsed_seconds) << std::endl;
            for (const auto &warning : result.splice.warnings)
            {
                std::cerr << "Warning: " << warning << std::endl;
            }
        }

        void printSummary(const BatchSummary &summary)
        {
            std::cout << std::endl << SUMMARY_SEP << std::endl;

            double total_cost = 0.0;
            bool any_stats = false;
            for (const auto &doc : summary.documents)
            {
                if (!doc.stats)
                {
                    continue;
                }
                any_stats = true;
                total_cost += doc.stats->cost;
                std::cout << "  " << doc.pdf_path.stem().string() << ": " << doc.stats->pages << " pages, "
                          << doc.stats->chunks << " chunk(s), " << money(doc.stats->cost) << std::endl;
            }
            if (any_stats)
            {
                std::cout << "  Total cost: " << money(total_cost) << std::endl;
                std::cout << SUMMARY_SEP << std::endl;
            }

            std::cout << "Total time: " << std::fixed << std::setprecision(1) << summary.elapsed_seconds << "s"
                      << std::defaultfloat << std::endl;
            std::cout << "Results: " << summary.converted << " processed, " << summary.failed << " failed, "
                      << summary.cached << " cached" << std::endl;
            std::cout << SUMMARY_SEP << std::endl;
        }

    } // namespace Batch
} // namespace PageStitch
