// src/conversion_pipeline.cpp
#include "conversion_pipeline.hpp"
#include "markdown_formatter.hpp"
#include "page_merger.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Pipeline
    {

        fs::path resolveOutput(const fs::path &pdf_path, const std::optional<fs::path> &output_dir)
        {
            fs::path base = output_dir ? *output_dir : pdf_path.parent_path();
            return base / (pdf_path.stem().string() + ".md");
        }

        ConversionPipeline::ConversionPipeline(fs::path pdf_path, fs::path output_file)
            : pdf_path(std::move(pdf_path)),
              output_file(output_file),
              staging(fs::path(output_file).replace_extension(".staging"))
        {
        }

        int ConversionPipeline::resolvePagesPerChunk(int requested, bool force) const
        {
            if (force)
            {
                return requested;
            }
            std::optional<Records::Manifest> manifest = staging.loadManifest();
            if (!manifest)
            {
                return requested;
            }
            if (manifest->pages_per_chunk != requested)
            {
                std::cerr << "Warning: using pages_per_chunk=" << manifest->pages_per_chunk
                          << " from existing staging area (requested: " << requested
                          << "). Use --force to override." << std::endl;
            }
            return manifest->pages_per_chunk;
        }

        bool ConversionPipeline::needsConversion(bool force, const std::string &model_id) const
        {
            if (force || !fs::exists(output_file))
            {
                return true;
            }
            // A missing or corrupt manifest is no reason to reconvert an existing output.
            std::optional<Records::Manifest> manifest = staging.loadManifest();
            return manifest && manifest->model_id != model_id;
        }

        PipelineResult ConversionPipeline::convert(Conversion::ChunkConverter &converter,
                                                   int pages_per_chunk,
                                                   std::optional<int> max_pages,
                                                   bool force)
        {
            if (force)
            {
                staging.invalidate();
            }

            Conversion::ConversionResult result = converter.convert(pdf_path, staging, pages_per_chunk, max_pages);

            std::vector<std::string> parts;
            parts.reserve(result.chunks.size());
            for (const auto &chunk : result.chunks)
            {
                parts.push_back(chunk.markdown);
            }

            PipelineResult out;
            out.splice = process(parts);
            out.stats = result.stats;
            out.output_file = output_file;
            out.cached_chunks = result.cached_chunks;
            out.fresh_chunks = result.fresh_chunks;
            return out;
        }

        PipelineResult ConversionPipeline::remerge()
        {
            if (!staging.exists())
            {
                throw std::runtime_error("Staging directory not found: " + staging.path().string() +
                                         "\nRun a full conversion first before using --remerge.");
            }

            const int num_chunks = staging.chunkCount();
            const int total_pages = staging.totalPages();
            std::cout << "Re-merging from " << num_chunks << " cached chunks (" << total_pages
                      << " pages)..." << std::endl;

            std::string missing;
            for (int i = 0; i < num_chunks; ++i)
            {
                if (!staging.has(i))
                {
                    missing += (missing.empty() ? "" : ", ") + std::to_string(i + 1);
                }
            }
            if (!missing.empty())
            {
                throw std::runtime_error("Missing chunks: " + missing +
                                         ". Run a full conversion first (without --remerge) to generate them.");
            }

            std::vector<std::string> parts;
            for (int i = 0; i < num_chunks; ++i)
            {
                parts.push_back(staging.loadPayload(i));
            }

            PipelineResult out;
            out.splice = process(parts);
            out.output_file = output_file;
            out.cached_chunks = num_chunks;
            out.fresh_chunks = 0;

            std::optional<Records::DocumentStats> stats = staging.loadStats();
            if (stats)
            {
                out.stats = *stats;
            }
            else
            {
                out.stats.doc_name = output_file.stem().string();
                out.stats.pages = 0;
                out.stats.chunks = num_chunks;
            }
            return out;
        }

        std::optional<Records::DocumentStats> ConversionPipeline::loadCachedStats() const
        {
            if (!staging.exists())
            {
                return std::nullopt;
            }
            return staging.loadStats();
        }

        Merge::SpliceReport ConversionPipeline::process(const std::vector<std::string> &parts)
        {
            std::string merged = Merge::mergeChunks(parts);
            staging.saveOutput(merged);

            std::cout << "  Step: merge continued tables..." << std::endl;
            Merge::SpliceReport report = Merge::mergeContinuedTables(merged);
            if (report.merged > 0 || report.stripped > 0)
            {
                std::cout << "  Merged " << report.merged << " continued table(s), removed "
                          << report.stripped << " stray sentinel(s)" << std::endl;
            }

            if (format_output)
            {
                std::cout << "  Step: format markdown..." << std::endl;
                report.text = Format::formatMarkdown(report.text);
            }

            writeOutput(report.text);
            return report;
        }

        void ConversionPipeline::writeOutput(const std::string &markdown) const
        {
            fs::path parent = output_file.parent_path();
            if (!parent.empty())
            {
                fs::create_directories(parent);
            }

            std::ofstream ofs(output_file, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw std::runtime_error("Failed to open output file for writing: " + output_file.string());
            }
            ofs.write(markdown.data(), static_cast<std::streamsize>(markdown.size()));
            if (!ofs.good())
            {
                throw std::runtime_error("Failed to write output file: " + output_file.string());
            }

            std::cout << "  Saved: " << output_file.string() << " ("
                      << std::count(markdown.begin(), markdown.end(), '\n') + 1 << " lines)" << std::endl;
        }

    } // namespace Pipeline
} // namespace PageStitch
