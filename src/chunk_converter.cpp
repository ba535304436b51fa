// src/chunk_converter.cpp
#include "chunk_converter.hpp"
#include "context_extractor.hpp"
#include "errors.hpp"
#include "markers.hpp"
#include "staging_config.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Conversion
    {

        namespace
        {
            double secondsSince(std::chrono::steady_clock::time_point start)
            {
                return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            }

            std::string pageRange(const Chunks::ChunkPlan &plan)
            {
                return std::to_string(plan.page_start) + "-" + std::to_string(plan.page_end);
            }
        } // namespace

        ChunkConverter::ChunkConverter(Extraction::Extractor &extractor) : extractor(extractor)
        {
        }

        ConversionResult ChunkConverter::convert(const fs::path &pdf_path,
                                                 Staging::StagingStore &staging,
                                                 int pages_per_chunk,
                                                 std::optional<int> max_pages)
        {
            Source::SourceIdentity identity = Source::identify(pdf_path);
            int total_pages = Source::pageCount(pdf_path);
            if (max_pages && *max_pages > 0 && *max_pages < total_pages)
            {
                std::cout << "Limiting conversion to the first " << *max_pages << " of "
                          << total_pages << " pages" << std::endl;
                total_pages = *max_pages;
            }
            return convertDocument(pdf_path, staging, pages_per_chunk, total_pages, identity);
        }

        Extraction::ExtractionResponse ChunkConverter::extractChunk(const Extraction::ExtractionRequest &request)
        {
            auto start = std::chrono::steady_clock::now();
            Extraction::ExtractionResponse response = extractor.extract(request);

            if (response.stop_reason == Extraction::STOP_MAX_TOKENS)
            {
                std::ostringstream msg;
                msg << "Chunk pages " << pageRange(request.plan) << " truncated (hit max_tokens after "
                    << std::fixed << std::setprecision(1) << secondsSince(start) << "s). "
                    << "Try reducing --pages-per-chunk (currently " << request.plan.pageCount() << ").";
                throw TruncatedOutputError(msg.str());
            }
            return response;
        }

        ConversionResult ChunkConverter::convertDocument(const fs::path &pdf_path,
                                                         Staging::StagingStore &staging,
                                                         int pages_per_chunk,
                                                         int total_pages,
                                                         const Source::SourceIdentity &identity)
        {
            Chunks::validateWindow(pages_per_chunk, Config::StagingConfig::MAX_PAGES_PER_CHUNK);
            std::vector<Chunks::ChunkPlan> plans = Chunks::planChunks(total_pages, pages_per_chunk);
            const int num_chunks = static_cast<int>(plans.size());

            std::cout << "Converting " << pdf_path.filename().string() << ": " << total_pages
                      << " pages in " << num_chunks << " chunk(s) of up to " << pages_per_chunk
                      << " pages" << std::endl;

            Records::Manifest manifest;
            manifest.version = Config::StagingConfig::MANIFEST_VERSION;
            manifest.source_mtime = identity.mtime;
            manifest.source_size = identity.size;
            manifest.total_pages = total_pages;
            manifest.pages_per_chunk = pages_per_chunk;
            manifest.max_pages = std::nullopt; // already applied to total_pages
            manifest.model_id = extractor.modelId();
            manifest.num_chunks = num_chunks;
            const std::vector<int> cached = staging.createOrValidate(manifest);
            const std::set<int> cached_indices(cached.begin(), cached.end());

            int cached_count = 0;
            std::vector<double> fresh_elapsed; // ETA only
            auto conversion_start = std::chrono::steady_clock::now();

            for (const auto &plan : plans)
            {
                const std::string label = "Chunk " + std::to_string(plan.index + 1) + "/" + std::to_string(num_chunks);

                if (cached_indices.count(plan.index) > 0)
                {
                    cached_count++;
                    std::cout << "  " << label << ": pages " << pageRange(plan) << " (cached, skipping)" << std::endl;
                    continue;
                }

                std::cout << "  " << label << ": pages " << pageRange(plan) << " (" << plan.pageCount() << " pages)";
                if (!fresh_elapsed.empty())
                {
                    double sum = 0.0;
                    for (double e : fresh_elapsed)
                        sum += e;
                    double avg = sum / static_cast<double>(fresh_elapsed.size());
                    double remaining = (num_chunks - plan.index - cached_count) * avg;
                    std::cout << " (" << Records::formatDuration(secondsSince(conversion_start))
                              << " elapsed, ETA ~" << Records::formatDuration(remaining) << ")";
                }
                std::cout << "..." << std::endl;

                // Context comes from disk, never from the previous iteration
                Extraction::ExtractionRequest request;
                request.source = pdf_path;
                request.plan = plan;
                request.total_chunks = num_chunks;
                request.previous_context = plan.index > 0 ? staging.loadContext(plan.index - 1) : "";
                request.position = Extraction::positionFor(plan);

                auto chunk_start = std::chrono::steady_clock::now();
                Extraction::ExtractionResponse response = extractChunk(request);
                double chunk_elapsed = secondsSince(chunk_start);

                std::string markdown = Markers::remapPageMarkers(response.markdown, plan.page_start);
                std::string context_tail = Chunks::extractContextTail(markdown);

                Records::ChunkUsage usage;
                usage.index = plan.index;
                usage.page_start = plan.page_start;
                usage.page_end = plan.page_end;
                usage.input_tokens = response.input_tokens;
                usage.output_tokens = response.output_tokens;
                usage.cache_creation_tokens = response.cache_creation_tokens;
                usage.cache_read_tokens = response.cache_read_tokens;
                usage.cost = response.cost;
                usage.elapsed_seconds = chunk_elapsed;

                staging.save(plan.index, markdown, context_tail, usage);
                fresh_elapsed.push_back(chunk_elapsed);

                std::cout << "  " << label << " done (" << Records::formatDuration(chunk_elapsed) << ") ("
                          << (usage.input_tokens + usage.cache_creation_tokens + usage.cache_read_tokens)
                          << " input, " << usage.output_tokens << " output)" << std::endl;
                if (usage.cache_creation_tokens || usage.cache_read_tokens)
                {
                    std::cout << "    Cache: " << usage.cache_creation_tokens << " written, "
                              << usage.cache_read_tokens << " read" << std::endl;
                }
            }

            ConversionResult result = collect(pdf_path, staging, plans, total_pages);
            result.cached_chunks = cached_count;
            result.fresh_chunks = static_cast<int>(fresh_elapsed.size());

            if (cached_count > 0)
            {
                std::cout << "Reused " << cached_count << " cached chunk(s), converted "
                          << result.fresh_chunks << std::endl;
            }
            return result;
        }

        ConversionResult ChunkConverter::collect(const fs::path &pdf_path,
                                                 Staging::StagingStore &staging,
                                                 const std::vector<Chunks::ChunkPlan> &plans,
                                                 int total_pages)
        {
            ConversionResult result;
            Records::DocumentStats &stats = result.stats;
            stats.doc_name = pdf_path.stem().string();
            stats.pages = total_pages;
            stats.chunks = static_cast<int>(plans.size());

            for (const auto &plan : plans)
            {
                ConvertedChunk chunk{plan, staging.loadPayload(plan.index), staging.loadContext(plan.index),
                                     staging.loadUsage(plan.index)};

                stats.input_tokens += chunk.usage.input_tokens;
                stats.output_tokens += chunk.usage.output_tokens;
                stats.cache_creation_tokens += chunk.usage.cache_creation_tokens;
                stats.cache_read_tokens += chunk.usage.cache_read_tokens;
                stats.cost += chunk.usage.cost;
                stats.elapsed_seconds += chunk.usage.elapsed_seconds;

                result.chunks.push_back(std::move(chunk));
            }

            staging.saveStats(stats);
            return result;
        }

    } // namespace Conversion
} // namespace PageStitch
