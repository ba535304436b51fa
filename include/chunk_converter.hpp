// include/chunk_converter.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunk_plan.hpp"
#include "extractor.hpp"
#include "source_document.hpp"
#include "staging_records.hpp"
#include "staging_store.hpp"

namespace PageStitch
{
    namespace Conversion
    {

        // A converted chunk as read back from the staging area
        struct ConvertedChunk
        {
            Chunks::ChunkPlan plan;
            std::string markdown;
            std::string context;
            Records::ChunkUsage usage;
        };

        struct ConversionResult
        {
            std::vector<ConvertedChunk> chunks; // ascending by index
            Records::DocumentStats stats;
            int cached_chunks = 0; // reused from a previous run
            int fresh_chunks = 0;  // converted in this run
        };

        // Drives the chunk-by-chunk conversion of one document.
        //
        // Every chunk is saved to the staging area as soon as it is converted,
        // and the context handed to the next chunk is read back from there,
        // so a run interrupted at any point resumes where it stopped.
        class ChunkConverter
        {
        public:
            explicit ChunkConverter(Extraction::Extractor &extractor);

            // Convert a PDF, reading its page count with pdfinfo.
            // max_pages caps the number of pages converted.
            ConversionResult convert(const std::filesystem::path &pdf_path,
                                     Staging::StagingStore &staging,
                                     int pages_per_chunk,
                                     std::optional<int> max_pages = std::nullopt);

            // Convert a document whose page count and identity are already known.
            // Throws TruncatedOutputError if the extractor hits its output ceiling,
            // std::invalid_argument for a window above the per-request limit.
            ConversionResult convertDocument(const std::filesystem::path &pdf_path,
                                             Staging::StagingStore &staging,
                                             int pages_per_chunk,
                                             int total_pages,
                                             const Source::SourceIdentity &identity);

            std::string modelId() const { return extractor.modelId(); }

        private:
            Extraction::Extractor &extractor;

            Extraction::ExtractionResponse extractChunk(const Extraction::ExtractionRequest &request);

            static ConversionResult collect(const std::filesystem::path &pdf_path,
                                            Staging::StagingStore &staging,
                                            const std::vector<Chunks::ChunkPlan> &plans,
                                            int total_pages);
        };

    } // namespace Conversion
} // namespace PageStitch
