// include/conversion_pipeline.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "chunk_converter.hpp"
#include "staging_records.hpp"
#include "staging_store.hpp"
#include "table_splicer.hpp"

namespace PageStitch
{
    namespace Pipeline
    {

        struct PipelineResult
        {
            Records::DocumentStats stats;
            std::filesystem::path output_file;
            Merge::SpliceReport splice; // splice.text is the text written to output_file
            int cached_chunks = 0;
            int fresh_chunks = 0;
        };

        // <output_dir or the PDF's directory>/<pdf stem>.md
        std::filesystem::path resolveOutput(const std::filesystem::path &pdf_path,
                                            const std::optional<std::filesystem::path> &output_dir);

        // Converts one PDF into one markdown file:
        // chunked conversion, page merge, table splice, formatting, write.
        //
        // The staging area sits next to the output file ("report.md" ->
        // "report.staging").
        class ConversionPipeline
        {
        public:
            ConversionPipeline(std::filesystem::path pdf_path, std::filesystem::path output_file);

            // The window recorded in an existing manifest wins over the requested
            // one unless force is set, so cached chunks stay usable.
            int resolvePagesPerChunk(int requested, bool force) const;

            // True if forced, the output does not exist yet, or the staged
            // chunks were produced by a different model.
            bool needsConversion(bool force, const std::string &model_id) const;

            PipelineResult convert(Conversion::ChunkConverter &converter,
                                   int pages_per_chunk,
                                   std::optional<int> max_pages,
                                   bool force);

            // Rebuild the output from staged chunks without any extraction call.
            // Throws std::runtime_error if the staging area, its manifest or any
            // chunk is missing.
            PipelineResult remerge();

            // Stats of the last completed conversion, if the staging area has them
            std::optional<Records::DocumentStats> loadCachedStats() const;

            // Formatting is on by default
            void setFormatOutput(bool enabled) { format_output = enabled; }

            const std::filesystem::path &getOutputFile() const { return output_file; }
            Staging::StagingStore &getStaging() { return staging; }

        private:
            std::filesystem::path pdf_path;
            std::filesystem::path output_file;
            Staging::StagingStore staging;
            bool format_output = true;

            Merge::SpliceReport process(const std::vector<std::string> &parts);
            void writeOutput(const std::string &markdown) const;
        };

    } // namespace Pipeline
} // namespace PageStitch
