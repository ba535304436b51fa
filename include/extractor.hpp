// include/extractor.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "chunk_plan.hpp"

namespace PageStitch
{
    namespace Extraction
    {

        // Where a chunk sits in the document; the extraction service phrases
        // its instructions differently for the opening and closing chunks.
        enum class Position
        {
            First,
            Middle,
            Last
        };

        // A single chunk is treated as the first one.
        Position positionFor(const Chunks::ChunkPlan &plan);
        std::string positionName(Position position);

        // Stop reason reported when the service hit its output ceiling
        extern const std::string STOP_MAX_TOKENS;

        struct ExtractionRequest
        {
            std::filesystem::path source; // the whole PDF; the window selects the pages
            Chunks::ChunkPlan plan;
            int total_chunks = 0;
            std::string previous_context; // "" for the first chunk
            Position position = Position::First;
        };

        struct ExtractionResponse
        {
            std::string markdown;
            std::int64_t input_tokens = 0;
            std::int64_t output_tokens = 0;
            std::int64_t cache_creation_tokens = 0;
            std::int64_t cache_read_tokens = 0;
            double cost = 0.0;
            std::string stop_reason;
        };

        // Converts one page window of a PDF into markdown with page sentinels.
        class Extractor
        {
        public:
            virtual ~Extractor() = default;

            // Throws ExtractionError if no usable response could be obtained.
            virtual ExtractionResponse extract(const ExtractionRequest &request) = 0;

            // Identity of the engine, recorded in the staging manifest
            virtual std::string modelId() const = 0;
        };

        // Runs an external command once per chunk:
        //
        //   <command> --pdf <path> --first N --last M --position first|middle|last
        //             --chunk I/T --model <id> [--context <file>]
        //
        // The command prints one JSON object on stdout:
        //   {"markdown": "...", "stop_reason": "end_turn", "input_tokens": 1200, ...}
        class CommandExtractor : public Extractor
        {
        public:
            CommandExtractor(std::string command, std::string model_id);

            ExtractionResponse extract(const ExtractionRequest &request) override;
            std::string modelId() const override { return model_id; }

        private:
            std::string command;
            std::string model_id;

            std::string buildCommandLine(const ExtractionRequest &request,
                                         const std::filesystem::path &context_file) const;
        };

        // Parse the JSON printed by an extraction command.
        // Throws ExtractionError if it is not an object with a "markdown" string.
        ExtractionResponse parseResponse(const std::string &text);

    } // namespace Extraction
} // namespace PageStitch
