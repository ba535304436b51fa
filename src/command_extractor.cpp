// src/command_extractor.cpp
#include "extractor.hpp"
#include "command_runner.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <system_error>
#include <unistd.h> // For getpid

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Extraction
    {

        const std::string STOP_MAX_TOKENS = "max_tokens";

        namespace
        {
            // Shell exit status for "command not found"
            constexpr int EXIT_COMMAND_NOT_FOUND = 127;

            // Temporary file holding the previous chunk's context tail;
            // removed when the guard goes out of scope.
            class ContextFile
            {
            public:
                ContextFile(const std::string &context, int chunk_index)
                {
                    if (context.empty())
                    {
                        return;
                    }
                    file_path = fs::temp_directory_path() /
                                ("pagestitch_context_" + std::to_string(getpid()) + "_" +
                                 std::to_string(chunk_index + 1) + ".md");
                    std::ofstream ofs(file_path, std::ios::binary | std::ios::trunc);
                    if (!ofs.is_open())
                    {
                        throw ExtractionError("Failed to create context file: " + file_path.string());
                    }
                    ofs.write(context.data(), static_cast<std::streamsize>(context.size()));
                    if (!ofs.good())
                    {
                        throw ExtractionError("Failed to write context file: " + file_path.string());
                    }
                }

                ~ContextFile()
                {
                    if (!file_path.empty())
                    {
                        std::error_code ec;
                        fs::remove(file_path, ec);
                    }
                }

                ContextFile(const ContextFile &) = delete;
                ContextFile &operator=(const ContextFile &) = delete;

                const fs::path &path() const { return file_path; }

            private:
                fs::path file_path;
            };

            std::int64_t tokenField(const nlohmann::json &j, const char *key)
            {
                if (!j.contains(key) || j.at(key).is_null())
                {
                    return 0;
                }
                return j.at(key).get<std::int64_t>();
            }
        } // namespace

        Position positionFor(const Chunks::ChunkPlan &plan)
        {
            if (plan.is_first)
                return Position::First;
            if (plan.is_last)
                return Position::Last;
            return Position::Middle;
        }

        std::string positionName(Position position)
        {
            switch (position)
            {
            case Position::First:
                return "first";
            case Position::Middle:
                return "middle";
            case Position::Last:
                return "last";
            }
            return "middle";
        }

        ExtractionResponse parseResponse(const std::string &text)
        {
            nlohmann::json j;
            try
            {
                j = nlohmann::json::parse(text);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw ExtractionError(std::string("Extraction command printed invalid JSON: ") + e.what());
            }

            if (!j.is_object() || !j.contains("markdown") || !j.at("markdown").is_string())
            {
                throw ExtractionError("Extraction response has no \"markdown\" string");
            }

            ExtractionResponse response;
            try
            {
                response.markdown = j.at("markdown").get<std::string>();
                response.stop_reason = j.value("stop_reason", std::string());
                response.input_tokens = tokenField(j, "input_tokens");
                response.output_tokens = tokenField(j, "output_tokens");
                response.cache_creation_tokens = tokenField(j, "cache_creation_tokens");
                response.cache_read_tokens = tokenField(j, "cache_read_tokens");
                response.cost = j.value("cost", 0.0);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ExtractionError(std::string("Malformed extraction response: ") + e.what());
            }
            return response;
        }

        CommandExtractor::CommandExtractor(std::string command, std::string model_id)
            : command(std::move(command)), model_id(std::move(model_id))
        {
            if (this->command.empty())
            {
                throw ExtractionError("No extraction command configured (use --extractor-cmd)");
            }
        }

        std::string CommandExtractor::buildCommandLine(const ExtractionRequest &request,
                                                       const fs::path &context_file) const
        {
            using Process::shellQuote;

            // The command itself is taken verbatim so it may carry its own arguments.
            std::string line = command;
            line += " --pdf " + shellQuote(request.source.string());
            line += " --first " + std::to_string(request.plan.page_start);
            line += " --last " + std::to_string(request.plan.page_end);
            line += " --position " + positionName(request.position);
            line += " --chunk " + std::to_string(request.plan.index + 1) + "/" +
                    std::to_string(request.total_chunks);
            line += " --model " + shellQuote(model_id);
            if (!context_file.empty())
            {
                line += " --context " + shellQuote(context_file.string());
            }
            return line;
        }

        ExtractionResponse CommandExtractor::extract(const ExtractionRequest &request)
        {
            ContextFile context(request.previous_context, request.plan.index);
            std::string line = buildCommandLine(request, context.path());

            Process::CommandOutput result;
            try
            {
                result = Process::runCommand(line);
            }
            catch (const std::runtime_error &e)
            {
                throw ExtractionError(e.what());
            }

            if (result.exit_code == EXIT_COMMAND_NOT_FOUND)
            {
                throw ExtractionError("Extraction command not found: " + command);
            }
            if (result.exit_code != 0)
            {
                throw ExtractionError("Extraction command failed for pages " +
                                      std::to_string(request.plan.page_start) + "-" +
                                      std::to_string(request.plan.page_end) + " (exit code " +
                                      std::to_string(result.exit_code) + ")");
            }

            return parseResponse(result.output);
        }

    } // namespace Extraction
} // namespace PageStitch
