// main.cpp
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "batch_runner.hpp"
#include "extractor.hpp"

namespace fs = std::filesystem;

namespace
{
    const char *const DEFAULT_MODEL_ID = "default";

    void printUsage(const char *argv0)
    {
        std::cerr << "Usage: " << argv0
                  << " <pdf>... [--output-dir=DIR] [--pages-per-chunk=N] [--max-pages=N]"
                     " [--model=ID] [--extractor-cmd=CMD] [--force] [--remerge] [--no-format]"
                  << std::endl;
    }

    bool takeValue(const std::string &arg, const std::string &name, std::string &value)
    {
        const std::string prefix = name + "=";
        if (arg.rfind(prefix, 0) != 0)
        {
            return false;
        }
        value = arg.substr(prefix.size());
        return true;
    }

    int parsePositive(const std::string &name, const std::string &value)
    {
        size_t used = 0;
        int n = 0;
        try
        {
            n = std::stoi(value, &used);
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument(name + " expects a positive integer, got '" + value + "'");
        }
        if (used != value.size() || n <= 0)
        {
            throw std::invalid_argument(name + " expects a positive integer, got '" + value + "'");
        }
        return n;
    }
} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> pdf_args;
    PageStitch::Batch::BatchOptions options;
    std::string model_id = DEFAULT_MODEL_ID;
    std::string extractor_cmd;
    std::vector<fs::path> pdf_paths;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            std::string value;
            if (arg == "--force")
            {
                options.force = true;
            }
            else if (arg == "--remerge")
            {
                options.remerge = true;
            }
            else if (arg == "--no-format")
            {
                options.format_output = false;
            }
            else if (arg == "--help" || arg == "-h")
            {
                printUsage(argv[0]);
                return 0;
            }
            else if (takeValue(arg, "--output-dir", value))
            {
                options.output_dir = fs::path(value);
            }
            else if (takeValue(arg, "--pages-per-chunk", value))
            {
                options.pages_per_chunk = parsePositive("--pages-per-chunk", value);
            }
            else if (takeValue(arg, "--max-pages", value))
            {
                options.max_pages = parsePositive("--max-pages", value);
            }
            else if (takeValue(arg, "--model", value))
            {
                model_id = value;
            }
            else if (takeValue(arg, "--extractor-cmd", value))
            {
                extractor_cmd = value;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::invalid_argument("Unknown option: " + arg);
            }
            else
            {
                pdf_args.push_back(arg);
            }
        }

        if (pdf_args.empty())
        {
            throw std::invalid_argument("No PDF given");
        }
        if (options.force && options.remerge)
        {
            throw std::invalid_argument("--force and --remerge cannot be combined");
        }
        if (!options.remerge && extractor_cmd.empty())
        {
            throw std::invalid_argument("--extractor-cmd is required unless --remerge is given");
        }
        pdf_paths = PageStitch::Batch::resolvePdfPaths(pdf_args);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    try
    {
        std::optional<PageStitch::Extraction::CommandExtractor> extractor;
        if (!options.remerge)
        {
            extractor.emplace(extractor_cmd, model_id);
        }

        PageStitch::Batch::BatchSummary summary =
            PageStitch::Batch::runBatch(pdf_paths, extractor ? &*extractor : nullptr, options);
        return summary.exitCode();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
