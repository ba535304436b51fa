// src/source_document.cpp
#include "source_document.hpp"
#include "command_runner.hpp"

#include <sstream>
#include <stdexcept>
#include <sys/stat.h> // For ::stat

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Source
    {

        SourceIdentity identify(const fs::path &file_path)
        {
            if (!fs::exists(file_path))
            {
                throw std::runtime_error("Source file not found: " + file_path.string());
            }

            struct stat st;
            if (::stat(file_path.c_str(), &st) != 0)
            {
                throw std::runtime_error("Failed to stat source file: " + file_path.string());
            }

            SourceIdentity identity;
            identity.size = static_cast<std::uint64_t>(st.st_size);
            identity.mtime = static_cast<double>(st.st_mtim.tv_sec) +
                             static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
            return identity;
        }

        int parsePdfinfoPages(const std::string &pdfinfo_output)
        {
            std::istringstream lines(pdfinfo_output);
            std::string line;
            const std::string key = "Pages:";
            while (std::getline(lines, line))
            {
                if (line.compare(0, key.size(), key) != 0) continue;
                try
                {
                    return std::stoi(line.substr(key.size()));
                }
                catch (const std::logic_error&)
                {
                    return 0;
                }
            }
            return 0;
        }

        int pageCount(const fs::path &pdf_path)
        {
            if (!Process::commandExists("pdfinfo"))
            {
                throw std::runtime_error("pdfinfo not found. Install poppler-utils (e.g., sudo apt install poppler-utils).");
            }

            std::string cmd = "pdfinfo " + Process::shellQuote(pdf_path.string()) + " 2>/dev/null";
            Process::CommandOutput result = Process::runCommand(cmd);
            if (result.exit_code != 0)
            {
                throw std::runtime_error("pdfinfo failed for " + pdf_path.string() +
                                         " (exit code " + std::to_string(result.exit_code) + ")");
            }

            int pages = parsePdfinfoPages(result.output);
            if (pages <= 0)
            {
                throw std::runtime_error("Could not determine page count of " + pdf_path.string());
            }
            return pages;
        }

    } // namespace Source
} // namespace PageStitch
