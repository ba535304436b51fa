// include/source_document.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace PageStitch
{
    namespace Source
    {

        // Identity of a source file as recorded in the staging manifest.
        // A change of either field means cached chunks are stale.
        struct SourceIdentity
        {
            std::uint64_t size = 0;  // bytes
            double mtime = 0.0;      // seconds since epoch, sub-second precision
        };

        // Throws std::runtime_error if the file does not exist or cannot be stat'ed.
        SourceIdentity identify(const std::filesystem::path &file_path);

        // Number of pages in a PDF, read from `pdfinfo` (poppler-utils).
        // Throws std::runtime_error if pdfinfo is missing or reports no page count.
        int pageCount(const std::filesystem::path &pdf_path);

        // Parse the "Pages:" line of pdfinfo output; 0 if there is none.
        int parsePdfinfoPages(const std::string &pdfinfo_output);

    } // namespace Source
} // namespace PageStitch
