// include/staging_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path

namespace PageStitch
{
    namespace Config
    {

        class StagingConfig
        {
        public:
            // Conversion defaults
            static constexpr int DEFAULT_PAGES_PER_CHUNK = 10;

            // Hard per-request page limit of the extraction service
            static constexpr int MAX_PAGES_PER_CHUNK = 100;

            // Context tail: at least this many whole pages, extended until
            // the tail has CONTEXT_MIN_LINES lines
            static constexpr int CONTEXT_MIN_PAGES = 3;
            static constexpr int CONTEXT_MIN_LINES = 200;

            // Bumped whenever the manifest layout changes
            static constexpr int MANIFEST_VERSION = 1;

            // Names of the files and directories inside a staging area
            static const std::string CHUNKS_DIR_NAME;
            static const std::string MANIFEST_FILE_NAME;
            static const std::string STATS_FILE_NAME;
            static const std::string MERGED_FILE_NAME;

            explicit StagingConfig(std::filesystem::path staging_root);

            // Root of the staging area (e.g. "report.staging")
            const std::filesystem::path &getRootPath() const { return root; }

            // Paths inside the staging area; nothing is created on disk
            std::filesystem::path chunksDirPath() const { return root / CHUNKS_DIR_NAME; }

            std::filesystem::path manifestPath() const { return root / MANIFEST_FILE_NAME; }
            std::filesystem::path statsPath() const { return chunksDirPath() / STATS_FILE_NAME; }
            std::filesystem::path mergedPath() const { return root / MERGED_FILE_NAME; }

            // Per-chunk file names are 1-indexed and zero-padded:
            // chunk_01.md, chunk_01_context.md, chunk_01_meta.json
            std::filesystem::path payloadPath(int index) const;
            std::filesystem::path contextPath(int index) const;
            std::filesystem::path metaPath(int index) const;

            // Create the root and chunks directories
            void ensureLayout() const;

        private:
            std::filesystem::path root;

            static std::string chunkStem(int index);

            // Helper to ensure directories exist
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

    } // namespace Config
} // namespace PageStitch
