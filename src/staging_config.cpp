// src/staging_config.cpp
#include "staging_config.hpp"
#include <iomanip>   // For std::setw, std::setfill
#include <iostream>
#include <sstream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Config
    {

        const std::string StagingConfig::CHUNKS_DIR_NAME = "chunks";
        const std::string StagingConfig::MANIFEST_FILE_NAME = "manifest.json";
        const std::string StagingConfig::STATS_FILE_NAME = "stats.json";
        const std::string StagingConfig::MERGED_FILE_NAME = "merged.md";

        StagingConfig::StagingConfig(fs::path staging_root) : root(std::move(staging_root))
        {
        }

        fs::path StagingConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        std::cout << "Created directory: " << dir_path << std::endl;
                    }
                    else if (!fs::exists(dir_path))
                    {
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        void StagingConfig::ensureLayout() const
        {
            ensureDirectoryExists(root);
            ensureDirectoryExists(chunksDirPath());
        }

        std::string StagingConfig::chunkStem(int index)
        {
            std::ostringstream ss;
            ss << "chunk_" << std::setw(2) << std::setfill('0') << (index + 1);
            return ss.str();
        }

        fs::path StagingConfig::payloadPath(int index) const
        {
            return chunksDirPath() / (chunkStem(index) + ".md");
        }

        fs::path StagingConfig::contextPath(int index) const
        {
            return chunksDirPath() / (chunkStem(index) + "_context.md");
        }

        fs::path StagingConfig::metaPath(int index) const
        {
            return chunksDirPath() / (chunkStem(index) + "_meta.json");
        }

    } // namespace Config
} // namespace PageStitch
