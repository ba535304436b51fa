// src/staging_store.cpp
#include "staging_store.hpp"
#include "digest_utility.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept> // For std::runtime_error

namespace fs = std::filesystem;

namespace PageStitch
{
    namespace Staging
    {

        namespace
        {
            std::string readTextFile(const fs::path &file_path)
            {
                if (!fs::exists(file_path))
                {
                    throw std::runtime_error("Staged file not found: " + file_path.string());
                }

                std::ifstream ifs(file_path, std::ios::binary);
                if (!ifs.is_open())
                {
                    throw std::runtime_error("Failed to open staged file for reading: " + file_path.string());
                }
                std::ostringstream ss;
                ss << ifs.rdbuf();
                if (ifs.bad())
                {
                    throw std::runtime_error("Failed to read all data from staged file: " + file_path.string());
                }
                return ss.str();
            }

            void writeTextFile(const fs::path &file_path, const std::string &text)
            {
                std::ofstream ofs(file_path, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw std::runtime_error("Failed to open file for writing: " + file_path.string());
                }
                ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
                ofs.flush();
                if (!ofs.good())
                {
                    throw std::runtime_error("Failed to write all data to file: " + file_path.string());
                }
            }

            // Write to a sibling temp file, then rename over the target, so the
            // target is either absent or complete.
            void writeTextFileAtomic(const fs::path &file_path, const std::string &text)
            {
                fs::path tmp_path = file_path;
                tmp_path += ".tmp";
                writeTextFile(tmp_path, text);
                try
                {
                    fs::rename(tmp_path, file_path);
                }
                catch (const fs::filesystem_error &e)
                {
                    throw std::runtime_error("Failed to move " + tmp_path.string() + " into place: " + e.what());
                }
            }

            std::string dumpJson(const nlohmann::json &j)
            {
                return j.dump(2) + "\n";
            }

            nlohmann::json parseJsonFile(const fs::path &file_path, const std::string &what)
            {
                std::string text = readTextFile(file_path);
                try
                {
                    return nlohmann::json::parse(text);
                }
                catch (const nlohmann::json::parse_error &e)
                {
                    throw StagingCorruptionError("Corrupt " + what + " in " + file_path.string() +
                                                 ". Re-run with --force to rebuild: " + e.what());
                }
            }
        } // namespace

        StagingStore::StagingStore(fs::path staging_root) : config(std::move(staging_root))
        {
        }

        bool StagingStore::exists() const
        {
            return fs::exists(config.getRootPath());
        }

        Records::Manifest StagingStore::readManifest(const fs::path &manifest_path)
        {
            nlohmann::json j = parseJsonFile(manifest_path, "manifest");
            try
            {
                return j.get<Records::Manifest>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw StagingCorruptionError("Corrupt manifest in " + manifest_path.string() +
                                             ". Re-run with --force to rebuild: " + e.what());
            }
        }

        std::vector<int> StagingStore::createOrValidate(const Records::Manifest &new_manifest)
        {
            config.ensureLayout();
            fs::path manifest_path = config.manifestPath();

            if (fs::exists(manifest_path))
            {
                Records::Manifest existing = readManifest(manifest_path);
                if (existing == new_manifest)
                {
                    manifest = existing;
                    std::vector<int> cached;
                    for (int i = 0; i < new_manifest.num_chunks; ++i)
                    {
                        if (has(i))
                        {
                            cached.push_back(i);
                        }
                    }
                    if (!cached.empty())
                    {
                        std::cout << "StagingStore: " << cached.size() << "/" << new_manifest.num_chunks
                                  << " chunks cached in " << config.getRootPath() << std::endl;
                    }
                    return cached;
                }

                std::cerr << "Warning: StagingStore manifest mismatch, invalidating "
                          << config.getRootPath() << std::endl;
                invalidate();
            }
            else if (hasChunkRecords())
            {
                // Records of unknown parameters can never be trusted
                std::cerr << "Warning: StagingStore found chunk files without a manifest, invalidating "
                          << config.getRootPath() << std::endl;
                invalidate();
            }

            writeTextFileAtomic(manifest_path, dumpJson(new_manifest));
            manifest = new_manifest;
            return {};
        }

        void StagingStore::save(int index,
                                const std::string &payload,
                                const std::string &context_tail,
                                const Records::ChunkUsage &usage)
        {
            config.ensureLayout();

            Records::ChunkUsage record = usage;
            record.payload_sha256 = Digest::DigestUtility::generateSHA256(payload);

            // Order matters: metadata last marks the chunk complete.
            writeTextFile(config.contextPath(index), context_tail);
            writeTextFile(config.payloadPath(index), payload);
            writeTextFileAtomic(config.metaPath(index), dumpJson(record));
        }

        bool StagingStore::hasChunkRecords() const
        {
            fs::path chunks_dir = config.chunksDirPath();
            if (!fs::exists(chunks_dir))
            {
                return false;
            }
            return fs::directory_iterator(chunks_dir) != fs::directory_iterator();
        }

        bool StagingStore::has(int index) const
        {
            return fs::exists(config.metaPath(index));
        }

        std::string StagingStore::loadPayload(int index) const
        {
            std::string payload = readTextFile(config.payloadPath(index));
            if (has(index))
            {
                Records::ChunkUsage usage = loadUsage(index);
                if (!usage.payload_sha256.empty() &&
                    usage.payload_sha256 != Digest::DigestUtility::generateSHA256(payload))
                {
                    throw StagingCorruptionError("Chunk payload " + config.payloadPath(index).string() +
                                                 " does not match its recorded digest. "
                                                 "Re-run with --force to rebuild.");
                }
            }
            return payload;
        }

        std::string StagingStore::loadContext(int index) const
        {
            fs::path context_path = config.contextPath(index);
            if (!fs::exists(context_path))
            {
                return "";
            }
            return readTextFile(context_path);
        }

        Records::ChunkUsage StagingStore::loadUsage(int index) const
        {
            fs::path meta_path = config.metaPath(index);
            nlohmann::json j = parseJsonFile(meta_path, "chunk metadata");
            try
            {
                return j.get<Records::ChunkUsage>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw StagingCorruptionError("Corrupt chunk metadata in " + meta_path.string() +
                                             ". Re-run with --force to rebuild: " + e.what());
            }
        }

        void StagingStore::invalidate()
        {
            manifest.reset();
            if (!exists())
            {
                return;
            }
            try
            {
                fs::remove_all(config.getRootPath());
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Failed to clear staging directory " +
                                         config.getRootPath().string() + ": " + e.what());
            }
            config.ensureLayout();
            std::cout << "StagingStore: invalidated " << config.getRootPath() << std::endl;
        }

        std::optional<Records::Manifest> StagingStore::loadManifest() const
        {
            fs::path manifest_path = config.manifestPath();
            if (!fs::exists(manifest_path))
            {
                return std::nullopt;
            }
            try
            {
                return readManifest(manifest_path);
            }
            catch (const std::runtime_error &e)
            {
                std::cerr << "Warning: " << e.what() << std::endl;
                return std::nullopt;
            }
        }

        const Records::Manifest &StagingStore::requireManifest()
        {
            if (!manifest)
            {
                fs::path manifest_path = config.manifestPath();
                if (!fs::exists(manifest_path))
                {
                    throw std::runtime_error("Staging manifest not found in " + config.getRootPath().string() +
                                             "; run a conversion first");
                }
                manifest = readManifest(manifest_path);
            }
            return *manifest;
        }

        int StagingStore::chunkCount()
        {
            return requireManifest().num_chunks;
        }

        int StagingStore::totalPages()
        {
            return requireManifest().total_pages;
        }

        void StagingStore::saveStats(const Records::DocumentStats &stats) const
        {
            config.ensureLayout();
            writeTextFileAtomic(config.statsPath(), dumpJson(stats));
        }

        std::optional<Records::DocumentStats> StagingStore::loadStats() const
        {
            fs::path stats_path = config.statsPath();
            if (!fs::exists(stats_path))
            {
                return std::nullopt;
            }
            try
            {
                return parseJsonFile(stats_path, "stats file").get<Records::DocumentStats>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Warning: ignoring stats file " << stats_path << ": " << e.what() << std::endl;
                return std::nullopt;
            }
        }

        void StagingStore::saveOutput(const std::string &markdown) const
        {
            config.ensureLayout();
            writeTextFile(config.mergedPath(), markdown);
        }

        std::optional<std::string> StagingStore::loadOutput() const
        {
            fs::path merged_path = config.mergedPath();
            if (!fs::exists(merged_path))
            {
                return std::nullopt;
            }
            return readTextFile(merged_path);
        }

    } // namespace Staging
} // namespace PageStitch
