// include/staging_store.hpp
#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "staging_config.hpp"
#include "staging_records.hpp"
#include "errors.hpp"

namespace PageStitch
{
    namespace Staging
    {

        // Durable per-chunk staging area for one document conversion.
        //
        // Every chunk is persisted as three files: payload markdown, context
        // tail and usage metadata. The metadata file is written last and its
        // presence alone defines a complete chunk, so a crash in the middle of
        // save() reads back as "not done".
        //
        // A manifest records the conversion parameters. If any of them change
        // between runs, every cached chunk is discarded.
        //
        // Single writer per staging directory; no locking is done.
        class StagingStore
        {
        public:
            // The directory is not created until createOrValidate() is called.
            explicit StagingStore(std::filesystem::path staging_root);

            const std::filesystem::path &path() const { return config.getRootPath(); }
            const Config::StagingConfig &getConfig() const { return config; }
            bool exists() const;

            // Create or validate the staging area against the manifest.
            // Returns the 0-based indices of chunks already complete on disk
            // (empty for a fresh or invalidated staging area). Only these may
            // be reused; chunk files found without any manifest are deleted.
            // Throws StagingCorruptionError if the stored manifest is unreadable.
            std::vector<int> createOrValidate(const Records::Manifest &manifest);

            // Persist a chunk: context tail, then payload, then metadata.
            // The payload digest is recorded in the metadata.
            void save(int index,
                      const std::string &payload,
                      const std::string &context_tail,
                      const Records::ChunkUsage &usage);

            // True iff the metadata file for the chunk exists.
            bool has(int index) const;

            // Throws StagingCorruptionError if the payload does not match the
            // digest recorded in its metadata.
            std::string loadPayload(int index) const;

            // Missing context file yields "" (no previous context).
            std::string loadContext(int index) const;

            // Throws StagingCorruptionError if the metadata is unparseable.
            Records::ChunkUsage loadUsage(int index) const;

            // Delete all chunks, stats, merged output and the manifest.
            // Leaves an empty, usable staging layout. Safe to call if nothing
            // exists yet.
            void invalidate();

            // Manifest on disk, or empty if missing or corrupt. Never throws.
            std::optional<Records::Manifest> loadManifest() const;

            // Values from the manifest (lazy-loaded from disk).
            // Throw std::runtime_error if no manifest exists.
            int chunkCount();
            int totalPages();

            // Aggregate usage summary for the whole run.
            void saveStats(const Records::DocumentStats &stats) const;
            // Empty if missing; a corrupt stats file is logged and ignored.
            std::optional<Records::DocumentStats> loadStats() const;

            // Merged (pre-splice) document of the last merge.
            void saveOutput(const std::string &markdown) const;
            std::optional<std::string> loadOutput() const;

        private:
            Config::StagingConfig config;
            std::optional<Records::Manifest> manifest;

            const Records::Manifest &requireManifest();
            bool hasChunkRecords() const;
            static Records::Manifest readManifest(const std::filesystem::path &manifest_path);
        };

    } // namespace Staging
} // namespace PageStitch
