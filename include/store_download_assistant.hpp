// include/store_download_assistant.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "backup_assistant.hpp"
#include "disk_chunk_store.hpp"
#include "download_config.hpp"

namespace SnapFetch
{
    namespace Download
    {

        // DownloadAssistant that files every fetched chunk in a DiskChunkStore rooted at
        // config.chunks_dir, then reassembles each asset under config.output_dir.
        class StoreDownloadAssistant : public DownloadAssistant
        {
        public:
            // Creates both directories. Throws std::invalid_argument on a null source.
            StoreDownloadAssistant(std::shared_ptr<ChunkSource> source, const Config::DownloadConfig &config);

            // Chunks with a checksum are verified before they are stored. An asset with a
            // file_checksum is re-hashed after it is written; a mismatch removes the file
            // and throws Errors::ChecksumError.
            void download(const Model::Session &session,
                          const std::vector<Model::Asset> &assets,
                          const std::filesystem::path &relative_path) override;

            const Chunks::DiskChunkStore &store() const { return store_; }
            const std::filesystem::path &outputDir() const { return output_dir_; }

        private:
            std::shared_ptr<ChunkSource> source_;
            Chunks::DiskChunkStore store_;
            std::filesystem::path output_dir_;

            void downloadAsset(const Model::Session &session, const Model::Asset &asset,
                               const std::filesystem::path &relative_path);
        };

    } // namespace Download
} // namespace SnapFetch
