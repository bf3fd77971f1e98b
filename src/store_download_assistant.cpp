// src/store_download_assistant.cpp
#include "store_download_assistant.hpp"
#include "asset_writer.hpp"
#include "checksum_utility.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <fstream>
#include <stdexcept> // For std::invalid_argument
#include <system_error>

namespace fs = std::filesystem;

namespace SnapFetch
{
    namespace Download
    {

        namespace
        {
            std::shared_ptr<ChunkSource> requireSource(std::shared_ptr<ChunkSource> source)
            {
                if (!source)
                {
                    throw std::invalid_argument("StoreDownloadAssistant requires a chunk source.");
                }
                return source;
            }
        }

        StoreDownloadAssistant::StoreDownloadAssistant(std::shared_ptr<ChunkSource> source,
                                                       const Config::DownloadConfig &config)
            : source_(requireSource(std::move(source))),
              store_(config.chunks_dir),
              output_dir_(Config::DownloadConfig::ensureDirectoryExists(config.output_dir))
        {
        }

        void StoreDownloadAssistant::download(const Model::Session &session,
                                              const std::vector<Model::Asset> &assets,
                                              const fs::path &relative_path)
        {
            for (const Model::Asset &asset : assets)
            {
                downloadAsset(session, asset, relative_path);
            }
            Logging::logger()->debug("-- download() - assets: {} into: {}", assets.size(),
                                     (output_dir_ / relative_path).string());
        }

        void StoreDownloadAssistant::downloadAsset(const Model::Session &session, const Model::Asset &asset,
                                                   const fs::path &relative_path)
        {
            std::vector<std::shared_ptr<const Chunks::Chunk>> chunks;
            for (const ChunkSource::ChunkData &part : source_->chunks(session, asset))
            {
                chunks.push_back(part.checksum.empty() ? store_.put(part.data) : store_.put(part.checksum, part.data));
            }

            fs::path destination = AssetWriter::assetPath(output_dir_, relative_path, asset);
            AssetWriter::write(asset, chunks, destination);

            if (!asset.file_checksum)
            {
                return;
            }

            Checksum::Bytes actual;
            {
                std::ifstream ifs(destination, std::ios::binary);
                if (!ifs.is_open())
                {
                    throw Errors::IOError("Failed to reopen asset for verification: " + destination.string());
                }
                actual = Checksum::ChecksumUtility::sha256(ifs);
            }
            if (actual != *asset.file_checksum)
            {
                std::error_code ec;
                fs::remove(destination, ec);
                throw Errors::ChecksumError("Asset " + asset.id + " does not match its file checksum " +
                                            Checksum::ChecksumUtility::toHex(*asset.file_checksum));
            }
        }

    } // namespace Download
} // namespace SnapFetch
