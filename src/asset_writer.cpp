// src/asset_writer.cpp
#include "asset_writer.hpp"
#include "download_config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <fstream>

namespace fs = std::filesystem;

namespace SnapFetch
{
    namespace Download
    {

        fs::path AssetWriter::assetPath(const fs::path &root, const fs::path &relative_path, const Model::Asset &asset)
        {
            return root / relative_path / asset.domain / asset.relative_path;
        }

        std::uint64_t AssetWriter::write(const Model::Asset &asset,
                                         const std::vector<std::shared_ptr<const Chunks::Chunk>> &chunks,
                                         const fs::path &destination)
        {
            auto logger = Logging::logger();
            try
            {
                if (destination.has_parent_path())
                {
                    Config::DownloadConfig::ensureDirectoryExists(destination.parent_path());
                }

                std::ofstream ofs(destination, std::ios::binary | std::ios::trunc);
                if (!ofs.is_open())
                {
                    throw Errors::IOError("Failed to open output file for writing: " + destination.string());
                }

                std::uint64_t written = 0;
                for (const auto &chunk : chunks)
                {
                    if (!chunk)
                    {
                        throw Errors::IOError("Missing chunk for asset: " + asset.id);
                    }
                    written += chunk->copyTo(ofs);
                }
                ofs.flush();
                if (!ofs.good())
                {
                    throw Errors::IOError("Failed to write chunk data to output file: " + destination.string());
                }
                ofs.close();

                if (asset.size != 0 && written != asset.size)
                {
                    throw Errors::IOError("Asset " + asset.id + " size mismatch: expected " + std::to_string(asset.size) +
                                          " bytes, wrote " + std::to_string(written));
                }

                logger->debug("Asset '{}' written to '{}' ({} bytes).", asset.id, destination.string(), written);
                return written;
            }
            catch (const std::exception &e)
            {
                logger->error("Error writing asset '{}': {}", asset.id, e.what());
                // Clean up partially written file if error occurs
                std::error_code ec;
                fs::remove(destination, ec);
                if (ec)
                {
                    logger->warn("Could not remove partial file {}: {}", destination.string(), ec.message());
                }
                if (dynamic_cast<const Errors::IOError *>(&e))
                {
                    throw;
                }
                throw Errors::IOError("Failed to write asset " + asset.id + ": " + e.what());
            }
        }

    } // namespace Download
} // namespace SnapFetch
