// include/asset_writer.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "backup_model.hpp"
#include "chunk.hpp"

namespace SnapFetch
{
    namespace Download
    {

        // Reassembles an asset file from its ordered chunks.
        class AssetWriter
        {
        public:
            // root/relative_path/domain/asset.relative_path
            static std::filesystem::path assetPath(const std::filesystem::path &root,
                                                   const std::filesystem::path &relative_path,
                                                   const Model::Asset &asset);

            // Write the chunks, in order, to destination (parent directories are created).
            // Returns the number of bytes written. If asset.size is non-zero it must match.
            // On any failure the partial file is removed and Errors::IOError is thrown.
            static std::uint64_t write(const Model::Asset &asset,
                                       const std::vector<std::shared_ptr<const Chunks::Chunk>> &chunks,
                                       const std::filesystem::path &destination);
        };

    } // namespace Download
} // namespace SnapFetch
