// include/batcher.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "backup_model.hpp"

namespace SnapFetch
{
    namespace Download
    {

        class Batcher
        {
        public:
            // Split asset_ids, in order, into batches. A batch is closed as soon as its
            // cumulative size reaches threshold, so every batch but the last holds at least
            // threshold bytes and a single oversized asset forms a batch of its own.
            // Throws std::invalid_argument if threshold is zero.
            static std::vector<Model::Batch> batch(const std::vector<Model::AssetID> &asset_ids, std::uint64_t threshold);
        };

    } // namespace Download
} // namespace SnapFetch
