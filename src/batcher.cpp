// src/batcher.cpp
#include "batcher.hpp"
#include "logging.hpp"
#include <stdexcept> // For std::invalid_argument

namespace SnapFetch
{
    namespace Download
    {

        std::vector<Model::Batch> Batcher::batch(const std::vector<Model::AssetID> &asset_ids, std::uint64_t threshold)
        {
            if (threshold == 0)
            {
                throw std::invalid_argument("Batch threshold must be positive.");
            }

            auto logger = Logging::logger();
            std::vector<Model::Batch> batches;
            Model::Batch current;
            std::uint64_t bytes = 0;

            for (const Model::AssetID &asset_id : asset_ids)
            {
                current.push_back(asset_id);
                bytes += asset_id.size;
                if (bytes >= threshold)
                {
                    logger->debug("-- batch() - batch list: {} bytes: {}", current.size(), bytes);
                    batches.push_back(std::move(current));
                    current = Model::Batch();
                    bytes = 0;
                }
            }

            // Remainder that never reached the threshold
            if (!current.empty())
            {
                logger->debug("-- batch() - batch list: {} bytes: {}", current.size(), bytes);
                batches.push_back(std::move(current));
            }
            return batches;
        }

    } // namespace Download
} // namespace SnapFetch
