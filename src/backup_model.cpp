// src/backup_model.cpp
#include "backup_model.hpp"
#include <algorithm> // For std::copy_if
#include <iterator>

namespace SnapFetch
{
    namespace Model
    {

        std::vector<AssetID> AssetGroup::nonEmpty() const
        {
            std::vector<AssetID> result;
            std::copy_if(assets.begin(), assets.end(), std::back_inserter(result),
                         [](const AssetID &asset_id) { return asset_id.size > 0; });
            return result;
        }

        std::string toString(const AssetID &asset_id)
        {
            return asset_id.id + ":" + std::to_string(asset_id.size);
        }

        std::string toString(const Batch &batch)
        {
            std::string out = "[";
            for (size_t i = 0; i < batch.size(); ++i)
            {
                if (i > 0)
                {
                    out += ", ";
                }
                out += toString(batch[i]);
            }
            out += "]";
            return out;
        }

    } // namespace Model
} // namespace SnapFetch
