// include/backup_model.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "checksum_utility.hpp"

namespace SnapFetch {
namespace Model {

using Timestamp = std::chrono::system_clock::time_point;

// Opaque caller state threaded through every external call. The core never inspects it.
struct Session {
    std::string account_id;
    std::string token;
};

struct BackupAccount {
    std::string hash;
    std::vector<std::string> device_ids;
};

struct Device {
    std::string device_id;              // hex hash
    std::set<std::string> snapshot_ids;
    std::string info;

    bool operator<(const Device& other) const { return device_id < other.device_id; }
    bool operator==(const Device& other) const { return device_id == other.device_id; }
};

struct Snapshot {
    std::string snapshot_id;
    std::optional<Timestamp> date;
    Timestamp modification;
    std::string info;
};

// Reference to one content item awaiting retrieval. size only weighs batches.
struct AssetID {
    std::string id;
    std::uint64_t size = 0;

    bool operator==(const AssetID& other) const { return id == other.id && size == other.size; }
};

using Batch = std::vector<AssetID>;

// Per-domain asset list from a snapshot's manifest.
struct AssetGroup {
    std::string domain;
    std::vector<AssetID> assets;

    // Assets with content. Zero length assets have nothing to fetch.
    std::vector<AssetID> nonEmpty() const;
};

// Detail record for one item, as returned by the item detail fetch.
struct Asset {
    std::string id;
    std::string domain;
    std::string relative_path;
    std::uint64_t size = 0;
    std::optional<Checksum::Bytes> file_checksum;
};

std::string toString(const AssetID& asset_id);
std::string toString(const Batch& batch);

} // namespace Model
} // namespace SnapFetch
