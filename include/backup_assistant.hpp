// include/backup_assistant.hpp
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "backup_model.hpp"

namespace SnapFetch
{
    namespace Download
    {

        using DeviceSnapshots = std::map<Model::Device, std::vector<Model::Snapshot>>;

        // Account, device and manifest lookups against the backup service.
        // Implementations report transport faults as Errors::IOError.
        class BackupAssistant
        {
        public:
            virtual ~BackupAssistant() = default;

            virtual std::optional<Model::BackupAccount> backupAccount(const Model::Session &session) = 0;

            virtual std::vector<Model::Device> devices(const Model::Session &session,
                                                       const std::vector<std::string> &device_ids) = 0;

            virtual DeviceSnapshots deviceSnapshots(const Model::Session &session,
                                                    const std::vector<Model::Device> &devices) = 0;

            // Asset groups of one snapshot's manifest.
            virtual std::vector<Model::AssetGroup> assetsList(const Model::Session &session,
                                                              const Model::Snapshot &snapshot) = 0;

            // Detail records for one batch of asset ids. Called from worker threads.
            virtual std::vector<Model::Asset> assets(const Model::Session &session, const Model::Batch &batch) = 0;
        };

        // Fetches asset bytes and stores them. Called concurrently from worker threads,
        // one call per batch.
        class DownloadAssistant
        {
        public:
            virtual ~DownloadAssistant() = default;

            virtual void download(const Model::Session &session,
                                  const std::vector<Model::Asset> &assets,
                                  const std::filesystem::path &relative_path) = 0;
        };

        // Transport for asset content: the chunks of one asset in file order.
        class ChunkSource
        {
        public:
            struct ChunkData
            {
                // Empty when the service does not report one.
                Checksum::Bytes checksum;
                std::vector<char> data;
            };

            virtual ~ChunkSource() = default;

            virtual std::vector<ChunkData> chunks(const Model::Session &session, const Model::Asset &asset) = 0;
        };

    } // namespace Download
} // namespace SnapFetch
