// include/backup.hpp
#pragma once

#include <filesystem>
#include <functional> // For std::function
#include <memory>
#include <vector>

#include "backup_assistant.hpp"
#include "backup_model.hpp"
#include "cancellation_token.hpp"
#include "download_config.hpp"
#include "parallel_dispatcher.hpp"
#include "thread_pool.hpp"

namespace SnapFetch
{
    namespace Download
    {

        using AssetGroupFilter = std::function<bool(const Model::AssetGroup &)>;
        using AssetFilter = std::function<bool(const Model::Asset &)>;

        // Downloads snapshots: lists each snapshot's assets, batches them by size and
        // hands the batches to the download assistant on a worker pool.
        class Backup
        {
        public:
            // pool may be shared between Backup instances and may outlive this one; a
            // pool of config.threads workers is created when it is null.
            Backup(std::shared_ptr<BackupAssistant> backup_assistant,
                   std::shared_ptr<DownloadAssistant> download_assistant,
                   const Config::DownloadConfig &config = Config::DownloadConfig(),
                   std::shared_ptr<Concurrency::ThreadPool> pool = nullptr);

            // Every device of the session's backup account with its snapshots.
            // Empty if the session has no backup account.
            DeviceSnapshots snapshots(const Model::Session &session);

            void download(const Model::Session &session,
                          const DeviceSnapshots &device_snapshots,
                          const AssetGroupFilter &assets_filter,
                          const AssetFilter &asset_filter);

            void download(const Model::Session &session,
                          const Model::Device &device,
                          const Model::Snapshot &snapshot,
                          const AssetGroupFilter &assets_filter,
                          const AssetFilter &asset_filter);

            // <UPPERCASE device id>/<yyyyMMdd of the snapshot date, or of its modification time, in UTC>
            std::filesystem::path deviceSnapshotDateSubPath(const Model::Device &device,
                                                            const Model::Snapshot &snapshot) const;

            // Interrupt a running download. Outstanding batches are skipped and
            // download() returns without throwing; the token stays cancelled.
            void cancel() { cancellation.cancel(); }
            Concurrency::CancellationToken &cancellationToken() { return cancellation; }

            const Config::DownloadConfig &config() const { return download_config; }

        private:
            std::shared_ptr<BackupAssistant> backup_assistant;
            std::shared_ptr<DownloadAssistant> download_assistant;
            Config::DownloadConfig download_config;
            Concurrency::CancellationToken cancellation;
            // Last member: an owned pool is joined before the assistants are released.
            Concurrency::ParallelDispatcher dispatcher;

            void doDownloads(const Model::Session &session,
                             const std::vector<Model::Batch> &batches,
                             const AssetFilter &asset_filter,
                             const std::filesystem::path &relative_path);

            static void doDownload(BackupAssistant &backups,
                                   DownloadAssistant &downloads,
                                   const Model::Session &session,
                                   const Model::Batch &batch,
                                   const AssetFilter &asset_filter,
                                   const std::filesystem::path &relative_path);
        };

    } // namespace Download
} // namespace SnapFetch
