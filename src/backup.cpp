// src/backup.cpp
#include "backup.hpp"
#include "batcher.hpp"
#include "logging.hpp"
#include <algorithm> // For std::copy_if, std::transform
#include <cctype>    // For std::toupper
#include <ctime>
#include <iterator>
#include <stdexcept> // For std::invalid_argument

namespace fs = std::filesystem;

namespace SnapFetch
{
    namespace Download
    {

        namespace
        {
            std::shared_ptr<Concurrency::ThreadPool> poolOrDefault(std::shared_ptr<Concurrency::ThreadPool> pool,
                                                                   const Config::DownloadConfig &config)
            {
                if (pool)
                {
                    return pool;
                }
                return std::make_shared<Concurrency::ThreadPool>(config.threads);
            }

            // yyyyMMdd in UTC
            std::string basicIsoDate(Model::Timestamp timestamp)
            {
                std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
                std::tm utc{};
                if (gmtime_r(&t, &utc) == nullptr)
                {
                    throw std::runtime_error("Snapshot timestamp out of range.");
                }
                char buf[16];
                std::strftime(buf, sizeof(buf), "%Y%m%d", &utc);
                return buf;
            }
        }

        Backup::Backup(std::shared_ptr<BackupAssistant> backup_assistant,
                       std::shared_ptr<DownloadAssistant> download_assistant,
                       const Config::DownloadConfig &config,
                       std::shared_ptr<Concurrency::ThreadPool> pool)
            : backup_assistant(std::move(backup_assistant)),
              download_assistant(std::move(download_assistant)),
              download_config(config),
              dispatcher(poolOrDefault(std::move(pool), config))
        {
            if (!this->backup_assistant)
            {
                throw std::invalid_argument("Backup requires a backup assistant.");
            }
            if (!this->download_assistant)
            {
                throw std::invalid_argument("Backup requires a download assistant.");
            }
            download_config.validate();
        }

        DeviceSnapshots Backup::snapshots(const Model::Session &session)
        {
            auto logger = Logging::logger();

            std::optional<Model::BackupAccount> backup_account = backup_assistant->backupAccount(session);
            if (!backup_account)
            {
                logger->info("No backups found for account {}.", session.account_id);
                return {};
            }
            logger->debug("-- snapshots() - backup account: {} devices: {}", backup_account->hash,
                          backup_account->device_ids.size());

            std::vector<Model::Device> devices = backup_assistant->devices(session, backup_account->device_ids);
            logger->debug("-- snapshots() - device count: {}", devices.size());

            DeviceSnapshots device_snapshots = backup_assistant->deviceSnapshots(session, devices);
            size_t snapshot_count = 0;
            for (const auto &entry : device_snapshots)
            {
                snapshot_count += entry.second.size();
            }
            logger->debug("-- snapshots() - snapshot count: {}", snapshot_count);
            return device_snapshots;
        }

        void Backup::download(const Model::Session &session,
                              const DeviceSnapshots &device_snapshots,
                              const AssetGroupFilter &assets_filter,
                              const AssetFilter &asset_filter)
        {
            for (const auto &entry : device_snapshots)
            {
                for (const Model::Snapshot &snapshot : entry.second)
                {
                    if (cancellation.isCancelled())
                    {
                        Logging::logger()->warn("-- download() - interrupted before snapshot {}", snapshot.snapshot_id);
                        return;
                    }
                    download(session, entry.first, snapshot, assets_filter, asset_filter);
                }
            }
        }

        void Backup::download(const Model::Session &session,
                              const Model::Device &device,
                              const Model::Snapshot &snapshot,
                              const AssetGroupFilter &assets_filter,
                              const AssetFilter &asset_filter)
        {
            auto logger = Logging::logger();

            std::vector<Model::AssetGroup> assets_list = backup_assistant->assetsList(session, snapshot);
            logger->debug("-- download() - assets count: {}", assets_list.size());

            std::vector<Model::AssetGroup> assets;
            std::copy_if(assets_list.begin(), assets_list.end(), std::back_inserter(assets),
                         [&assets_filter](const Model::AssetGroup &group)
                         { return !assets_filter || assets_filter(group); });
            logger->debug("-- download() - assets/ domain filtered count: {}", assets.size());

            fs::path relative_path = deviceSnapshotDateSubPath(device, snapshot);
            logger->info("-- download() - snapshot relative path: {}", relative_path.string());

            // Zero length assets are dropped here; they have no bytes to fetch.
            std::vector<Model::AssetID> asset_ids;
            for (const Model::AssetGroup &group : assets)
            {
                std::vector<Model::AssetID> non_empty = group.nonEmpty();
                asset_ids.insert(asset_ids.end(), non_empty.begin(), non_empty.end());
            }

            std::vector<Model::Batch> batches = Batcher::batch(asset_ids, download_config.batch_size);
            doDownloads(session, batches, asset_filter, relative_path);
        }

        void Backup::doDownloads(const Model::Session &session,
                                 const std::vector<Model::Batch> &batches,
                                 const AssetFilter &asset_filter,
                                 const fs::path &relative_path)
        {
            // Tasks may still be running after an interrupted dispatch returns, and a shared
            // pool can outlive this Backup, so they own everything they touch.
            std::shared_ptr<BackupAssistant> backups = backup_assistant;
            std::shared_ptr<DownloadAssistant> downloads = download_assistant;
            Concurrency::ParallelDispatcher::Work work =
                [backups, downloads, session, asset_filter, relative_path](const Model::Batch &batch)
            {
                doDownload(*backups, *downloads, session, batch, asset_filter, relative_path);
            };
            dispatcher.dispatch(batches, work, cancellation);
        }

        void Backup::doDownload(BackupAssistant &backups,
                                DownloadAssistant &downloads,
                                const Model::Session &session,
                                const Model::Batch &batch,
                                const AssetFilter &asset_filter,
                                const fs::path &relative_path)
        {
            auto logger = Logging::logger();
            if (logger->should_log(spdlog::level::trace))
            {
                logger->trace("<< doDownload() - batch: {}", Model::toString(batch));
            }

            std::vector<Model::Asset> fetched = backups.assets(session, batch);
            std::vector<Model::Asset> asset_list;
            std::copy_if(fetched.begin(), fetched.end(), std::back_inserter(asset_list),
                         [&asset_filter](const Model::Asset &asset)
                         { return !asset_filter || asset_filter(asset); });
            logger->debug("-- doDownload() - filtered asset count: {}", asset_list.size());

            downloads.download(session, asset_list, relative_path);
            logger->trace(">> doDownload()");
        }

        fs::path Backup::deviceSnapshotDateSubPath(const Model::Device &device, const Model::Snapshot &snapshot) const
        {
            if (device.snapshot_ids.count(snapshot.snapshot_id) == 0)
            {
                Logging::logger()->warn("-- deviceSnapshotDateSubPath() - snapshot not found in device: {} {}",
                                        device.device_id, snapshot.snapshot_id);
            }

            Model::Timestamp timestamp = snapshot.date ? *snapshot.date : snapshot.modification;
            std::string date = basicIsoDate(timestamp);

            std::string device_dir = device.device_id;
            std::transform(device_dir.begin(), device_dir.end(), device_dir.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            return fs::path(device_dir) / date;
        }

    } // namespace Download
} // namespace SnapFetch
