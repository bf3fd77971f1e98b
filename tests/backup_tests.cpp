#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "backup.hpp"
#include "errors.hpp"
#include "mocks/mock_assistants.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

using namespace SnapFetch;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

Model::Timestamp at(long long epoch_seconds) {
    return Model::Timestamp(std::chrono::seconds(epoch_seconds));
}

Model::Device device() {
    Model::Device d;
    d.device_id = "a1b2c3d4";
    d.snapshot_ids = {"S1"};
    d.info = "iPhone";
    return d;
}

Model::Snapshot snapshot() {
    Model::Snapshot s;
    s.snapshot_id = "S1";
    s.date = at(1458084600); // 2016-03-15T23:30:00Z
    s.modification = at(1451606400);
    return s;
}

// Echoes each asset id back as a detail record in the group's domain.
std::vector<Model::Asset> detailsFor(const Model::Batch& batch) {
    std::vector<Model::Asset> out;
    for (const auto& id : batch) {
        Model::Asset asset;
        asset.id = id.id;
        asset.domain = "HomeDomain";
        asset.relative_path = "Library/" + id.id;
        asset.size = id.size;
        out.push_back(asset);
    }
    return out;
}

Config::DownloadConfig smallBatches(size_t threads) {
    Config::DownloadConfig config;
    config.batch_size = 10;
    config.threads = threads;
    return config;
}

class BackupTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockBackupAssistant>> backup_assistant =
        std::make_shared<NiceMock<MockBackupAssistant>>();
    std::shared_ptr<NiceMock<MockDownloadAssistant>> download_assistant =
        std::make_shared<NiceMock<MockDownloadAssistant>>();
    Model::Session session{"dsid", "token"};

    std::mutex mtx;
    std::vector<std::vector<std::string>> downloaded_batches;
    std::vector<std::filesystem::path> paths;

    void recordDownloads() {
        ON_CALL(*download_assistant, download(_, _, _))
            .WillByDefault(Invoke([this](const Model::Session&, const std::vector<Model::Asset>& assets,
                                         const std::filesystem::path& relative_path) {
                std::lock_guard<std::mutex> lock(mtx);
                std::vector<std::string> ids;
                for (const auto& a : assets) ids.push_back(a.id);
                downloaded_batches.push_back(ids);
                paths.push_back(relative_path);
            }));
    }
};

} // namespace

TEST_F(BackupTest, SnapshotsEmptyWithoutBackupAccount) {
    EXPECT_CALL(*backup_assistant, backupAccount(_)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*backup_assistant, devices(_, _)).Times(0);

    Download::Backup backup(backup_assistant, download_assistant);
    EXPECT_TRUE(backup.snapshots(session).empty());
}

TEST_F(BackupTest, SnapshotsResolvesDevicesAndTheirSnapshots) {
    Model::BackupAccount account{"hash", {"a1b2c3d4"}};
    Download::DeviceSnapshots expected = {{device(), {snapshot()}}};

    EXPECT_CALL(*backup_assistant, backupAccount(_)).WillOnce(Return(account));
    EXPECT_CALL(*backup_assistant, devices(_, std::vector<std::string>{"a1b2c3d4"}))
        .WillOnce(Return(std::vector<Model::Device>{device()}));
    EXPECT_CALL(*backup_assistant, deviceSnapshots(_, _)).WillOnce(Return(expected));

    Download::Backup backup(backup_assistant, download_assistant);
    auto result = backup.snapshots(session);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.begin()->first.device_id, "a1b2c3d4");
    EXPECT_EQ(result.begin()->second.size(), 1u);
}

TEST_F(BackupTest, SubPathUsesUppercaseDeviceAndSnapshotDate) {
    Download::Backup backup(backup_assistant, download_assistant);
    EXPECT_EQ(backup.deviceSnapshotDateSubPath(device(), snapshot()), std::filesystem::path("A1B2C3D4/20160315"));
}

TEST_F(BackupTest, SubPathFallsBackToModificationTime) {
    Download::Backup backup(backup_assistant, download_assistant);
    Model::Snapshot s = snapshot();
    s.date.reset();
    s.modification = at(1451606399); // 2015-12-31T23:59:59Z
    EXPECT_EQ(backup.deviceSnapshotDateSubPath(device(), s), std::filesystem::path("A1B2C3D4/20151231"));
}

TEST_F(BackupTest, SubPathToleratesSnapshotMissingFromDevice) {
    Download::Backup backup(backup_assistant, download_assistant);
    Model::Snapshot s = snapshot();
    s.snapshot_id = "unknown";
    EXPECT_EQ(backup.deviceSnapshotDateSubPath(device(), s), std::filesystem::path("A1B2C3D4/20160315"));
}

TEST_F(BackupTest, DownloadFiltersBatchesAndTransfers) {
    std::vector<Model::AssetGroup> groups = {
        {"HomeDomain", {{"a", 6}, {"empty", 0}, {"b", 6}, {"c", 3}}},
        {"CameraRollDomain", {{"photo", 50}}},
        {"AppDomain", {{"d", 4}}},
    };
    EXPECT_CALL(*backup_assistant, assetsList(_, _)).WillOnce(Return(groups));
    ON_CALL(*backup_assistant, assets(_, _))
        .WillByDefault(Invoke([](const Model::Session&, const Model::Batch& batch) { return detailsFor(batch); }));
    // HomeDomain and AppDomain survive: ids a,b,c,d (empty skipped) -> [[a,b],[c,d]]
    EXPECT_CALL(*backup_assistant, assets(_, _)).Times(2);
    EXPECT_CALL(*download_assistant, download(_, _, _)).Times(2);
    recordDownloads();

    Download::Backup backup(backup_assistant, download_assistant, smallBatches(2));
    backup.download(
        session, device(), snapshot(),
        [](const Model::AssetGroup& group) { return group.domain != "CameraRollDomain"; },
        [](const Model::Asset& asset) { return asset.id != "c"; });

    std::sort(downloaded_batches.begin(), downloaded_batches.end());
    ASSERT_EQ(downloaded_batches.size(), 2u);
    EXPECT_EQ(downloaded_batches[0], (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(downloaded_batches[1], (std::vector<std::string>{"d"}));
    for (const auto& p : paths) {
        EXPECT_EQ(p, std::filesystem::path("A1B2C3D4/20160315"));
    }
}

TEST_F(BackupTest, DownloadWithNothingToFetchSkipsTransfer) {
    EXPECT_CALL(*backup_assistant, assetsList(_, _))
        .WillOnce(Return(std::vector<Model::AssetGroup>{{"HomeDomain", {{"empty", 0}}}}));
    EXPECT_CALL(*backup_assistant, assets(_, _)).Times(0);
    EXPECT_CALL(*download_assistant, download(_, _, _)).Times(0);

    Download::Backup backup(backup_assistant, download_assistant, smallBatches(1));
    backup.download(session, device(), snapshot(), nullptr, nullptr);
}

TEST_F(BackupTest, TransferIOFailurePropagates) {
    EXPECT_CALL(*backup_assistant, assetsList(_, _))
        .WillOnce(Return(std::vector<Model::AssetGroup>{{"HomeDomain", {{"a", 20}, {"b", 20}, {"c", 20}}}}));
    ON_CALL(*backup_assistant, assets(_, _))
        .WillByDefault(Invoke([](const Model::Session&, const Model::Batch& batch) { return detailsFor(batch); }));
    ON_CALL(*download_assistant, download(_, _, _))
        .WillByDefault(Invoke([](const Model::Session&, const std::vector<Model::Asset>& assets,
                                 const std::filesystem::path&) {
            if (!assets.empty() && assets.front().id == "b") {
                throw Errors::IOError("connection reset");
            }
        }));

    Download::Backup backup(backup_assistant, download_assistant, smallBatches(2));
    EXPECT_THROW(backup.download(session, device(), snapshot(), nullptr, nullptr), Errors::IOError);
}

TEST_F(BackupTest, ManifestFailurePropagatesUnchanged) {
    EXPECT_CALL(*backup_assistant, assetsList(_, _)).WillOnce(Invoke([](const Model::Session&, const Model::Snapshot&)
        -> std::vector<Model::AssetGroup> { throw Errors::IOError("manifest unavailable"); }));

    Download::Backup backup(backup_assistant, download_assistant);
    EXPECT_THROW(backup.download(session, device(), snapshot(), nullptr, nullptr), Errors::IOError);
}

TEST_F(BackupTest, CancelStopsRemainingBatchesWithoutError) {
    EXPECT_CALL(*backup_assistant, assetsList(_, _))
        .WillOnce(Return(std::vector<Model::AssetGroup>{{"HomeDomain", {{"a", 20}, {"b", 20}, {"c", 20}}}}));
    ON_CALL(*backup_assistant, assets(_, _))
        .WillByDefault(Invoke([](const Model::Session&, const Model::Batch& batch) { return detailsFor(batch); }));

    std::atomic<int> transfers{0};
    Download::Backup backup(backup_assistant, download_assistant, smallBatches(1));
    ON_CALL(*download_assistant, download(_, _, _))
        .WillByDefault(Invoke([&](const Model::Session&, const std::vector<Model::Asset>&,
                                  const std::filesystem::path&) {
            ++transfers;
            backup.cancel();
        }));

    EXPECT_NO_THROW(backup.download(session, device(), snapshot(), nullptr, nullptr));
    EXPECT_TRUE(backup.cancellationToken().isCancelled());
    EXPECT_EQ(transfers.load(), 1);
}

TEST_F(BackupTest, CancelledBatchOnSharedPoolOutlivesBackup) {
    EXPECT_CALL(*backup_assistant, assetsList(_, _))
        .WillOnce(Return(std::vector<Model::AssetGroup>{{"HomeDomain", {{"a", 20}, {"b", 20}}}}));
    std::atomic<bool> fetching{false};
    std::atomic<bool> release{false};
    ON_CALL(*backup_assistant, assets(_, _))
        .WillByDefault(Invoke([&](const Model::Session&, const Model::Batch& batch) {
            fetching = true;
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return detailsFor(batch);
        }));
    std::atomic<int> transfers{0};
    ON_CALL(*download_assistant, download(_, _, _))
        .WillByDefault(Invoke([&](const Model::Session&, const std::vector<Model::Asset>&,
                                  const std::filesystem::path&) { ++transfers; }));

    auto pool = std::make_shared<Concurrency::ThreadPool>(1);
    auto backup = std::make_unique<Download::Backup>(backup_assistant, download_assistant, smallBatches(1), pool);
    std::thread canceller([&] {
        while (!fetching.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        backup->cancel();
    });

    EXPECT_NO_THROW(backup->download(session, device(), snapshot(), nullptr, nullptr));
    canceller.join();
    backup.reset();

    // The batch still fetching finishes after its Backup is gone.
    release = true;
    pool->shutdown();
    EXPECT_EQ(transfers.load(), 1);
}

TEST_F(BackupTest, DownloadAllVisitsEverySnapshot) {
    Model::Snapshot second = snapshot();
    second.snapshot_id = "S2";
    Download::DeviceSnapshots all = {{device(), {snapshot(), second}}};

    EXPECT_CALL(*backup_assistant, assetsList(_, _))
        .Times(2)
        .WillRepeatedly(Return(std::vector<Model::AssetGroup>{{"HomeDomain", {{"a", 1}}}}));
    ON_CALL(*backup_assistant, assets(_, _))
        .WillByDefault(Invoke([](const Model::Session&, const Model::Batch& batch) { return detailsFor(batch); }));
    EXPECT_CALL(*download_assistant, download(_, _, _)).Times(2);

    Download::Backup backup(backup_assistant, download_assistant, smallBatches(1));
    backup.download(session, all, nullptr, nullptr);
}

TEST_F(BackupTest, MissingCollaboratorIsRejected) {
    EXPECT_THROW(Download::Backup(nullptr, download_assistant), std::invalid_argument);
    EXPECT_THROW(Download::Backup(backup_assistant, nullptr), std::invalid_argument);
}
