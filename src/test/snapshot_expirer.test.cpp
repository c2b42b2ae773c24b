//src/test/snapshot_expirer.test.cpp
#include "test_utils.h"

#include <thread>

using namespace lakestore;
using namespace lakestore::test;
using snapshot::ExpireConfig;

class SnapshotExpirerTest : public TempDirTest {
protected:
    std::shared_ptr<table::FileStoreTable> table;

    void SetUp() override {
        TempDirTest::SetUp();
        auto created = table::FileStoreTable::create(file_io, fs::joinPath(test_dir, "t"), keyValueSchema());
        ASSERT_TRUE(created.isOk()) << created.error().toString();
        table = created.value();
    }

    // One snapshot per key.
    void commitKeys(int64_t from, int64_t to) {
        for (int64_t k = from; k <= to; ++k) {
            writeAndCommit(table, "writer", k, {{I(k), S("v" + std::to_string(k))}});
        }
    }

    // Everything older than "now" is eligible by age.
    static ExpireConfig aggressive() {
        ExpireConfig config;
        config.retain_min = 1;
        config.time_retained = std::chrono::milliseconds(0);
        config.max_deletes = 100;
        return config;
    }

    std::vector<int64_t> snapshotIds() {
        auto ids = table->snapshotManager()->listSnapshotIds();
        EXPECT_TRUE(ids.isOk());
        return ids.isOk() ? ids.value() : std::vector<int64_t>{};
    }

    std::vector<Row> readAll() {
        auto rows = table->newRead()->read();
        EXPECT_TRUE(rows.isOk()) << rows.error().toString();
        return rows.isOk() ? sortedRows(rows.value()) : std::vector<Row>{};
    }

    static void letClockAdvance() { std::this_thread::sleep_for(std::chrono::milliseconds(5)); }
};

TEST_F(SnapshotExpirerTest, EmptyTableIsANoOp) {
    auto result = table->newExpirer()->expire(aggressive());
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    EXPECT_EQ(result.value().expired_snapshots, 0);
    EXPECT_FALSE(result.value().earliest_retained.has_value());
}

TEST_F(SnapshotExpirerTest, RejectsInvalidPolicy) {
    ExpireConfig zero_min = aggressive();
    zero_min.retain_min = 0;
    EXPECT_EQ(table->newExpirer()->expire(zero_min).error().code, storage::ErrorCode::INVALID_CONFIGURATION);

    ExpireConfig inverted = aggressive();
    inverted.retain_min = 5;
    inverted.retain_max = 2;
    EXPECT_EQ(table->newExpirer()->expire(inverted).error().code, storage::ErrorCode::INVALID_CONFIGURATION);

    ExpireConfig no_deletes = aggressive();
    no_deletes.max_deletes = 0;
    EXPECT_EQ(table->newExpirer()->expire(no_deletes).error().code, storage::ErrorCode::INVALID_CONFIGURATION);
}

TEST_F(SnapshotExpirerTest, KeepsRetainMinNewestSnapshots) {
    commitKeys(1, 5);
    letClockAdvance();

    ExpireConfig config = aggressive();
    config.retain_min = 2;
    auto result = table->newExpirer()->expire(config);
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    EXPECT_EQ(result.value().expired_snapshots, 3);
    EXPECT_EQ(result.value().earliest_retained, 4);
    EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{4, 5}));
    EXPECT_EQ(table->snapshotManager()->earliestSnapshotId().value(), 4);

    // Expired history does not change what the latest snapshot holds.
    EXPECT_EQ(readAll().size(), 5u);
    auto integrity = table->newScan()->verifyIntegrity();
    EXPECT_TRUE(integrity.isOk()) << integrity.error().toString();
}

TEST_F(SnapshotExpirerTest, YoungSnapshotsSurviveUntilRetainMax) {
    commitKeys(1, 5);

    // Default time retention keeps everything just written.
    ExpireConfig config = aggressive();
    config.time_retained = std::chrono::hours(1);
    auto kept = table->newExpirer()->expire(config);
    ASSERT_TRUE(kept.isOk());
    EXPECT_EQ(kept.value().expired_snapshots, 0);
    EXPECT_EQ(kept.value().earliest_retained, 1);
    EXPECT_EQ(snapshotIds().size(), 5u);

    // Past retain_max, age no longer protects a snapshot.
    config.retain_max = 2;
    auto trimmed = table->newExpirer()->expire(config);
    ASSERT_TRUE(trimmed.isOk()) << trimmed.error().toString();
    EXPECT_EQ(trimmed.value().expired_snapshots, 3);
    EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{4, 5}));
}

TEST_F(SnapshotExpirerTest, RespectsPerRunLimit) {
    commitKeys(1, 6);
    letClockAdvance();

    ExpireConfig config = aggressive();
    config.max_deletes = 2;
    auto first = table->newExpirer()->expire(config);
    ASSERT_TRUE(first.isOk());
    EXPECT_EQ(first.value().expired_snapshots, 2);
    EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{3, 4, 5, 6}));

    auto second = table->newExpirer()->expire(config);
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{5, 6}));
}

TEST_F(SnapshotExpirerTest, PinnedSnapshotBlocksExpiration) {
    commitKeys(1, 4);
    letClockAdvance();

    {
        auto lease = table->pinSnapshot(2);
        ASSERT_TRUE(lease.isOk()) << lease.error().toString();
        snapshot::SnapshotLease held = std::move(lease).value();

        auto result = table->newExpirer()->expire(aggressive());
        ASSERT_TRUE(result.isOk()) << result.error().toString();
        EXPECT_EQ(result.value().expired_snapshots, 1);
        EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{2, 3, 4}));

        // The pinned snapshot stays readable while held.
        operation::ScanOptions at_pin;
        at_pin.snapshot_id = held.snapshotId();
        auto rows = table->newRead()->read(at_pin);
        ASSERT_TRUE(rows.isOk()) << rows.error().toString();
        EXPECT_EQ(sortedRows(rows.value()), (std::vector<Row>{{I(1), S("v1")}, {I(2), S("v2")}}));
    }

    auto result = table->newExpirer()->expire(aggressive());
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{4}));
}

TEST_F(SnapshotExpirerTest, PinningMissingSnapshotFails) {
    EXPECT_EQ(table->pinSnapshot().error().code, storage::ErrorCode::SNAPSHOT_ERROR);
    commitKeys(1, 1);
    EXPECT_EQ(table->pinSnapshot(9).error().code, storage::ErrorCode::SNAPSHOT_ERROR);
}

TEST_F(SnapshotExpirerTest, AnnouncedRangeCannotBePinned) {
    commitKeys(1, 4);
    auto manager = table->snapshotManager();
    ASSERT_TRUE(manager->publishExpireMarker("other-expirer", 3).isOk());

    EXPECT_EQ(table->pinSnapshot(1).error().code, storage::ErrorCode::SNAPSHOT_ERROR);
    auto leftover = table->consumerManager()->consumers();
    ASSERT_TRUE(leftover.isOk());
    EXPECT_TRUE(leftover.value().empty());

    // Snapshots at or past the announced end are still fair game.
    auto above = table->pinSnapshot(3);
    ASSERT_TRUE(above.isOk()) << above.error().toString();
    ASSERT_TRUE(std::move(above).value().release().isOk());

    ASSERT_TRUE(manager->clearExpireMarker("other-expirer").isOk());
    auto after_clear = table->pinSnapshot(1);
    ASSERT_TRUE(after_clear.isOk()) << after_clear.error().toString();
    EXPECT_EQ(after_clear.value().snapshotId(), 1);
}

TEST_F(SnapshotExpirerTest, PinWrittenAfterPlanningStopsExpiration) {
    auto io = std::make_shared<FaultInjectingFileIO>(file_io);
    auto created = table::FileStoreTable::create(io, fs::joinPath(test_dir, "raced"), keyValueSchema());
    ASSERT_TRUE(created.isOk()) << created.error().toString();
    auto raced = created.value();
    for (int64_t k = 1; k <= 4; ++k) {
        writeAndCommit(raced, "writer", k, {{I(k), S("v" + std::to_string(k))}});
    }
    letClockAdvance();

    // A reader whose pin lands after the expirer's first look at the pins,
    // but before its check of the snapshot.
    io->afterWrite(fs::FileStorePathFactory::EXPIRE_MARKER_PREFIX, [&]() {
        ASSERT_TRUE(raced->consumerManager()->pin("late-reader", 2).isOk());
    });

    auto result = raced->newExpirer()->expire(aggressive());
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    EXPECT_EQ(result.value().expired_snapshots, 1);
    ASSERT_TRUE(result.value().earliest_retained.has_value());
    EXPECT_EQ(*result.value().earliest_retained, 2);

    auto ids = raced->snapshotManager()->listSnapshotIds();
    ASSERT_TRUE(ids.isOk());
    EXPECT_EQ(ids.value(), (std::vector<int64_t>{2, 3, 4}));

    operation::ScanOptions at_pin;
    at_pin.snapshot_id = 2;
    auto rows = raced->newRead()->read(at_pin);
    ASSERT_TRUE(rows.isOk()) << rows.error().toString();
    EXPECT_EQ(sortedRows(rows.value()), (std::vector<Row>{{I(1), S("v1")}, {I(2), S("v2")}}));

    // The marker is gone once the run ends.
    auto expiring = raced->snapshotManager()->expiringBefore();
    ASSERT_TRUE(expiring.isOk());
    EXPECT_FALSE(expiring.value().has_value());
}

TEST_F(SnapshotExpirerTest, PinAttemptDuringExpirationBacksOff) {
    auto io = std::make_shared<FaultInjectingFileIO>(file_io);
    auto created = table::FileStoreTable::create(io, fs::joinPath(test_dir, "raced"), keyValueSchema());
    ASSERT_TRUE(created.isOk()) << created.error().toString();
    auto raced = created.value();
    for (int64_t k = 1; k <= 4; ++k) {
        writeAndCommit(raced, "writer", k, {{I(k), S("v" + std::to_string(k))}});
    }
    letClockAdvance();

    // pinSnapshot running inside the expirer's window must not hand out a
    // lease on a snapshot that is about to be deleted.
    std::optional<storage::ErrorCode> pin_error;
    io->afterWrite(fs::FileStorePathFactory::EXPIRE_MARKER_PREFIX, [&]() {
        auto lease = raced->pinSnapshot(2);
        if (!lease.isOk()) pin_error = lease.error().code;
    });

    auto result = raced->newExpirer()->expire(aggressive());
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    ASSERT_TRUE(pin_error.has_value());
    EXPECT_EQ(*pin_error, storage::ErrorCode::SNAPSHOT_ERROR);
    EXPECT_EQ(result.value().expired_snapshots, 3);

    auto leftover = raced->consumerManager()->consumers();
    ASSERT_TRUE(leftover.isOk());
    EXPECT_TRUE(leftover.value().empty());
}

TEST_F(SnapshotExpirerTest, DeletesFilesOnlyExpiredSnapshotsReference) {
    writeAndCommit(table, "writer", 1, {{I(1), S("old")}});
    auto first_plan = table->newScan()->plan();
    ASSERT_TRUE(first_plan.isOk());
    ASSERT_EQ(first_plan.value().files().size(), 1u);
    std::string replaced = table->pathFactory()->dataFilePath(*first_plan.value().files()[0]);

    // Snapshot 2 replaces every file of snapshot 1.
    auto write = table->newWrite();
    ASSERT_TRUE(write->write({I(2), S("new")}).isOk());
    auto messages = write->prepareCommit();
    ASSERT_TRUE(messages.isOk());
    auto overwritten = table->newCommit("writer")->overwrite(std::nullopt, 2, messages.value());
    ASSERT_TRUE(overwritten.isOk()) << overwritten.error().toString();

    writeAndCommit(table, "writer", 3, {{I(3), S("more")}});
    letClockAdvance();

    EXPECT_TRUE(file_io->exists(replaced).value());
    auto result = table->newExpirer()->expire(aggressive());
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    EXPECT_EQ(result.value().expired_snapshots, 2);
    EXPECT_EQ(result.value().deleted_data_files, 1);
    EXPECT_GT(result.value().deleted_manifests, 0);
    EXPECT_FALSE(file_io->exists(replaced).value());

    EXPECT_EQ(readAll(), (std::vector<Row>{{I(2), S("new")}, {I(3), S("more")}}));
    auto integrity = table->newScan()->verifyIntegrity();
    ASSERT_TRUE(integrity.isOk()) << integrity.error().toString();
    EXPECT_EQ(integrity.value().snapshots_checked, 1);
}

TEST_F(SnapshotExpirerTest, CommitMaintenanceExpiresPerTableOptions) {
    auto created = table::FileStoreTable::create(
        file_io, fs::joinPath(test_dir, "auto"),
        keyValueSchema({{"snapshot.num-retained.min", "2"},
                        {"snapshot.num-retained.max", "3"},
                        {"snapshot.expire.limit", "10"}}));
    ASSERT_TRUE(created.isOk()) << created.error().toString();
    auto auto_table = created.value();
    for (int64_t k = 1; k <= 6; ++k) {
        writeAndCommit(auto_table, "writer", k, {{I(k), S("x")}});
    }
    auto ids = auto_table->snapshotManager()->listSnapshotIds();
    ASSERT_TRUE(ids.isOk());
    EXPECT_EQ(ids.value(), (std::vector<int64_t>{4, 5, 6}));
}

class OrphanFilesCleanerTest : public SnapshotExpirerTest {};

TEST_F(OrphanFilesCleanerTest, RemovesUnreferencedFilesOnly) {
    commitKeys(1, 2);
    auto paths = table->pathFactory();

    std::string stray_data = paths->dataFilePath(Row{}, 0, "data-stray-0");
    std::string stray_manifest = paths->manifestPath("manifest-stray-0");
    std::string temp_file = fs::joinPath(paths->bucketPath(Row{}, 0), ".data-crashed.tmp");
    std::string foreign = fs::joinPath(paths->root(), "README");
    for (const auto& p : {stray_data, stray_manifest, temp_file, foreign}) {
        ASSERT_TRUE(file_io->writeFile(p, "junk", false).isOk());
    }
    auto live_before = readAll();

    // A threshold in the past protects everything just written.
    auto cautious = table->newOrphanFilesCleaner()->clean(currentTimeMillis() - 3600 * 1000);
    ASSERT_TRUE(cautious.isOk()) << cautious.error().toString();
    EXPECT_EQ(cautious.value().deleted_files, 0);

    auto result = table->newOrphanFilesCleaner()->clean(currentTimeMillis() + 1000);
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    std::set<std::string> deleted(result.value().deleted_paths.begin(), result.value().deleted_paths.end());
    EXPECT_EQ(deleted, (std::set<std::string>{stray_data, stray_manifest, temp_file}));
    EXPECT_EQ(result.value().deleted_bytes, 12);

    EXPECT_TRUE(file_io->exists(foreign).value());
    EXPECT_EQ(readAll(), live_before);
    EXPECT_EQ(snapshotIds(), (std::vector<int64_t>{1, 2}));
    auto integrity = table->newScan()->verifyIntegrity();
    EXPECT_TRUE(integrity.isOk()) << integrity.error().toString();
}

TEST_F(OrphanFilesCleanerTest, KeepsFilesOfRetainedHistory) {
    writeAndCommit(table, "writer", 1, {{I(1), S("a")}});
    auto write = table->newWrite();
    ASSERT_TRUE(write->write({I(1), S("b")}).isOk());
    auto messages = write->prepareCommit();
    ASSERT_TRUE(messages.isOk());
    ASSERT_TRUE(table->newCommit("writer")->overwrite(std::nullopt, 2, messages.value()).isOk());

    // The replaced file is dead in the latest snapshot but snapshot 1 still reads it.
    auto result = table->newOrphanFilesCleaner()->clean(currentTimeMillis() + 1000);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().deleted_files, 0);

    operation::ScanOptions first;
    first.snapshot_id = 1;
    auto rows = table->newRead()->read(first);
    ASSERT_TRUE(rows.isOk()) << rows.error().toString();
    EXPECT_EQ(rows.value(), (std::vector<Row>{{I(1), S("a")}}));
}
