//src/test/compaction_coordinator.test.cpp
#include "test_utils.h"

#include <future>

using namespace lakestore;
using namespace lakestore::test;
using operation::CompactionCoordinator;
using operation::CompactionOutcome;
using operation::CompactionRequest;
using operation::CompactionState;

class CompactionCoordinatorTest : public TempDirTest {
protected:
    std::shared_ptr<table::FileStoreTable> table;

    void SetUp() override {
        TempDirTest::SetUp();
        table = createTable("t", keyValueSchema(baseOptions()));
    }

    static std::map<std::string, std::string> baseOptions(std::map<std::string, std::string> extra = {}) {
        std::map<std::string, std::string> options{
            {"commit.min-retry-wait", "1ms"},
            {"commit.max-retry-wait", "5ms"},
            // Strategy picks stay quiet unless a test asks for a full compaction.
            {"num-sorted-run.compaction-trigger", "10"},
        };
        for (auto& [k, v] : extra) options[k] = v;
        return options;
    }

    std::shared_ptr<table::FileStoreTable> createTable(const std::string& name, const schema::TableSchema& schema) {
        auto created = table::FileStoreTable::create(file_io, fs::joinPath(test_dir, name), schema);
        EXPECT_TRUE(created.isOk()) << created.error().toString();
        return created.isOk() ? created.value() : nullptr;
    }

    void commitThreeRuns(const std::shared_ptr<table::FileStoreTable>& t) {
        writeAndCommit(t, "writer", 1, {{I(1), S("a")}, {I(2), S("b")}});
        writeAndCommit(t, "writer", 2, {{I(2), S("b2")}, {I(3), S("c")}});
        writeAndCommit(t, "writer", 3, {{I(1), S("a3")}});
    }

    static CompactionRequest fullRequest() {
        CompactionRequest request;
        request.full = true;
        return request;
    }

    std::vector<Row> readAll(const std::shared_ptr<table::FileStoreTable>& t) {
        auto rows = t->newRead()->read();
        EXPECT_TRUE(rows.isOk()) << rows.error().toString();
        return rows.isOk() ? sortedRows(rows.value()) : std::vector<Row>{};
    }

    size_t liveFileCount(const std::shared_ptr<table::FileStoreTable>& t) {
        return t->newScan()->plan().value().files().size();
    }
};

TEST_F(CompactionCoordinatorTest, FullCompactionCommitsUnderOwnUser) {
    commitThreeRuns(table);
    auto expected = readAll(table);
    auto coordinator = table->newCompactionCoordinator();

    CompactionOutcome outcome = coordinator->runNow(fullRequest());
    ASSERT_TRUE(outcome.ok()) << outcome.toString();
    ASSERT_TRUE(outcome.compacted());
    EXPECT_EQ(*outcome.snapshot_id, 4);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.before.size(), 3u);
    EXPECT_EQ(outcome.after.size(), 1u);

    auto latest = table->snapshotManager()->latest().value();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->commit_kind, snapshot::CommitKind::COMPACT);
    EXPECT_EQ(latest->commit_user, coordinator->commitUser());
    EXPECT_EQ(liveFileCount(table), 1u);
    EXPECT_EQ(readAll(table), expected);

    auto metrics = coordinator->metrics();
    EXPECT_EQ(metrics.submitted, 1u);
    EXPECT_EQ(metrics.committed, 1u);
    EXPECT_EQ(metrics.files_in, 3u);
    EXPECT_EQ(metrics.files_out, 1u);
    EXPECT_GT(metrics.bytes_in, 0u);
    EXPECT_EQ(coordinator->state(Row{}, 0), CompactionState::IDLE);
}

TEST_F(CompactionCoordinatorTest, NothingToDoIsNotAnError) {
    auto coordinator = table->newCompactionCoordinator();
    CompactionOutcome empty = coordinator->runNow(fullRequest());
    EXPECT_TRUE(empty.ok());
    EXPECT_FALSE(empty.compacted());

    commitThreeRuns(table);
    CompactionOutcome below_trigger = coordinator->runNow(CompactionRequest{});
    EXPECT_TRUE(below_trigger.ok());
    EXPECT_FALSE(below_trigger.compacted());

    CompactionRequest stale;
    stale.files = std::set<std::string>{"data-not-live-0"};
    CompactionOutcome not_live = coordinator->runNow(stale);
    EXPECT_TRUE(not_live.ok());
    EXPECT_FALSE(not_live.compacted());

    EXPECT_EQ(coordinator->metrics().nothing_to_do, 3u);
    EXPECT_EQ(table->snapshotManager()->latestSnapshotId().value(), 3);
}

TEST_F(CompactionCoordinatorTest, ExplicitFilesAreCompacted) {
    commitThreeRuns(table);
    auto files = table->newScan()->plan().value().files();
    ASSERT_EQ(files.size(), 3u);

    auto coordinator = table->newCompactionCoordinator();
    CompactionRequest request;
    request.files = std::set<std::string>{files.front()->file_name};
    CompactionOutcome outcome = coordinator->runNow(request);
    ASSERT_TRUE(outcome.ok()) << outcome.toString();
    ASSERT_TRUE(outcome.compacted());
    // Only level 0 is populated, so the unit extends over every run.
    EXPECT_EQ(outcome.before.size(), 3u);
    EXPECT_EQ(readAll(table).size(), 3u);
}

TEST_F(CompactionCoordinatorTest, LosingARaceReplansAgainstTheWinner) {
    commitThreeRuns(table);
    auto expected = readAll(table);
    const std::string bucket_dir = table->pathFactory()->bucketPath(Row{}, 0);

    // A rival compaction prepared against the same snapshot.
    auto plan = table->newScan()->plan().value();
    auto levels = lsm::Levels::create(plan.files(), table->options().num_levels).value();
    auto manager = table->newCompactManager(Row{}, 0);
    auto unit = manager->pick(levels, true);
    ASSERT_TRUE(unit.has_value());
    auto rival = manager->rewrite(levels, *unit);
    ASSERT_TRUE(rival.isOk()) << rival.error().toString();
    operation::CommitMessage rival_message;
    rival_message.total_buckets = 1;
    rival_message.compact_before = rival.value().before;
    rival_message.compact_after = rival.value().after;

    auto coordinator = table->newCompactionCoordinator();
    std::atomic<bool> raced{false};
    coordinator->setBeforeCommitHook([&](int64_t) {
        if (raced.exchange(true)) return;
        operation::ManifestCommittable committable(1);
        committable.addMessage(rival_message);
        auto won = table->newFileStoreCommit("rival")->commit(committable);
        EXPECT_TRUE(won.isOk()) << won.error().toString();
    });

    CompactionOutcome outcome = coordinator->runNow(fullRequest());
    EXPECT_TRUE(raced.load());
    EXPECT_TRUE(outcome.ok()) << outcome.toString();
    EXPECT_FALSE(outcome.compacted());
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(coordinator->metrics().conflicts, 1u);

    auto latest = table->snapshotManager()->latest().value();
    EXPECT_EQ(latest->commit_user, "rival");
    EXPECT_EQ(liveFileCount(table), 1u);
    EXPECT_EQ(readAll(table), expected);

    // Three inputs plus the rival's output; the loser's output was removed.
    auto on_disk = file_io->listFiles(bucket_dir);
    ASSERT_TRUE(on_disk.isOk());
    EXPECT_EQ(on_disk.value().size(), 4u);
}

TEST_F(CompactionCoordinatorTest, RequestsForABusyBucketAreCoalesced) {
    commitThreeRuns(table);
    auto coordinator = table->newCompactionCoordinator();

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> first{true};
    coordinator->setBeforeCommitHook([&](int64_t) {
        if (!first.exchange(false)) return;
        entered.set_value();
        released.wait();
    });

    auto running = coordinator->submit(fullRequest());
    entered.get_future().wait();
    EXPECT_EQ(coordinator->state(Row{}, 0), CompactionState::COMMITTING);

    CompactionRequest explicit_files;
    explicit_files.files = std::set<std::string>{"data-none-0"};
    auto follow_up = coordinator->submit(explicit_files);
    auto folded = coordinator->submit(CompactionRequest{});
    release.set_value();

    CompactionOutcome first_outcome = running.get();
    ASSERT_TRUE(first_outcome.compacted()) << first_outcome.toString();

    CompactionOutcome a = follow_up.get();
    CompactionOutcome b = folded.get();
    EXPECT_TRUE(a.ok());
    EXPECT_FALSE(a.compacted());
    EXPECT_EQ(a.toString(), b.toString());

    coordinator->waitForIdle();
    auto metrics = coordinator->metrics();
    EXPECT_EQ(metrics.submitted, 3u);
    EXPECT_EQ(metrics.coalesced, 2u);
    EXPECT_EQ(metrics.committed, 1u);
    EXPECT_EQ(metrics.nothing_to_do, 1u);
    EXPECT_EQ(coordinator->state(Row{}, 0), CompactionState::IDLE);
}

TEST_F(CompactionCoordinatorTest, CommitsTriggerFullCompactionOnCadence) {
    auto cadenced = createTable("cadenced", keyValueSchema(baseOptions({{"full-compaction.delta-commits", "2"}})));
    ASSERT_TRUE(cadenced);
    auto coordinator = cadenced->newCompactionCoordinator();
    auto commit = cadenced->newCommit("writer");
    commit->setCompactionCoordinator(coordinator.get());

    auto writeAndNotify = [&](int64_t identifier, int64_t key) {
        auto write = cadenced->newWrite();
        ASSERT_TRUE(write->write(Row{I(key), S("v")}).isOk());
        auto messages = write->prepareCommit();
        ASSERT_TRUE(messages.isOk());
        ASSERT_TRUE(commit->commit(identifier, messages.value()).isOk());
        coordinator->waitForIdle();
    };

    writeAndNotify(1, 1);
    EXPECT_EQ(coordinator->metrics().committed, 0u);
    EXPECT_EQ(liveFileCount(cadenced), 1u);

    writeAndNotify(2, 2);
    EXPECT_EQ(coordinator->metrics().committed, 1u);
    EXPECT_EQ(liveFileCount(cadenced), 1u);
    EXPECT_EQ(cadenced->snapshotManager()->latest().value()->commit_kind, snapshot::CommitKind::COMPACT);

    writeAndNotify(3, 3);
    EXPECT_EQ(coordinator->metrics().committed, 1u);
    EXPECT_EQ(liveFileCount(cadenced), 2u);
    EXPECT_EQ(readAll(cadenced).size(), 3u);
}

TEST_F(CompactionCoordinatorTest, AppendTableFilesAreConcatenated) {
    auto logs = createTable("logs", appendSchema(baseOptions()));
    ASSERT_TRUE(logs);
    writeAndCommit(logs, "writer", 1, {{I(1), S("first")}});
    writeAndCommit(logs, "writer", 2, {{I(2), S("second")}});
    writeAndCommit(logs, "writer", 3, {{I(3), S("third")}});

    auto coordinator = logs->newCompactionCoordinator();
    CompactionOutcome outcome = coordinator->runNow(fullRequest());
    ASSERT_TRUE(outcome.compacted()) << outcome.toString();
    EXPECT_EQ(outcome.after.size(), 1u);
    EXPECT_EQ(outcome.after[0]->row_count, 3);

    auto rows = logs->newRead()->read();
    ASSERT_TRUE(rows.isOk());
    EXPECT_EQ(rows.value(), (std::vector<Row>{{I(1), S("first")}, {I(2), S("second")}, {I(3), S("third")}}));
}

TEST_F(CompactionCoordinatorTest, StoppedCoordinatorFailsNewRequests) {
    commitThreeRuns(table);
    auto coordinator = table->newCompactionCoordinator();
    coordinator->stop();

    CompactionOutcome outcome = coordinator->runNow(fullRequest());
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error->code, storage::ErrorCode::INTERNAL_ERROR);
    coordinator->waitForIdle();
    EXPECT_EQ(liveFileCount(table), 3u);
}

TEST_F(CompactionCoordinatorTest, RejectsIncompleteEnvironment) {
    operation::CompactionCoordinatorConfig config;
    EXPECT_THROW(CompactionCoordinator(operation::CompactionEnvironment{}, config), storage::StorageError);

    config.max_attempts = 0;
    EXPECT_FALSE(config.is_valid());
}
