//src/test/table.test.cpp
#include "test_utils.h"

#include <thread>

using namespace lakestore;
using namespace lakestore::test;

namespace {

// k BIGINT (pk), total BIGINT, note STRING.
schema::TableSchema engineSchema(const std::string& engine,
                                 const std::map<std::string, std::string>& overrides = {}) {
    std::map<std::string, std::string> options{
        {"merge-engine", engine},
        {"bucket", "2"},
        {"num-sorted-run.compaction-trigger", "20"},
    };
    if (engine == "aggregation") options["fields.total.aggregate-function"] = "sum";
    for (const auto& [key, value] : overrides) options[key] = value;
    return schema::TableSchema(0,
                               {{0, "k", DataType::BIGINT, false},
                                {1, "total", DataType::BIGINT, true},
                                {2, "note", DataType::STRING, true}},
                               {},
                               {"k"},
                               std::move(options));
}

struct Change {
    Row row;
    RowKind kind;
};

// Several commits of unique keys each, with nulls and retractions mixed in.
std::vector<std::vector<Change>> generateCommits(uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<std::vector<Change>> commits;
    for (int c = 0; c < 6; ++c) {
        std::vector<int64_t> keys(12);
        for (int64_t k = 0; k < 12; ++k) keys[static_cast<size_t>(k)] = k;
        std::shuffle(keys.begin(), keys.end(), rng);
        std::vector<Change> changes;
        for (size_t i = 0; i < 8; ++i) {
            Value total = rng() % 4 == 0 ? Null() : I(static_cast<int64_t>(rng() % 100));
            Value note = rng() % 3 == 0 ? Null() : S("n" + std::to_string(c) + "-" + std::to_string(i));
            RowKind kind = rng() % 5 == 0 ? RowKind::DELETE : RowKind::INSERT;
            changes.push_back({Row{I(keys[i]), total, note}, kind});
        }
        commits.push_back(std::move(changes));
    }
    return commits;
}

} // namespace

class TableTest : public TempDirTest {
protected:
    std::shared_ptr<table::FileStoreTable> createTable(const std::string& name, const schema::TableSchema& schema) {
        auto created = table::FileStoreTable::create(file_io, fs::joinPath(test_dir, name), schema);
        EXPECT_TRUE(created.isOk()) << created.error().toString();
        return created.isOk() ? created.value() : nullptr;
    }

    static std::vector<Row> readAll(const std::shared_ptr<table::FileStoreTable>& t,
                                    const operation::ScanOptions& options = operation::ScanOptions{}) {
        auto rows = t->newRead()->read(options);
        EXPECT_TRUE(rows.isOk()) << rows.error().toString();
        return rows.isOk() ? sortedRows(rows.value()) : std::vector<Row>{};
    }

    static void applyCommits(const std::shared_ptr<table::FileStoreTable>& t,
                             const std::vector<std::vector<Change>>& commits) {
        int64_t identifier = 0;
        for (const auto& changes : commits) {
            std::vector<Row> rows;
            std::vector<RowKind> kinds;
            for (const auto& change : changes) {
                rows.push_back(change.row);
                kinds.push_back(change.kind);
            }
            writeAndCommit(t, "writer", ++identifier, rows, kinds);
        }
    }
};

class MergeEngineEquivalenceTest : public TableTest, public ::testing::WithParamInterface<std::string> {};

TEST_P(MergeEngineEquivalenceTest, MergeOnReadMatchesFullCompaction) {
    auto t = createTable(GetParam(), engineSchema(GetParam()));
    ASSERT_TRUE(t);
    applyCommits(t, generateCommits(7));
    auto merged_on_read = readAll(t);
    ASSERT_FALSE(merged_on_read.empty());

    auto coordinator = t->newCompactionCoordinator();
    for (int32_t bucket = 0; bucket < 2; ++bucket) {
        operation::CompactionRequest request;
        request.bucket = bucket;
        request.full = true;
        auto outcome = coordinator->runNow(request);
        ASSERT_TRUE(outcome.ok()) << outcome.toString();
    }

    for (const auto& file : t->newScan()->plan().value().files()) {
        EXPECT_EQ(file->level, t->options().num_levels - 1);
    }
    EXPECT_EQ(readAll(t), merged_on_read);
    auto integrity = t->newScan()->verifyIntegrity();
    EXPECT_TRUE(integrity.isOk()) << integrity.error().toString();
}

// One large run at the top level with several small level-0 runs over it,
// in a single bucket whose strategy picks on run count.
class MinorCompactionTest : public MergeEngineEquivalenceTest {
protected:
    std::shared_ptr<table::FileStoreTable> createLayeredTable(const std::map<std::string, std::string>& extra = {}) {
        std::map<std::string, std::string> overrides{
            {"bucket", "1"},
            {"num-sorted-run.compaction-trigger", "3"},
            {"compaction.max-size-amplification-percent", "100000"},
        };
        for (const auto& [key, value] : extra) overrides[key] = value;
        auto t = createTable(GetParam(), engineSchema(GetParam(), overrides));
        if (!t) return nullptr;

        std::vector<Row> base;
        for (int64_t k = 0; k < 500; ++k) {
            base.push_back({I(k), I(k % 17), S("base-note-" + std::to_string(k * 7919))});
        }
        writeAndCommit(t, "writer", 1, base);
        operation::CompactionRequest full;
        full.full = true;
        auto outcome = t->newCompactionCoordinator()->runNow(full);
        EXPECT_TRUE(outcome.compacted()) << outcome.toString();

        auto commits = generateCommits(23);
        int64_t identifier = 1;
        for (const auto& changes : commits) {
            std::vector<Row> rows;
            std::vector<RowKind> kinds;
            for (const auto& change : changes) {
                rows.push_back(change.row);
                kinds.push_back(change.kind);
            }
            writeAndCommit(t, "writer", ++identifier, rows, kinds);
        }
        return t;
    }

    static std::map<int32_t, size_t> filesPerLevel(const std::shared_ptr<table::FileStoreTable>& t) {
        std::map<int32_t, size_t> levels;
        auto plan = t->newScan()->plan();
        EXPECT_TRUE(plan.isOk()) << plan.error().toString();
        if (!plan.isOk()) return levels;
        for (const auto& file : plan.value().files()) levels[file->level]++;
        return levels;
    }
};

TEST_P(MinorCompactionTest, StrategyPickMatchesMergeOnRead) {
    auto t = createLayeredTable();
    ASSERT_TRUE(t);
    const int32_t max_level = t->options().num_levels - 1;
    ASSERT_GT(filesPerLevel(t)[0], 2u);
    auto merged_on_read = readAll(t);
    ASSERT_FALSE(merged_on_read.empty());

    operation::CompactionRequest minor;
    minor.full = false;
    auto outcome = t->newCompactionCoordinator()->runNow(minor);
    ASSERT_TRUE(outcome.ok()) << outcome.toString();
    ASSERT_TRUE(outcome.compacted()) << outcome.toString();

    // The small runs merged among themselves; the top run was left alone.
    for (const auto& file : outcome.after) {
        EXPECT_GT(file->level, 0);
        EXPECT_LT(file->level, max_level);
    }
    auto levels = filesPerLevel(t);
    EXPECT_EQ(levels.count(0), 0u);
    EXPECT_GT(levels[max_level], 0u);

    EXPECT_EQ(readAll(t), merged_on_read);
    auto integrity = t->newScan()->verifyIntegrity();
    EXPECT_TRUE(integrity.isOk()) << integrity.error().toString();

    // A later full compaction still agrees.
    minor.full = true;
    ASSERT_TRUE(t->newCompactionCoordinator()->runNow(minor).ok());
    EXPECT_EQ(readAll(t), merged_on_read);
}

INSTANTIATE_TEST_SUITE_P(AllEngines,
                         MinorCompactionTest,
                         ::testing::Values("deduplicate", "partial-update", "aggregation", "first-row"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                             std::string name = info.param;
                             std::replace(name.begin(), name.end(), '-', '_');
                             return name;
                         });

class RemoveOnDeleteCompactionTest : public MinorCompactionTest {};

TEST_P(RemoveOnDeleteCompactionTest, StrategyPickIsPromotedToFull) {
    auto t = createLayeredTable({{GetParam() + ".remove-record-on-delete", "true"}});
    ASSERT_TRUE(t);
    const int32_t max_level = t->options().num_levels - 1;
    auto merged_on_read = readAll(t);

    operation::CompactionRequest minor;
    minor.full = false;
    auto outcome = t->newCompactionCoordinator()->runNow(minor);
    ASSERT_TRUE(outcome.ok()) << outcome.toString();
    ASSERT_TRUE(outcome.compacted()) << outcome.toString();

    auto levels = filesPerLevel(t);
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_EQ(levels.begin()->first, max_level);
    EXPECT_EQ(readAll(t), merged_on_read);
}

INSTANTIATE_TEST_SUITE_P(OrderSensitiveEngines,
                         RemoveOnDeleteCompactionTest,
                         ::testing::Values("partial-update", "aggregation"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                             std::string name = info.param;
                             std::replace(name.begin(), name.end(), '-', '_');
                             return name;
                         });

INSTANTIATE_TEST_SUITE_P(AllEngines,
                         MergeEngineEquivalenceTest,
                         ::testing::Values("deduplicate", "partial-update", "aggregation", "first-row"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                             std::string name = info.param;
                             std::replace(name.begin(), name.end(), '-', '_');
                             return name;
                         });

TEST_F(TableTest, DeduplicateMatchesLastWriteModel) {
    auto t = createTable("dedup", engineSchema("deduplicate"));
    ASSERT_TRUE(t);
    auto commits = generateCommits(11);
    applyCommits(t, commits);

    std::map<int64_t, Row> model;
    for (const auto& changes : commits) {
        for (const auto& change : changes) {
            int64_t key = std::get<int64_t>(change.row[0]);
            if (change.kind == RowKind::DELETE) {
                model.erase(key);
            } else {
                model[key] = change.row;
            }
        }
    }
    std::vector<Row> expected;
    for (const auto& [key, row] : model) expected.push_back(row);
    EXPECT_EQ(readAll(t), sortedRows(expected));
}

TEST_F(TableTest, ReopenedTableSeesCommittedData) {
    const std::string path = fs::joinPath(test_dir, "reopen");
    {
        auto created = table::FileStoreTable::create(file_io, path, partitionedSchema());
        ASSERT_TRUE(created.isOk()) << created.error().toString();
        writeAndCommit(created.value(), "writer", 1, {{S("2024-01-01"), I(1), S("a")}, {S("2024-01-02"), I(2), S("b")}});
    }
    auto opened = table::FileStoreTable::open(file_io, path);
    ASSERT_TRUE(opened.isOk()) << opened.error().toString();
    EXPECT_EQ(opened.value()->schema().partitionKeys(), (std::vector<std::string>{"dt"}));
    EXPECT_EQ(readAll(opened.value()).size(), 2u);

    operation::ScanOptions one_day;
    one_day.partition_filter = fs::PartitionSpec{{"dt", "2024-01-02"}};
    EXPECT_EQ(readAll(opened.value(), one_day), (std::vector<Row>{{S("2024-01-02"), I(2), S("b")}}));

    auto missing = table::FileStoreTable::open(file_io, fs::joinPath(test_dir, "nowhere"));
    EXPECT_FALSE(missing.isOk());
}

TEST_F(TableTest, RowsLandInTheirHashBucket) {
    auto t = createTable("buckets", keyValueSchema({{"bucket", "4"}}));
    ASSERT_TRUE(t);
    std::vector<Row> rows;
    for (int64_t k = 0; k < 64; ++k) rows.push_back({I(k), S("v" + std::to_string(k))});
    writeAndCommit(t, "writer", 1, rows);

    auto router = t->newWrite();
    std::set<int32_t> used;
    size_t total = 0;
    for (int32_t bucket = 0; bucket < 4; ++bucket) {
        operation::ScanOptions options;
        options.bucket = bucket;
        for (const auto& row : readAll(t, options)) {
            EXPECT_EQ(router->bucketOf(row), bucket);
            used.insert(bucket);
            total++;
        }
    }
    EXPECT_EQ(total, 64u);
    EXPECT_GT(used.size(), 1u);
}

TEST_F(TableTest, PinnedReadSurvivesCompactionAndExpiration) {
    auto t = createTable("pinned", keyValueSchema({
        {"snapshot.num-retained.min", "1"},
        {"snapshot.num-retained.max", "1"},
        {"snapshot.time-retained", "0ms"},
    }));
    ASSERT_TRUE(t);
    writeAndCommit(t, "writer", 1, {{I(1), S("a")}, {I(2), S("b")}});
    writeAndCommit(t, "writer", 2, {{I(2), S("b2")}});

    auto lease = t->pinSnapshot();
    ASSERT_TRUE(lease.isOk()) << lease.error().toString();
    snapshot::SnapshotLease held = std::move(lease).value();
    EXPECT_EQ(held.snapshotId(), 2);

    operation::ScanOptions at_pin;
    at_pin.snapshot_id = held.snapshotId();
    auto plan = t->newScan()->plan(at_pin);
    ASSERT_TRUE(plan.isOk());
    const std::vector<Row> expected{{I(1), S("a")}, {I(2), S("b2")}};

    // Compaction plus post-commit maintenance would expire snapshot 2 without the pin.
    auto coordinator = t->newCompactionCoordinator();
    operation::CompactionRequest full;
    full.full = true;
    ASSERT_TRUE(coordinator->runNow(full).compacted());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    writeAndCommit(t, "writer", 3, {{I(3), S("c")}});

    auto ids = t->snapshotManager()->listSnapshotIds().value();
    EXPECT_EQ(ids.front(), 2);

    auto pinned_rows = t->newRead()->read(plan.value());
    ASSERT_TRUE(pinned_rows.isOk()) << pinned_rows.error().toString();
    EXPECT_EQ(sortedRows(pinned_rows.value()), expected);
    EXPECT_EQ(readAll(t).size(), 3u);

    ASSERT_TRUE(held.release().isOk());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    writeAndCommit(t, "writer", 4, {{I(4), S("d")}});
    ids = t->snapshotManager()->listSnapshotIds().value();
    EXPECT_EQ(ids, (std::vector<int64_t>{5}));
    for (const auto& file : plan.value().files()) {
        if (file->level == 0) {
            EXPECT_FALSE(file_io->exists(t->pathFactory()->dataFilePath(*file)).value()) << file->file_name;
        }
    }
    auto integrity = t->newScan()->verifyIntegrity();
    EXPECT_TRUE(integrity.isOk()) << integrity.error().toString();
}

TEST_F(TableTest, AbandonedWriteIsCleanedAsOrphan) {
    auto t = createTable("orphans", keyValueSchema());
    ASSERT_TRUE(t);
    writeAndCommit(t, "writer", 1, {{I(1), S("a")}});

    // Files written and prepared but never committed.
    auto write = t->newWrite();
    ASSERT_TRUE(write->write(Row{I(2), S("lost")}).isOk());
    auto abandoned = write->prepareCommit();
    ASSERT_TRUE(abandoned.isOk());
    ASSERT_EQ(abandoned.value().size(), 1u);
    ASSERT_EQ(abandoned.value()[0].new_files.size(), 1u);
    std::string lost_path = t->pathFactory()->dataFilePath(*abandoned.value()[0].new_files[0]);
    ASSERT_TRUE(file_io->exists(lost_path).value());

    auto cleaned = t->newOrphanFilesCleaner()->clean(currentTimeMillis() + 1000);
    ASSERT_TRUE(cleaned.isOk()) << cleaned.error().toString();
    EXPECT_EQ(cleaned.value().deleted_files, 1);
    EXPECT_FALSE(file_io->exists(lost_path).value());
    EXPECT_EQ(readAll(t), (std::vector<Row>{{I(1), S("a")}}));
    EXPECT_TRUE(t->newScan()->verifyIntegrity().isOk());
}

TEST_F(TableTest, WriteOnlyTableSkipsMaintenance) {
    auto t = createTable("write_only", keyValueSchema({
        {"write-only", "true"},
        {"snapshot.num-retained.min", "1"},
        {"snapshot.num-retained.max", "1"},
        {"snapshot.time-retained", "0ms"},
    }));
    ASSERT_TRUE(t);
    for (int64_t i = 1; i <= 3; ++i) writeAndCommit(t, "writer", i, {{I(i), S("v")}});
    EXPECT_EQ(t->snapshotManager()->listSnapshotIds().value(), (std::vector<int64_t>{1, 2, 3}));
}
