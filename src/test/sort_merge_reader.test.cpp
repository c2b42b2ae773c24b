//src/test/sort_merge_reader.test.cpp
#include "test_utils.h"
#include "../../include/lsm/sort_merge_reader.h"

using namespace lakestore;
using namespace lakestore::test;
using lsm::KeyRange;
using lsm::RecordSource;
using lsm::SortMergeReader;
using lsm::VectorRecordSource;

namespace {

KeyValue kv(int64_t key, int64_t seq, const std::string& v, RowKind kind = RowKind::INSERT) {
    return KeyValue(Row{I(key)}, seq, kind, Row{I(key), S(v)});
}

std::unique_ptr<RecordSource> source(std::vector<KeyValue> records) {
    return std::make_unique<VectorRecordSource>(std::move(records));
}

std::vector<std::pair<int64_t, std::string>> keysAndValues(const std::vector<KeyValue>& records) {
    std::vector<std::pair<int64_t, std::string>> out;
    for (const auto& r : records) {
        out.emplace_back(std::get<int64_t>(r.key[0]), std::get<std::string>(r.value[1]));
    }
    return out;
}

} // namespace

class SortMergeReaderTest : public TempDirTest {
protected:
    lsm::MergeFunctionFactory dedup{keyValueSchema()};

    io::KeyValueFileContext fileContext(int64_t target_file_size) {
        io::KeyValueFileContext context;
        context.file_io = file_io;
        context.path_factory = std::make_shared<fs::FileStorePathFactory>(test_dir, std::vector<std::string>{});
        context.format = std::make_shared<io::RowFileFormat>(CompressionType::ZSTD, 4096);
        context.key_arity = 1;
        context.value_arity = 2;
        context.target_file_size = target_file_size;
        return context;
    }

    std::vector<io::DataFileMetaPtr> writeRun(const io::KeyValueFileContext& context, int32_t level,
                                              const std::vector<KeyValue>& records) {
        io::RollingKeyValueWriter writer(context, Row{}, 0, level, io::FileSource::APPEND);
        for (const auto& r : records) {
            auto status = writer.write(r);
            EXPECT_TRUE(status.isOk()) << status.error().toString();
        }
        auto files = writer.close();
        EXPECT_TRUE(files.isOk()) << files.error().toString();
        return files.isOk() ? files.value() : std::vector<io::DataFileMetaPtr>{};
    }
};

TEST_F(SortMergeReaderTest, NewestVersionWinsAcrossSources) {
    std::vector<std::unique_ptr<RecordSource>> sources;
    sources.push_back(source({kv(1, 5, "new"), kv(3, 6, "c")}));
    sources.push_back(source({kv(1, 1, "old"), kv(2, 2, "b")}));
    SortMergeReader reader(std::move(sources), dedup.create());

    auto all = reader.readAll();
    ASSERT_TRUE(all.isOk()) << all.error().toString();
    EXPECT_EQ(keysAndValues(all.value()),
              (std::vector<std::pair<int64_t, std::string>>{{1, "new"}, {2, "b"}, {3, "c"}}));
    EXPECT_EQ(all.value()[0].sequence_number, 5);
}

TEST_F(SortMergeReaderTest, EqualSequenceFavoursTheNewerRun) {
    std::vector<std::unique_ptr<RecordSource>> sources;
    sources.push_back(source({kv(7, 3, "newer-run")}));
    sources.push_back(source({kv(7, 3, "older-run")}));
    SortMergeReader reader(std::move(sources), dedup.create());

    auto all = reader.readAll();
    ASSERT_TRUE(all.isOk());
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(std::get<std::string>(all.value()[0].value[1]), "newer-run");
}

TEST_F(SortMergeReaderTest, RetractionSurfacesAsDeleteRecord) {
    std::vector<std::unique_ptr<RecordSource>> sources;
    sources.push_back(source({kv(1, 9, "a", RowKind::DELETE)}));
    sources.push_back(source({kv(1, 1, "a"), kv(2, 2, "b")}));
    SortMergeReader reader(std::move(sources), dedup.create());

    auto first = reader.next();
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->kind, RowKind::DELETE);
    auto second = reader.next();
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(second.value()->kind, RowKind::INSERT);
    EXPECT_FALSE(reader.next().value().has_value());
}

TEST_F(SortMergeReaderTest, FirstRowDropsKeysWithoutInsert) {
    lsm::MergeFunctionFactory first_row(keyValueSchema({{"merge-engine", "first-row"}}));
    std::vector<std::unique_ptr<RecordSource>> sources;
    sources.push_back(source({kv(1, 4, "later"), kv(2, 5, "gone", RowKind::DELETE)}));
    sources.push_back(source({kv(1, 2, "first")}));
    SortMergeReader reader(std::move(sources), first_row.create());

    auto all = reader.readAll();
    ASSERT_TRUE(all.isOk());
    EXPECT_EQ(keysAndValues(all.value()), (std::vector<std::pair<int64_t, std::string>>{{1, "first"}}));
}

TEST_F(SortMergeReaderTest, RangeBoundsTheOutput) {
    KeyRange range{Row{I(2)}, Row{I(3)}};
    EXPECT_FALSE(range.contains(Row{I(1)}));
    EXPECT_TRUE(range.contains(Row{I(3)}));
    EXPECT_FALSE(range.overlaps(*makeFile("low", 0, 0, 1, 1, 1)));
    EXPECT_TRUE(range.overlaps(*makeFile("span", 0, 0, 9, 1, 1)));
    EXPECT_TRUE(KeyRange{}.contains(Row{I(100)}));

    std::vector<std::unique_ptr<RecordSource>> sources;
    sources.push_back(source({kv(1, 1, "a"), kv(2, 2, "b"), kv(3, 3, "c"), kv(4, 4, "d")}));
    SortMergeReader reader(std::move(sources), dedup.create(), range);
    auto all = reader.readAll();
    ASSERT_TRUE(all.isOk());
    EXPECT_EQ(keysAndValues(all.value()), (std::vector<std::pair<int64_t, std::string>>{{2, "b"}, {3, "c"}}));
}

TEST_F(SortMergeReaderTest, MergesRunsReadFromDataFiles) {
    // A small target size rolls the older run into several files.
    auto context = fileContext(256);
    std::vector<KeyValue> older;
    for (int64_t k = 0; k < 100; ++k) older.push_back(kv(k, k, "v0-" + std::to_string(k)));
    std::vector<KeyValue> newer;
    for (int64_t k = 0; k < 100; k += 10) newer.push_back(kv(k, 100 + k, "v1-" + std::to_string(k)));

    auto old_files = writeRun(context, 2, older);
    ASSERT_GT(old_files.size(), 1u);
    auto new_files = writeRun(context, 0, newer);
    ASSERT_FALSE(new_files.empty());

    auto levels = lsm::Levels::create([&] {
        std::vector<io::DataFileMetaPtr> all(old_files);
        all.insert(all.end(), new_files.begin(), new_files.end());
        return all;
    }(), 3);
    ASSERT_TRUE(levels.isOk()) << levels.error().toString();

    auto readers = std::make_shared<io::KeyValueFileReaderFactory>(context);
    SortMergeReader reader(lsm::createRunSources(levels.value().levelSortedRuns(), readers), dedup.create());
    auto merged = reader.readAll();
    ASSERT_TRUE(merged.isOk()) << merged.error().toString();
    ASSERT_EQ(merged.value().size(), 100u);
    for (int64_t k = 0; k < 100; ++k) {
        std::string expected = (k % 10 == 0 ? "v1-" : "v0-") + std::to_string(k);
        EXPECT_EQ(std::get<std::string>(merged.value()[static_cast<size_t>(k)].value[1]), expected);
    }

    // A bounded read opens only the overlapping files.
    KeyRange range{Row{I(40)}, Row{I(45)}};
    SortMergeReader bounded(lsm::createRunSources(levels.value().levelSortedRuns(), readers, range),
                            dedup.create(), range);
    auto part = bounded.readAll();
    ASSERT_TRUE(part.isOk());
    ASSERT_EQ(part.value().size(), 6u);
    EXPECT_EQ(std::get<std::string>(part.value()[0].value[1]), "v1-40");
    EXPECT_EQ(std::get<std::string>(part.value()[5].value[1]), "v0-45");
}

TEST_F(SortMergeReaderTest, MissingFileSurfacesAsError) {
    auto context = fileContext(1 << 20);
    auto files = writeRun(context, 1, {kv(1, 1, "a")});
    ASSERT_EQ(files.size(), 1u);
    ASSERT_TRUE(file_io->deleteFile(context.path_factory->dataFilePath(*files[0])).isOk());

    auto readers = std::make_shared<io::KeyValueFileReaderFactory>(context);
    std::vector<lsm::LevelSortedRun> runs{lsm::LevelSortedRun(1, lsm::SortedRun::fromSorted(files))};
    SortMergeReader reader(lsm::createRunSources(runs, readers), dedup.create());
    auto result = reader.readAll();
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().code, storage::ErrorCode::FILE_NOT_FOUND);
}
