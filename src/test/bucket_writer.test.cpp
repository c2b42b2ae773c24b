//src/test/bucket_writer.test.cpp
#include "test_utils.h"
#include "../../include/lsm/bucket_writer.h"

using namespace lakestore;
using namespace lakestore::test;

TEST(WriteBufferTest, DrainsInKeyAndSequenceOrder) {
    lsm::WriteBuffer buffer(1 << 20);
    EXPECT_TRUE(buffer.isEmpty());
    buffer.put(KeyValue(Row{I(2)}, 1, RowKind::INSERT, Row{I(2), S("a")}));
    buffer.put(KeyValue(Row{I(1)}, 2, RowKind::INSERT, Row{I(1), S("b")}));
    buffer.put(KeyValue(Row{I(2)}, 3, RowKind::DELETE, Row{I(2), S("a")}));
    EXPECT_EQ(buffer.size(), 3u);
    EXPECT_GT(buffer.memoryUsage(), 0);

    auto records = buffer.drainSorted();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].sequence_number, 2);
    EXPECT_EQ(records[1].sequence_number, 1);
    EXPECT_EQ(records[2].sequence_number, 3);
    EXPECT_TRUE(buffer.isEmpty());
    EXPECT_EQ(buffer.memoryUsage(), 0);
}

TEST(WriteBufferTest, ReportsFullAtLimit) {
    lsm::WriteBuffer buffer(64);
    EXPECT_FALSE(buffer.isFull());
    buffer.put(KeyValue(Row{I(1)}, 1, RowKind::INSERT, Row{I(1), S(std::string(100, 'x'))}));
    EXPECT_TRUE(buffer.isFull());
    buffer.clear();
    EXPECT_FALSE(buffer.isFull());
}

class BucketWriterTest : public TempDirTest {
protected:
    io::KeyValueFileContext fileContext(std::shared_ptr<fs::FileIO> io, size_t key_arity = 1) {
        io::KeyValueFileContext context;
        context.file_io = std::move(io);
        context.path_factory = std::make_shared<fs::FileStorePathFactory>(test_dir, std::vector<std::string>{});
        context.format = std::make_shared<io::RowFileFormat>(CompressionType::NONE, 4096);
        context.key_arity = key_arity;
        context.value_arity = 2;
        return context;
    }

    std::vector<KeyValue> readBack(const io::KeyValueFileContext& context, const io::DataFileMeta& file) {
        io::KeyValueFileReaderFactory readers(context);
        auto records = readers.readAll(file);
        EXPECT_TRUE(records.isOk()) << records.error().toString();
        return records.isOk() ? records.value() : std::vector<KeyValue>{};
    }

    size_t filesInBucket() {
        auto listed = file_io->listFiles(fs::joinPath(test_dir, "bucket-0"));
        EXPECT_TRUE(listed.isOk());
        return listed.isOk() ? listed.value().size() : 0;
    }
};

TEST_F(BucketWriterTest, ContinuesRestoredSequenceNumbers) {
    auto context = fileContext(file_io);
    lsm::MergeTreeWriter writer(context, Row{}, 0, 10, 1 << 20);
    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(3)}, Row{I(3), S("c")}).isOk());
    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(1)}, Row{I(1), S("a")}).isOk());
    ASSERT_TRUE(writer.write(RowKind::DELETE, Row{I(3)}, Row{I(3), S("c")}).isOk());
    EXPECT_EQ(writer.bufferedRecords(), 3u);
    EXPECT_EQ(writer.maxSequenceNumber(), 13);

    auto files = writer.prepareCommit();
    ASSERT_TRUE(files.isOk()) << files.error().toString();
    ASSERT_EQ(files.value().size(), 1u);
    const auto& file = *files.value().front();
    EXPECT_EQ(file.level, 0);
    EXPECT_EQ(file.min_sequence_number, 11);
    EXPECT_EQ(file.max_sequence_number, 13);
    EXPECT_EQ(file.row_count, 3);
    EXPECT_EQ(file.delete_row_count, 1);
    EXPECT_EQ(file.min_key, (Row{I(1)}));
    EXPECT_EQ(file.max_key, (Row{I(3)}));

    // Every version is kept; merging is left to readers and compaction.
    auto records = readBack(context, file);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1].sequence_number, 11);
    EXPECT_EQ(records[2].kind, RowKind::DELETE);

    auto again = writer.prepareCommit();
    ASSERT_TRUE(again.isOk());
    EXPECT_TRUE(again.value().empty());
}

TEST_F(BucketWriterTest, FullBufferFlushesOnWrite) {
    auto context = fileContext(file_io);
    lsm::MergeTreeWriter writer(context, Row{}, 0, 0, 1);
    for (int64_t k = 0; k < 3; ++k) {
        ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(k)}, Row{I(k), S("v")}).isOk());
        EXPECT_EQ(writer.bufferedRecords(), 0u);
    }
    auto files = writer.prepareCommit();
    ASSERT_TRUE(files.isOk());
    EXPECT_EQ(files.value().size(), 3u);
}

TEST_F(BucketWriterTest, FailedFlushDiscardsBufferOnly) {
    auto faulty = std::make_shared<FaultInjectingFileIO>(file_io);
    auto context = fileContext(faulty);
    lsm::MergeTreeWriter writer(context, Row{}, 0, 0, 1 << 20);

    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(1)}, Row{I(1), S("kept")}).isOk());
    ASSERT_TRUE(writer.flush().isOk());

    faulty->failWrites("data-", 1, storage::ErrorCode::DISK_FULL);
    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(2)}, Row{I(2), S("lost")}).isOk());
    auto failed = writer.flush();
    ASSERT_FALSE(failed.isOk());
    EXPECT_EQ(failed.error().code, storage::ErrorCode::DISK_FULL);
    EXPECT_EQ(writer.bufferedRecords(), 0u);
    EXPECT_EQ(filesInBucket(), 1u);

    auto files = writer.prepareCommit();
    ASSERT_TRUE(files.isOk());
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(readBack(context, *files.value().front()).front().value, (Row{I(1), S("kept")}));
}

TEST_F(BucketWriterTest, AbortDeletesUncommittedFiles) {
    auto context = fileContext(file_io);
    {
        lsm::MergeTreeWriter writer(context, Row{}, 0, 0, 1 << 20);
        ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(1)}, Row{I(1), S("a")}).isOk());
        ASSERT_TRUE(writer.flush().isOk());
        ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(2)}, Row{I(2), S("b")}).isOk());
        EXPECT_EQ(filesInBucket(), 1u);
        writer.abort();
        EXPECT_EQ(filesInBucket(), 0u);
        EXPECT_EQ(writer.bufferedRecords(), 0u);
    }
    {
        // Dropping a writer without handing its files over discards them too.
        lsm::MergeTreeWriter writer(context, Row{}, 0, 0, 1 << 20);
        ASSERT_TRUE(writer.write(RowKind::INSERT, Row{I(1)}, Row{I(1), S("a")}).isOk());
        ASSERT_TRUE(writer.flush().isOk());
    }
    EXPECT_EQ(filesInBucket(), 0u);
}

TEST_F(BucketWriterTest, AppendOnlyKeepsInsertionOrder) {
    auto context = fileContext(file_io, 0);
    lsm::AppendOnlyWriter writer(context, Row{}, 0, 0, 1 << 20);
    EXPECT_EQ(writer.write(RowKind::DELETE, Row{}, Row{I(1), S("x")}).error().code, storage::ErrorCode::INVALID_VALUE);
    EXPECT_EQ(writer.write(RowKind::INSERT, Row{I(1)}, Row{I(1), S("x")}).error().code,
              storage::ErrorCode::INVALID_VALUE);

    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{}, Row{I(9), S("first")}).isOk());
    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{}, Row{I(1), S("second")}).isOk());
    ASSERT_TRUE(writer.write(RowKind::INSERT, Row{}, Row{I(9), S("first")}).isOk());
    auto files = writer.prepareCommit();
    ASSERT_TRUE(files.isOk());
    ASSERT_EQ(files.value().size(), 1u);

    auto records = readBack(context, *files.value().front());
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].value, (Row{I(9), S("first")}));
    EXPECT_EQ(records[1].value, (Row{I(1), S("second")}));
    EXPECT_EQ(records[2].value, (Row{I(9), S("first")}));
}

class TableWriteTest : public TempDirTest {
protected:
    std::shared_ptr<table::FileStoreTable> createTable(const schema::TableSchema& schema) {
        auto created = table::FileStoreTable::create(file_io, fs::joinPath(test_dir, "t"), schema);
        EXPECT_TRUE(created.isOk()) << created.error().toString();
        return created.isOk() ? created.value() : nullptr;
    }
};

TEST_F(TableWriteTest, RoutesRowsByPartitionAndBucket) {
    auto table = createTable(partitionedSchema({{"bucket", "4"}}));
    ASSERT_TRUE(table);
    auto write = table->newWrite();

    std::set<int32_t> buckets;
    for (int64_t k = 0; k < 64; ++k) {
        Row row{S(k % 2 == 0 ? "2024-01-01" : "2024-01-02"), I(k), S("v")};
        int32_t bucket = write->bucketOf(row);
        ASSERT_GE(bucket, 0);
        ASSERT_LT(bucket, 4);
        // Routing depends on the bucket key only.
        EXPECT_EQ(bucket, write->bucketOf(Row{S("other"), I(k), S("changed")}));
        buckets.insert(bucket);
        ASSERT_TRUE(write->write(row).isOk());
    }
    EXPECT_GT(buckets.size(), 1u);
    EXPECT_EQ(write->partitionOf(Row{S("2024-01-01"), I(1), Null()}), (Row{S("2024-01-01")}));

    auto messages = write->prepareCommit();
    ASSERT_TRUE(messages.isOk());
    EXPECT_EQ(messages.value().size(), write->numWriters());
    int64_t rows = 0;
    for (const auto& m : messages.value()) {
        EXPECT_EQ(m.total_buckets, 4);
        for (const auto& f : m.new_files) {
            EXPECT_EQ(f->bucket, m.bucket);
            EXPECT_EQ(f->partition, m.partition);
            rows += f->row_count;
        }
    }
    EXPECT_EQ(rows, 64);
}

TEST_F(TableWriteTest, RejectsMisroutedRows) {
    auto table = createTable(partitionedSchema({{"bucket", "4"}}));
    ASSERT_TRUE(table);
    auto write = table->newWrite();
    Row row{S("2024-01-01"), I(7), S("v")};

    table::WriteRequest wrong_partition;
    wrong_partition.partition = Row{S("2024-01-02")};
    wrong_partition.rows = {row};
    EXPECT_EQ(write->write(wrong_partition).error().code, storage::ErrorCode::INVALID_VALUE);

    table::WriteRequest wrong_bucket;
    wrong_bucket.bucket = (write->bucketOf(row) + 1) % 4;
    wrong_bucket.rows = {row};
    EXPECT_EQ(write->write(wrong_bucket).error().code, storage::ErrorCode::INVALID_VALUE);

    table::WriteRequest out_of_range;
    out_of_range.bucket = 4;
    out_of_range.rows = {row};
    EXPECT_EQ(write->write(out_of_range).error().code, storage::ErrorCode::INVALID_VALUE);

    table::WriteRequest bad_kinds;
    bad_kinds.rows = {row, row};
    bad_kinds.kinds = {RowKind::INSERT};
    EXPECT_EQ(write->write(bad_kinds).error().code, storage::ErrorCode::INVALID_VALUE);

    auto invalid = write->write(Row{S("2024-01-01"), S("not a number"), S("v")});
    ASSERT_FALSE(invalid.isOk());
    EXPECT_EQ(invalid.error().code, storage::ErrorCode::SCHEMA_VIOLATION);

    table::WriteRequest matching;
    matching.partition = Row{S("2024-01-01")};
    matching.bucket = write->bucketOf(row);
    matching.rows = {row};
    EXPECT_TRUE(write->write(matching).isOk());
    EXPECT_EQ(write->numWriters(), 1u);
    write->abort();
    EXPECT_EQ(write->numWriters(), 0u);
}

TEST_F(TableWriteTest, FailedPrepareDeletesFilesOfEveryBucket) {
    auto io = std::make_shared<FaultInjectingFileIO>(file_io);
    auto created = table::FileStoreTable::create(io, fs::joinPath(test_dir, "faulty"), partitionedSchema());
    ASSERT_TRUE(created.isOk()) << created.error().toString();
    auto table = created.value();
    auto write = table->newWrite();

    // Writers are prepared in partition order, so the first one succeeds.
    for (int64_t k = 0; k < 8; ++k) {
        ASSERT_TRUE(write->write(Row{S("2024-01-01"), I(k), S("a")}).isOk());
        ASSERT_TRUE(write->write(Row{S("2024-01-02"), I(k), S("b")}).isOk());
    }
    io->failWrites("dt=2024-01-02", 10, storage::ErrorCode::DISK_FULL);

    auto messages = write->prepareCommit();
    ASSERT_FALSE(messages.isOk());
    EXPECT_GT(io->injectedFailures(), 0);
    EXPECT_EQ(write->numWriters(), 0u);

    auto files = file_io->listFilesRecursive(table->path());
    ASSERT_TRUE(files.isOk()) << files.error().toString();
    for (const auto& status : files.value()) {
        EXPECT_EQ(fs::fileNameOf(status.path).rfind(fs::FileStorePathFactory::DATA_FILE_PREFIX, 0), std::string::npos)
            << status.path;
    }
}

TEST_F(TableWriteTest, AppendTableAcceptsExplicitBucket) {
    auto table = createTable(appendSchema({{"bucket", "3"}}));
    ASSERT_TRUE(table);
    auto write = table->newWrite();

    table::WriteRequest request;
    request.bucket = 2;
    request.rows = {{I(1), S("a")}, {I(2), S("b")}};
    ASSERT_TRUE(write->write(request).isOk());

    auto messages = write->prepareCommit();
    ASSERT_TRUE(messages.isOk());
    ASSERT_EQ(messages.value().size(), 1u);
    EXPECT_EQ(messages.value()[0].bucket, 2);
}

TEST_F(TableWriteTest, NewWriterContinuesCommittedSequence) {
    auto table = createTable(keyValueSchema());
    ASSERT_TRUE(table);
    writeAndCommit(table, "writer", 1, {{I(1), S("a")}, {I(2), S("b")}});

    auto write = table->newWrite();
    ASSERT_TRUE(write->write(Row{I(1), S("a2")}).isOk());
    auto messages = write->prepareCommit();
    ASSERT_TRUE(messages.isOk());
    ASSERT_EQ(messages.value().size(), 1u);
    EXPECT_EQ(messages.value()[0].new_files.front()->min_sequence_number, 3);
}
