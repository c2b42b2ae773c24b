//src/test/manifest.test.cpp
#include "test_utils.h"
#include "../../include/manifest/manifest_file.h"

#include <cmath>
#include <limits>

using namespace lakestore;
using namespace lakestore::test;
using manifest::FileEntry;
using manifest::FileKind;
using manifest::ManifestEntry;
using manifest::ManifestFileMeta;

namespace {

ManifestEntry addOf(const io::DataFileMetaPtr& f) { return ManifestEntry(FileKind::ADD, 1, f); }
ManifestEntry deleteOf(const io::DataFileMetaPtr& f) { return ManifestEntry(FileKind::DELETE, 1, f); }

std::set<std::string> liveNames(const std::vector<ManifestEntry>& entries) {
    std::set<std::string> names;
    for (const auto& e : entries) {
        EXPECT_EQ(e.kind, FileKind::ADD);
        names.insert(e.file->file_name);
    }
    return names;
}

} // namespace

TEST(FileEntryTest, AddThenDeleteCancels) {
    auto a = makeFile("data-a", 0, 1, 5, 1, 5);
    auto b = makeFile("data-b", 0, 6, 9, 6, 9);
    auto merged = FileEntry::mergeEntries({addOf(a), addOf(b), deleteOf(a)});
    ASSERT_TRUE(merged.isOk());
    ASSERT_EQ(merged.value().size(), 1u);
    EXPECT_EQ(merged.value()[0].file->file_name, "data-b");
}

TEST(FileEntryTest, DeleteOfUnseenFileStaysPending) {
    auto a = makeFile("data-a", 0, 1, 5, 1, 5);
    FileEntry::MergedEntries merged;
    ASSERT_TRUE(FileEntry::mergeEntries({deleteOf(a)}, merged).isOk());
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged.begin()->second.kind, FileKind::DELETE);

    auto status = FileEntry::requireNoDeletes(merged);
    ASSERT_FALSE(status.isOk());
    EXPECT_EQ(status.error().code, storage::ErrorCode::MANIFEST_ERROR);
}

TEST(FileEntryTest, DuplicateAddOrDeleteIsCorruption) {
    auto a = makeFile("data-a", 0, 1, 5, 1, 5);

    auto twice_added = FileEntry::mergeEntries({addOf(a), addOf(a)});
    ASSERT_FALSE(twice_added.isOk());
    EXPECT_EQ(twice_added.error().code, storage::ErrorCode::MANIFEST_ERROR);

    auto twice_deleted = FileEntry::mergeEntries({deleteOf(a), deleteOf(a)});
    ASSERT_FALSE(twice_deleted.isOk());

    // Re-adding a file with a pending delete is also rejected.
    auto readded = FileEntry::mergeEntries({deleteOf(a), addOf(a)});
    ASSERT_FALSE(readded.isOk());
}

TEST(FileEntryTest, IdentityIncludesPartitionAndBucket) {
    auto p1 = makeFile("data-x", 0, 1, 1, 1, 1, 100, {S("2024-01-01")}, 0);
    auto p2 = makeFile("data-x", 0, 1, 1, 1, 1, 100, {S("2024-01-02")}, 0);
    auto b1 = makeFile("data-x", 0, 1, 1, 1, 1, 100, {S("2024-01-01")}, 1);
    auto merged = FileEntry::mergeEntries({addOf(p1), addOf(p2), addOf(b1), deleteOf(p2)});
    ASSERT_TRUE(merged.isOk());
    EXPECT_EQ(merged.value().size(), 2u);
}

class ManifestFileTest : public TempDirTest {
protected:
    manifest::ManifestContext context;

    void SetUp() override {
        TempDirTest::SetUp();
        context.file_io = file_io;
        context.path_factory = std::make_shared<fs::FileStorePathFactory>(test_dir, std::vector<std::string>{"dt"});
        context.codec = std::make_shared<manifest::JsonMetadataCodec>();
        context.compression = CompressionType::ZSTD;
        context.io_retry = fs::IoRetryPolicy{2, std::chrono::milliseconds(1)};
        context.schema_id = 3;
    }

    std::vector<ManifestEntry> addEntries(const std::string& prefix, int n, const std::string& dt = "2024-01-01") {
        std::vector<ManifestEntry> entries;
        for (int i = 0; i < n; ++i) {
            entries.push_back(addOf(makeFile(prefix + std::to_string(i), 0, i, i, i, i, 100, {S(dt)})));
        }
        return entries;
    }

    size_t manifestObjectCount() {
        auto files = file_io->listFiles(context.path_factory->manifestDirectory());
        EXPECT_TRUE(files.isOk());
        size_t n = 0;
        for (const auto& f : files.value()) {
            if (fs::fileNameOf(f.path)[0] != '.') n++;
        }
        return n;
    }
};

TEST_F(ManifestFileTest, WriteAndReadPreservesEntries) {
    auto meta = std::make_shared<io::DataFileMeta>();
    meta->file_name = "data-stats";
    meta->partition = {S("2024-01-01")};
    meta->bucket = 2;
    meta->level = 3;
    meta->min_key = {I(-5)};
    meta->max_key = {I(42)};
    meta->min_sequence_number = 10;
    meta->max_sequence_number = 20;
    meta->row_count = 11;
    meta->delete_row_count = 1;
    meta->file_size = 4096;
    meta->schema_id = 3;
    meta->file_source = io::FileSource::COMPACT;
    meta->value_stats = io::SimpleStats{{I(-5), D(1.0), Null()}, {I(42), D(std::numeric_limits<double>::infinity()), Null()}, {0, 0, 11}};
    meta->deletion_vector = "index-1";

    manifest::ManifestFile file(context);
    auto written = file.write({ManifestEntry(FileKind::ADD, 4, meta), deleteOf(makeFile("data-old", 1, 0, 3, 1, 4, 100, {S("2024-01-02")}))});
    ASSERT_TRUE(written.isOk()) << written.error().toString();
    ASSERT_EQ(written.value().size(), 1u);

    const ManifestFileMeta& m = written.value()[0];
    EXPECT_EQ(m.num_added_files, 1);
    EXPECT_EQ(m.num_deleted_files, 1);
    EXPECT_EQ(m.partition_min, (Row{S("2024-01-01")}));
    EXPECT_EQ(m.partition_max, (Row{S("2024-01-02")}));
    EXPECT_EQ(m.schema_id, 3);

    auto entries = file.read(m.file_name).toVector();
    ASSERT_TRUE(entries.isOk()) << entries.error().toString();
    ASSERT_EQ(entries.value().size(), 2u);
    EXPECT_EQ(entries.value()[0].kind, FileKind::ADD);
    EXPECT_EQ(entries.value()[0].total_buckets, 4);
    EXPECT_EQ(*entries.value()[0].file, *meta);
    ASSERT_TRUE(entries.value()[0].file->value_stats.has_value());
    // The double keeps its type even when integral.
    EXPECT_TRUE(std::holds_alternative<double>(entries.value()[0].file->value_stats->min_values[1]));
    EXPECT_TRUE(std::isinf(std::get<double>(entries.value()[0].file->value_stats->max_values[1])));
    EXPECT_EQ(entries.value()[1].kind, FileKind::DELETE);
}

TEST_F(ManifestFileTest, EmptyInputWritesNothing) {
    manifest::ManifestFile file(context);
    auto written = file.write({});
    ASSERT_TRUE(written.isOk());
    EXPECT_TRUE(written.value().empty());
    EXPECT_EQ(manifestObjectCount(), 0u);
}

TEST_F(ManifestFileTest, RollsAtTargetSize) {
    context.target_file_size = 1024;
    manifest::ManifestFile file(context);
    auto entries = addEntries("data-", 40);
    auto written = file.write(entries);
    ASSERT_TRUE(written.isOk());
    EXPECT_GT(written.value().size(), 1u);

    int64_t total = 0;
    std::vector<ManifestEntry> replayed;
    for (const auto& m : written.value()) {
        total += m.num_added_files;
        auto part = file.read(m.file_name).toVector();
        ASSERT_TRUE(part.isOk());
        replayed.insert(replayed.end(), part.value().begin(), part.value().end());
    }
    EXPECT_EQ(total, 40);
    ASSERT_EQ(replayed.size(), entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(replayed[i].file->file_name, entries[i].file->file_name);
    }
}

TEST_F(ManifestFileTest, FailedRollDeletesWhatItWrote) {
    context.target_file_size = 1024;
    auto faulty = std::make_shared<FaultInjectingFileIO>(file_io);
    faulty->failWritesAfter("manifest-", 1, 10, storage::ErrorCode::DISK_FULL);
    context.file_io = faulty;
    manifest::ManifestFile file(context);

    auto written = file.write(addEntries("data-", 40));
    ASSERT_FALSE(written.isOk());
    EXPECT_EQ(written.error().code, storage::ErrorCode::DISK_FULL);
    EXPECT_EQ(manifestObjectCount(), 0u);
}

TEST_F(ManifestFileTest, TransientReadErrorsAreRetried) {
    manifest::ManifestFile writer(context);
    auto written = writer.write(addEntries("data-", 3));
    ASSERT_TRUE(written.isOk());

    auto faulty = std::make_shared<FaultInjectingFileIO>(file_io);
    faulty->failReads("manifest-", 2);
    context.file_io = faulty;
    manifest::ManifestFile reader(context);
    auto entries = reader.read(written.value()[0].file_name).toVector();
    ASSERT_TRUE(entries.isOk()) << entries.error().toString();
    EXPECT_EQ(entries.value().size(), 3u);
    EXPECT_EQ(faulty->injectedFailures(), 2);
}

TEST_F(ManifestFileTest, CorruptedManifestIsDetected) {
    context.compression = CompressionType::NONE;
    manifest::ManifestFile file(context);
    auto written = file.write(addEntries("data-", 3));
    ASSERT_TRUE(written.isOk());

    std::string path = context.path_factory->manifestPath(written.value()[0].file_name);
    std::string bytes = file_io->readFile(path).value();
    bytes[bytes.size() / 2] ^= 0x20;
    ASSERT_TRUE(file_io->writeFile(path, bytes, true).isOk());

    auto entries = file.read(written.value()[0].file_name).toVector();
    ASSERT_FALSE(entries.isOk());
    EXPECT_EQ(entries.error().code, storage::ErrorCode::CHECKSUM_MISMATCH);

    ASSERT_TRUE(file_io->writeFile(path, "garbage", true).isOk());
    auto garbage = file.read(written.value()[0].file_name).toVector();
    ASSERT_FALSE(garbage.isOk());
    EXPECT_EQ(garbage.error().code, storage::ErrorCode::MANIFEST_ERROR);
}

TEST_F(ManifestFileTest, BinaryStringsSurviveTheCodec) {
    const std::string binary("\xff\xfe", 2);
    const std::string truncated("ok\xc3", 3);
    auto meta = std::make_shared<io::DataFileMeta>(*makeFile("data-binary", 1, 0, 9, 1, 10, 100, {S(binary)}));
    meta->min_key = {S(truncated)};
    meta->max_key = {S("caf\xc3\xa9")};
    meta->value_stats = io::SimpleStats{{S(binary)}, {S(truncated)}, {0}};

    manifest::ManifestFile file(context);
    auto written = file.write({addOf(meta)});
    ASSERT_TRUE(written.isOk()) << written.error().toString();
    ASSERT_EQ(written.value().size(), 1u);
    EXPECT_EQ(written.value()[0].partition_min, (Row{S(binary)}));

    auto entries = file.read(written.value()[0].file_name).toVector();
    ASSERT_TRUE(entries.isOk()) << entries.error().toString();
    ASSERT_EQ(entries.value().size(), 1u);
    EXPECT_EQ(*entries.value()[0].file, *meta);

    manifest::ManifestList list(context);
    auto name = list.write(written.value());
    ASSERT_TRUE(name.isOk()) << name.error().toString();
    EXPECT_EQ(list.read(name.value()).value(), written.value());
}

TEST_F(ManifestFileTest, HeaderIsLittleEndianAndChecked) {
    context.compression = CompressionType::NONE;
    manifest::ManifestFile file(context);
    auto written = file.write(addEntries("data-", 2));
    ASSERT_TRUE(written.isOk());

    std::string path = context.path_factory->manifestPath(written.value()[0].file_name);
    std::string bytes = file_io->readFile(path).value();
    ASSERT_GT(bytes.size(), 14u);
    const auto* b = reinterpret_cast<const unsigned char*>(bytes.data());
    uint32_t payload_size = b[6] | (b[7] << 8) | (b[8] << 16) | (static_cast<uint32_t>(b[9]) << 24);
    EXPECT_EQ(payload_size, bytes.size() - 14);

    bytes[5] = static_cast<char>(9);
    ASSERT_TRUE(file_io->writeFile(path, bytes, true).isOk());
    auto entries = file.read(written.value()[0].file_name).toVector();
    ASSERT_FALSE(entries.isOk());
    EXPECT_EQ(entries.error().code, storage::ErrorCode::MANIFEST_ERROR);
}

TEST_F(ManifestFileTest, ManifestListRoundTrip) {
    manifest::ManifestFile file(context);
    manifest::ManifestList list(context);
    auto a = file.write(addEntries("data-a", 2, "2024-01-01"));
    auto b = file.write(addEntries("data-b", 2, "2024-01-05"));
    ASSERT_TRUE(a.isOk() && b.isOk());

    std::vector<ManifestFileMeta> metas{a.value()[0], b.value()[0]};
    auto name = list.write(metas);
    ASSERT_TRUE(name.isOk());
    EXPECT_EQ(name.value().rfind(fs::FileStorePathFactory::MANIFEST_LIST_PREFIX, 0), 0u);

    auto read = list.read(name.value());
    ASSERT_TRUE(read.isOk());
    EXPECT_EQ(read.value(), metas);

    auto empty = list.write({});
    ASSERT_TRUE(empty.isOk());
    EXPECT_TRUE(list.read(empty.value()).value().empty());
}

class ManifestMergerTest : public ManifestFileTest {
protected:
    std::vector<ManifestEntry> replayAll(const manifest::ManifestFile& file, const std::vector<ManifestFileMeta>& metas) {
        FileEntry::MergedEntries merged;
        for (const auto& m : metas) {
            auto entries = file.read(m.file_name).toVector();
            EXPECT_TRUE(entries.isOk());
            EXPECT_TRUE(FileEntry::mergeEntries(entries.value(), merged).isOk());
        }
        return FileEntry::toVector(merged);
    }
};

TEST_F(ManifestMergerTest, MinorMergePacksSmallManifests) {
    manifest::ManifestFile file(context);
    std::vector<ManifestFileMeta> input;
    for (int i = 0; i < 5; ++i) {
        auto written = file.write(addEntries("data-" + std::to_string(i) + "-", 2));
        ASSERT_TRUE(written.isOk());
        input.push_back(written.value()[0]);
    }

    manifest::ManifestFileMerger::Options options;
    options.target_file_size = 1LL << 30;
    options.merge_min_count = 3;
    options.full_compaction_threshold = 1LL << 40;

    std::vector<ManifestFileMeta> created;
    auto merged = manifest::ManifestFileMerger::merge(input, file, options, &created);
    ASSERT_TRUE(merged.isOk()) << merged.error().toString();
    ASSERT_EQ(merged.value().size(), 1u);
    EXPECT_EQ(created.size(), 1u);
    EXPECT_EQ(merged.value()[0].num_added_files, 10);
    EXPECT_EQ(liveNames(replayAll(file, merged.value())), liveNames(replayAll(file, input)));
}

TEST_F(ManifestMergerTest, TooFewManifestsAreLeftAlone) {
    manifest::ManifestFile file(context);
    std::vector<ManifestFileMeta> input;
    for (int i = 0; i < 2; ++i) {
        input.push_back(file.write(addEntries("data-" + std::to_string(i) + "-", 2)).value()[0]);
    }
    manifest::ManifestFileMerger::Options options;
    options.merge_min_count = 3;

    std::vector<ManifestFileMeta> created;
    auto merged = manifest::ManifestFileMerger::merge(input, file, options, &created);
    ASSERT_TRUE(merged.isOk());
    EXPECT_EQ(merged.value(), input);
    EXPECT_TRUE(created.empty());
}

TEST_F(ManifestMergerTest, FullCompactionDropsCancelledFiles) {
    manifest::ManifestFile file(context);
    auto base = addEntries("data-", 6);
    auto first = file.write(base);
    // Delete two of the files in a later manifest.
    auto second = file.write({deleteOf(base[1].file), deleteOf(base[4].file)});
    ASSERT_TRUE(first.isOk() && second.isOk());
    std::vector<ManifestFileMeta> input{first.value()[0], second.value()[0]};

    manifest::ManifestFileMerger::Options options;
    options.full_compaction_threshold = 1;

    std::vector<ManifestFileMeta> created;
    auto merged = manifest::ManifestFileMerger::merge(input, file, options, &created);
    ASSERT_TRUE(merged.isOk()) << merged.error().toString();
    EXPECT_EQ(created.size(), merged.value().size());
    int64_t adds = 0;
    for (const auto& m : merged.value()) {
        adds += m.num_added_files;
        EXPECT_EQ(m.num_deleted_files, 0);
    }
    EXPECT_EQ(adds, 4);
    EXPECT_EQ(liveNames(replayAll(file, merged.value())),
              (std::set<std::string>{"data-0", "data-2", "data-3", "data-5"}));
}

TEST_F(ManifestMergerTest, FullCompactionRejectsDanglingDelete) {
    manifest::ManifestFile file(context);
    auto only_delete = file.write({deleteOf(makeFile("data-ghost", 0, 1, 1, 1, 1, 100, {S("2024-01-01")}))});
    ASSERT_TRUE(only_delete.isOk());

    manifest::ManifestFileMerger::Options options;
    options.full_compaction_threshold = 1;
    auto merged = manifest::ManifestFileMerger::merge(only_delete.value(), file, options, nullptr);
    ASSERT_FALSE(merged.isOk());
    EXPECT_EQ(merged.error().code, storage::ErrorCode::MANIFEST_ERROR);
}
