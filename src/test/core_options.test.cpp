//src/test/core_options.test.cpp
#include "gtest/gtest.h"
#include "../../include/config/core_options.h"

#include <map>
#include <string>

using namespace lakestore;

namespace {

storage::ErrorCode errorCodeOf(const std::map<std::string, std::string>& options) {
    try {
        CoreOptions::fromMap(options);
    } catch (const storage::StorageError& e) {
        return e.code;
    }
    return storage::ErrorCode::OK;
}

} // namespace

TEST(CoreOptionsTest, Defaults) {
    CoreOptions o = CoreOptions::fromMap({});
    EXPECT_EQ(o.bucket, 1);
    EXPECT_EQ(o.merge_engine, MergeEngine::DEDUPLICATE);
    EXPECT_EQ(o.write_buffer_size, 64LL * 1024 * 1024);
    EXPECT_EQ(o.file_compression, CompressionType::ZSTD);
    EXPECT_EQ(o.num_sorted_run_compaction_trigger, 5);
    EXPECT_EQ(o.num_levels, 6);
    EXPECT_FALSE(o.full_compaction_delta_commits.has_value());
    EXPECT_FALSE(o.commit_timeout.has_value());
    EXPECT_EQ(o.snapshot_time_retained, std::chrono::hours(1));
    EXPECT_FALSE(o.write_only);
    EXPECT_TRUE(o.is_valid());
}

TEST(CoreOptionsTest, ParsesEveryGroup) {
    CoreOptions o = CoreOptions::fromMap({
        {"bucket", "4"},
        {"bucket-key", " a , b "},
        {"merge-engine", "partial-update"},
        {"partial-update.remove-record-on-delete", "TRUE"},
        {"fields.price.aggregate-function", "SUM"},
        {"fields.tags.list-agg-delimiter", ";"},
        {"write-buffer-size", "2 mb"},
        {"target-file-size", "512kb"},
        {"file.compression", "lz4"},
        {"num-sorted-run.compaction-trigger", "3"},
        {"compaction.max.file-num", "8"},
        {"full-compaction.delta-commits", "2"},
        {"manifest.merge-min-count", "4"},
        {"manifest.compression", "none"},
        {"commit.timeout", "30 s"},
        {"commit.max-retries", "0"},
        {"snapshot.num-retained.min", "2"},
        {"snapshot.time-retained", "5 min"},
        {"consumer.expiration-time", "1 d"},
        {"io.retry-wait", "5"},
        {"write-only", "true"},
    });

    EXPECT_EQ(o.bucket, 4);
    EXPECT_EQ(o.bucket_key, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(o.merge_engine, MergeEngine::PARTIAL_UPDATE);
    EXPECT_TRUE(o.partial_update_remove_record_on_delete);
    EXPECT_EQ(o.field_aggregate_functions.at("price"), "sum");
    EXPECT_EQ(o.field_list_agg_delimiters.at("tags"), ";");
    EXPECT_EQ(o.write_buffer_size, 2LL * 1024 * 1024);
    EXPECT_EQ(o.target_file_size, 512LL * 1024);
    EXPECT_EQ(o.file_compression, CompressionType::LZ4);
    EXPECT_EQ(o.num_sorted_run_compaction_trigger, 3);
    EXPECT_EQ(o.num_levels, 4); // follows the trigger when not set
    EXPECT_EQ(o.compaction_max_file_num, 8);
    EXPECT_EQ(o.full_compaction_delta_commits, 2);
    EXPECT_EQ(o.manifest_merge_min_count, 4);
    EXPECT_EQ(o.manifest_compression, CompressionType::NONE);
    ASSERT_TRUE(o.commit_timeout.has_value());
    EXPECT_EQ(*o.commit_timeout, std::chrono::seconds(30));
    EXPECT_EQ(o.commit_max_retries, 0);
    EXPECT_EQ(o.snapshot_num_retained_min, 2);
    EXPECT_EQ(o.snapshot_time_retained, std::chrono::minutes(5));
    EXPECT_EQ(*o.consumer_expiration_time, std::chrono::hours(24));
    EXPECT_EQ(o.io_retry.retry_wait, std::chrono::milliseconds(5));
    EXPECT_TRUE(o.write_only);
}

TEST(CoreOptionsTest, ExplicitNumLevelsWins) {
    CoreOptions o = CoreOptions::fromMap({{"num-sorted-run.compaction-trigger", "3"}, {"num-levels", "10"}});
    EXPECT_EQ(o.num_levels, 10);
}

TEST(CoreOptionsTest, MemoryAndDurationParsing) {
    EXPECT_EQ(parseMemorySize("128"), 128);
    EXPECT_EQ(parseMemorySize("1 kb"), 1024);
    EXPECT_EQ(parseMemorySize("3GB"), 3LL * 1024 * 1024 * 1024);
    EXPECT_FALSE(parseMemorySize("lots").has_value());
    EXPECT_FALSE(parseMemorySize("10 tb").has_value());

    EXPECT_EQ(parseDuration("250"), std::chrono::milliseconds(250));
    EXPECT_EQ(parseDuration("2 s"), std::chrono::milliseconds(2000));
    EXPECT_EQ(parseDuration("2h"), std::chrono::hours(2));
    EXPECT_FALSE(parseDuration("soon").has_value());
    EXPECT_FALSE(parseDuration("3 weeks").has_value());
}

TEST(CoreOptionsTest, InvalidValuesAreRejected) {
    using storage::ErrorCode;
    EXPECT_EQ(errorCodeOf({{"bucket", "0"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"bucket", "two"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"bucket", "3x"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"merge-engine", "latest-wins"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"write-buffer-size", "0 mb"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"file.compression", "snappy"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"num-levels", "1"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"write-only", "yes"}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"bucket-key", " , "}}), ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"commit.timeout", "forever"}}), ErrorCode::INVALID_CONFIGURATION);
    // Individually valid, jointly inconsistent.
    EXPECT_EQ(errorCodeOf({{"compaction.min.file-num", "10"}, {"compaction.max.file-num", "5"}}),
              ErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(errorCodeOf({{"snapshot.num-retained.min", "5"}, {"snapshot.num-retained.max", "2"}}),
              ErrorCode::INVALID_CONFIGURATION);
}

TEST(CoreOptionsTest, ErrorNamesTheOption) {
    try {
        CoreOptions::fromMap({{"target-file-size", "big"}});
        FAIL() << "expected an exception";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.context.at("option"), "target-file-size");
        EXPECT_NE(e.details.find("big"), std::string::npos);
    }
}

TEST(CoreOptionsTest, MergeEngineNames) {
    for (MergeEngine engine : {MergeEngine::DEDUPLICATE, MergeEngine::PARTIAL_UPDATE,
                               MergeEngine::AGGREGATE, MergeEngine::FIRST_ROW}) {
        EXPECT_EQ(mergeEngineFromString(mergeEngineToString(engine)), engine);
    }
    EXPECT_EQ(mergeEngineToString(MergeEngine::AGGREGATE), "aggregation");
}
