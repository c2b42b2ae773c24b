// include/config/core_options.h
#pragma once

#include "../types.h"
#include "../fs/file_io.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {

enum class MergeEngine {
    DEDUPLICATE,
    PARTIAL_UPDATE,
    AGGREGATE,
    FIRST_ROW
};

std::string mergeEngineToString(MergeEngine engine);
std::optional<MergeEngine> mergeEngineFromString(const std::string& name);

/**
 * @brief Table options, parsed from the string map persisted with the schema.
 *
 * Keys and defaults:
 *   bucket                                      1
 *   bucket-key                                  (primary key, or all fields for append tables)
 *   merge-engine                                deduplicate
 *   partial-update.remove-record-on-delete      false
 *   aggregation.remove-record-on-delete         false
 *   fields.<name>.aggregate-function            last_non_null_value
 *   fields.<name>.list-agg-delimiter            ","
 *   write-buffer-size                           64 mb
 *   target-file-size                            128 mb
 *   file.compression                            zstd
 *   file.block-size                             64 kb
 *   num-sorted-run.compaction-trigger           5
 *   num-levels                                  trigger + 1
 *   compaction.max-size-amplification-percent   200
 *   compaction.size-ratio                       1
 *   compaction.min.file-num                     5
 *   compaction.max.file-num                     50
 *   compaction.max-attempts                     3
 *   full-compaction.delta-commits               (unset, no cadence)
 *   manifest.target-file-size                   8 mb
 *   manifest.merge-min-count                    30
 *   manifest.full-compaction-threshold-size     16 mb
 *   manifest.compression                        zstd
 *   commit.max-retries                          10
 *   commit.timeout                              (unset, no deadline)
 *   commit.min-retry-wait                       10 ms
 *   commit.max-retry-wait                       10 s
 *   snapshot.num-retained.min                   10
 *   snapshot.num-retained.max                   2147483647
 *   snapshot.time-retained                      1 h
 *   snapshot.expire.limit                       10
 *   consumer.expiration-time                    (unset, leases never go stale)
 *   io.max-retries                              3
 *   io.retry-wait                               50 ms
 *   write-only                                  false
 *
 * Memory sizes accept a unit suffix (b, kb, mb, gb); durations accept
 * ms, s, min, h, d. A bare number is bytes or milliseconds.
 */
struct CoreOptions {
    int32_t bucket = 1;
    std::vector<std::string> bucket_key;

    MergeEngine merge_engine = MergeEngine::DEDUPLICATE;
    bool partial_update_remove_record_on_delete = false;
    bool aggregation_remove_record_on_delete = false;
    std::map<std::string, std::string> field_aggregate_functions;
    std::map<std::string, std::string> field_list_agg_delimiters;

    int64_t write_buffer_size = 64LL * 1024 * 1024;
    int64_t target_file_size = 128LL * 1024 * 1024;
    CompressionType file_compression = CompressionType::ZSTD;
    int64_t file_block_size = 64LL * 1024;

    int32_t num_sorted_run_compaction_trigger = 5;
    int32_t num_levels = 6;
    int32_t max_size_amplification_percent = 200;
    int32_t size_ratio = 1;
    int32_t compaction_min_file_num = 5;
    int32_t compaction_max_file_num = 50;
    int32_t compaction_max_attempts = 3;
    std::optional<int32_t> full_compaction_delta_commits;

    int64_t manifest_target_file_size = 8LL * 1024 * 1024;
    int32_t manifest_merge_min_count = 30;
    int64_t manifest_full_compaction_threshold_size = 16LL * 1024 * 1024;
    CompressionType manifest_compression = CompressionType::ZSTD;

    int32_t commit_max_retries = 10;
    std::optional<std::chrono::milliseconds> commit_timeout;
    std::chrono::milliseconds commit_min_retry_wait{10};
    std::chrono::milliseconds commit_max_retry_wait{10000};

    int32_t snapshot_num_retained_min = 10;
    int32_t snapshot_num_retained_max = 2147483647;
    std::chrono::milliseconds snapshot_time_retained{3600 * 1000};
    int32_t snapshot_expire_limit = 10;
    std::optional<std::chrono::milliseconds> consumer_expiration_time;

    fs::IoRetryPolicy io_retry;
    bool write_only = false;

    /**
     * @brief Parses and validates an option map.
     * @throws storage::StorageError (INVALID_CONFIGURATION) on an unknown
     * enum value, a malformed number, or a value out of range.
     */
    static CoreOptions fromMap(const std::map<std::string, std::string>& options);

    bool is_valid() const;
    std::string to_string() const;
};

// Exposed for tests and the admin CLI.
std::optional<int64_t> parseMemorySize(const std::string& text);
std::optional<std::chrono::milliseconds> parseDuration(const std::string& text);

} // namespace lakestore
