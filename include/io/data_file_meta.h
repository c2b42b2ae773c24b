// include/io/data_file_meta.h
#pragma once

#include "../types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace io {

enum class FileSource : uint8_t {
    APPEND  = 0, // Written by a write-buffer flush.
    COMPACT = 1  // Written by a compaction rewrite.
};

/**
 * @brief Per-column statistics of the rows in one data file.
 */
struct SimpleStats {
    Row min_values;
    Row max_values;
    std::vector<int64_t> null_counts;

    bool operator==(const SimpleStats& other) const;
};

/**
 * @brief Accumulates SimpleStats column by column while a file is written.
 */
class SimpleStatsCollector {
public:
    explicit SimpleStatsCollector(size_t arity);
    void collect(const Row& row);
    SimpleStats result() const;

private:
    SimpleStats stats_;
    std::vector<bool> seen_;
};

/**
 * @struct DataFileMeta
 * @brief Immutable description of one data file.
 *
 * Identity is the (partition, bucket, file name) triple, i.e. the file's path.
 * Instances are shared as `DataFileMetaPtr` and never mutated once published;
 * a level change always produces a new file.
 */
struct DataFileMeta {
    std::string file_name;
    Row partition;
    int32_t bucket = 0;
    int32_t level = 0;

    Row min_key;
    Row max_key;
    int64_t min_sequence_number = 0;
    int64_t max_sequence_number = 0;

    int64_t row_count = 0;
    int64_t delete_row_count = 0;
    int64_t file_size = 0;
    int64_t schema_id = 0;
    int64_t creation_time_millis = 0;
    FileSource file_source = FileSource::APPEND;

    std::optional<SimpleStats> value_stats;
    // Name of a deletion-vector index object masking rows of this file.
    std::optional<std::string> deletion_vector;

    std::string identifier() const;
    int64_t addRowCount() const { return row_count - delete_row_count; }
    std::string toString() const;

    bool operator==(const DataFileMeta& other) const;
};

using DataFileMetaPtr = std::shared_ptr<const DataFileMeta>;

// Stable identity string for (partition, bucket, file name).
std::string fileIdentifier(const Row& partition, int32_t bucket, const std::string& file_name);

int64_t totalFileSize(const std::vector<DataFileMetaPtr>& files);

} // namespace io
} // namespace lakestore
