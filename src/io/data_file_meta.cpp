// src/io/data_file_meta.cpp
#include "../../include/io/data_file_meta.h"
#include "../../include/serialization_utils.h"

#include <sstream>

namespace lakestore {
namespace io {

bool SimpleStats::operator==(const SimpleStats& other) const {
    return compareRows(min_values, other.min_values) == 0
        && compareRows(max_values, other.max_values) == 0
        && null_counts == other.null_counts;
}

SimpleStatsCollector::SimpleStatsCollector(size_t arity)
    : seen_(arity, false) {
    stats_.min_values.assign(arity, Value{});
    stats_.max_values.assign(arity, Value{});
    stats_.null_counts.assign(arity, 0);
}

void SimpleStatsCollector::collect(const Row& row) {
    for (size_t i = 0; i < seen_.size() && i < row.size(); ++i) {
        const Value& v = row[i];
        if (isNull(v)) {
            stats_.null_counts[i]++;
            continue;
        }
        if (!seen_[i]) {
            stats_.min_values[i] = v;
            stats_.max_values[i] = v;
            seen_[i] = true;
            continue;
        }
        if (compareValues(v, stats_.min_values[i]) < 0) stats_.min_values[i] = v;
        if (compareValues(v, stats_.max_values[i]) > 0) stats_.max_values[i] = v;
    }
}

SimpleStats SimpleStatsCollector::result() const {
    return stats_;
}

std::string fileIdentifier(const Row& partition, int32_t bucket, const std::string& file_name) {
    // The binary partition encoding cannot collide the way a printed form could.
    return EncodeRowBinary(partition) + "/" + std::to_string(bucket) + "/" + file_name;
}

std::string DataFileMeta::identifier() const {
    return fileIdentifier(partition, bucket, file_name);
}

std::string DataFileMeta::toString() const {
    std::ostringstream oss;
    oss << "DataFileMeta{" << file_name
        << ", partition=" << rowToString(partition)
        << ", bucket=" << bucket
        << ", level=" << level
        << ", keys=[" << rowToString(min_key) << " .. " << rowToString(max_key) << "]"
        << ", seq=[" << min_sequence_number << " .. " << max_sequence_number << "]"
        << ", rows=" << row_count
        << ", deletes=" << delete_row_count
        << ", size=" << file_size
        << "}";
    return oss.str();
}

bool DataFileMeta::operator==(const DataFileMeta& other) const {
    return file_name == other.file_name
        && compareRows(partition, other.partition) == 0
        && bucket == other.bucket
        && level == other.level
        && compareRows(min_key, other.min_key) == 0
        && compareRows(max_key, other.max_key) == 0
        && min_sequence_number == other.min_sequence_number
        && max_sequence_number == other.max_sequence_number
        && row_count == other.row_count
        && delete_row_count == other.delete_row_count
        && file_size == other.file_size
        && schema_id == other.schema_id
        && creation_time_millis == other.creation_time_millis
        && file_source == other.file_source
        && value_stats == other.value_stats
        && deletion_vector == other.deletion_vector;
}

int64_t totalFileSize(const std::vector<DataFileMetaPtr>& files) {
    int64_t total = 0;
    for (const auto& f : files) total += f->file_size;
    return total;
}

} // namespace io
} // namespace lakestore
