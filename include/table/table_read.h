// include/table/table_read.h
#pragma once

#include "file_store_table.h"
#include "../lsm/sort_merge_reader.h"

#include <memory>
#include <optional>
#include <vector>

namespace lakestore {
namespace table {

/**
 * @class TableRead
 * @brief Reads the rows of a scan plan. Primary-key buckets are merged on
 * read through the table's merge function, so the result is the same as
 * reading a fully compacted bucket; retracted keys are absent.
 *
 * The plan fixes the file list up front. Files it names must not be expired
 * while the read runs, which a SnapshotLease on the plan's snapshot ensures.
 */
class TableRead {
public:
    explicit TableRead(std::shared_ptr<const FileStoreTable> table);

    storage::Result<std::vector<Row>> read(const operation::ScanPlan& plan) const;

    // Plans with `options` and reads the plan.
    storage::Result<std::vector<Row>> read(const operation::ScanOptions& options = operation::ScanOptions{}) const;

    // Rows of one bucket, optionally restricted to a key range (primary-key tables only).
    storage::Result<std::vector<Row>> readBucket(const Row& partition,
                                                 int32_t bucket,
                                                 const std::vector<io::DataFileMetaPtr>& files,
                                                 const std::optional<lsm::KeyRange>& range = std::nullopt) const;

private:
    std::shared_ptr<const FileStoreTable> table_;
    std::shared_ptr<const io::KeyValueFileReaderFactory> readers_;
};

} // namespace table
} // namespace lakestore
