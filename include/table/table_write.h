// include/table/table_write.h
#pragma once

#include "file_store_table.h"
#include "../lsm/bucket_writer.h"
#include "../operation/commit_message.h"

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace lakestore {
namespace table {

/**
 * @struct WriteRequest
 * @brief A batch of full-width rows. When `partition` or `bucket` is set, every
 * row must belong to it; otherwise both are derived per row. `kinds` is
 * either empty (all INSERT) or one kind per row.
 */
struct WriteRequest {
    std::optional<Row> partition;
    std::optional<int32_t> bucket;
    std::vector<Row> rows;
    std::vector<RowKind> kinds;
};

/**
 * @class TableWrite
 * @brief Routes rows to per-bucket writers and collects their new files as
 * commit messages.
 *
 * A bucket writer is created on first use and continues the sequence numbers
 * of the bucket's latest snapshot. Writers stay open across prepareCommit()
 * calls. Not thread-safe.
 */
class TableWrite {
public:
    explicit TableWrite(std::shared_ptr<const FileStoreTable> table);
    ~TableWrite();

    TableWrite(const TableWrite&) = delete;
    TableWrite& operator=(const TableWrite&) = delete;

    storage::Status write(const WriteRequest& request);
    storage::Status write(const Row& row, RowKind kind = RowKind::INSERT);

    Row partitionOf(const Row& row) const;
    int32_t bucketOf(const Row& row) const;

    /**
     * @brief Flushes every writer and returns one message per bucket with new files.
     * On failure the whole write is aborted: files of every bucket are deleted
     * and the writers are dropped.
     */
    storage::Result<std::vector<operation::CommitMessage>> prepareCommit();

    // Drops buffered rows and deletes files not yet handed to a commit.
    void abort();

    size_t numWriters() const { return writers_.size(); }

private:
    storage::Status writeRow(const Row& row, RowKind kind, const std::optional<Row>& partition,
                             const std::optional<int32_t>& bucket);
    storage::Result<lsm::BucketWriter*> writerFor(const Row& partition, int32_t bucket);

    std::shared_ptr<const FileStoreTable> table_;
    std::map<operation::BucketKey, std::unique_ptr<lsm::BucketWriter>, operation::BucketKeyLess> writers_;
};

} // namespace table
} // namespace lakestore
