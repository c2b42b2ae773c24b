// include/table/table_commit.h
#pragma once

#include "file_store_table.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace table {

/**
 * @class TableCommit
 * @brief Commits writer output for one commit user, then runs the table's
 * maintenance: snapshot expiration per the table options and, when a
 * compaction coordinator is attached, a compaction request for every bucket
 * that received files. Both are skipped for `write-only` tables.
 *
 * A maintenance failure is logged and does not fail the commit.
 */
class TableCommit {
public:
    TableCommit(std::shared_ptr<const FileStoreTable> table, std::string commit_user);

    // Not owned; must outlive this commit.
    void setCompactionCoordinator(operation::CompactionCoordinator* coordinator) { coordinator_ = coordinator; }

    storage::Result<int64_t> commit(int64_t identifier, std::vector<operation::CommitMessage> messages,
                                    std::optional<int64_t> watermark = std::nullopt);

    storage::Result<int64_t> overwrite(const std::optional<fs::PartitionSpec>& partition_filter,
                                       int64_t identifier,
                                       std::vector<operation::CommitMessage> messages);

    storage::Result<int64_t> dropPartitions(const std::vector<fs::PartitionSpec>& partitions, int64_t identifier);

    // Replays committables after a restart; those already committed are skipped.
    storage::Result<int32_t> filterAndCommit(std::vector<operation::ManifestCommittable> committables);

    operation::FileStoreCommit& fileStoreCommit() { return *commit_; }

private:
    void maintain(const std::vector<operation::CommitMessage>& messages);

    std::shared_ptr<const FileStoreTable> table_;
    std::unique_ptr<operation::FileStoreCommit> commit_;
    operation::CompactionCoordinator* coordinator_ = nullptr;
};

} // namespace table
} // namespace lakestore
