// src/table/table_commit.cpp
#include "../../include/table/table_commit.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

namespace lakestore {
namespace table {

TableCommit::TableCommit(std::shared_ptr<const FileStoreTable> table, std::string commit_user)
    : table_(std::move(table)),
      commit_(table_->newFileStoreCommit(commit_user)) {}

storage::Result<int64_t> TableCommit::commit(int64_t identifier,
                                             std::vector<operation::CommitMessage> messages,
                                             std::optional<int64_t> watermark) {
    operation::ManifestCommittable committable(identifier, watermark);
    for (const auto& m : messages) committable.addMessage(m);

    int64_t snapshot_id = 0;
    ASSIGN_OR_RETURN(snapshot_id, commit_->commit(committable));
    maintain(messages);
    return snapshot_id;
}

storage::Result<int64_t> TableCommit::overwrite(const std::optional<fs::PartitionSpec>& partition_filter,
                                                int64_t identifier,
                                                std::vector<operation::CommitMessage> messages) {
    operation::ManifestCommittable committable(identifier, std::nullopt);
    for (auto& m : messages) committable.addMessage(std::move(m));

    int64_t snapshot_id = 0;
    ASSIGN_OR_RETURN(snapshot_id, commit_->overwrite(partition_filter, committable));
    maintain({});
    return snapshot_id;
}

storage::Result<int64_t> TableCommit::dropPartitions(const std::vector<fs::PartitionSpec>& partitions,
                                                     int64_t identifier) {
    int64_t snapshot_id = 0;
    ASSIGN_OR_RETURN(snapshot_id, commit_->dropPartitions(partitions, identifier));
    maintain({});
    return snapshot_id;
}

storage::Result<int32_t> TableCommit::filterAndCommit(std::vector<operation::ManifestCommittable> committables) {
    std::vector<operation::CommitMessage> messages;
    for (const auto& c : committables) {
        messages.insert(messages.end(), c.messages.begin(), c.messages.end());
    }
    int32_t committed = 0;
    ASSIGN_OR_RETURN(committed, commit_->filterAndCommit(std::move(committables)));
    if (committed > 0) maintain(messages);
    return committed;
}

void TableCommit::maintain(const std::vector<operation::CommitMessage>& messages) {
    if (table_->options().write_only) return;

    if (coordinator_) {
        for (const auto& m : messages) {
            if (!m.new_files.empty()) coordinator_->notifyNewFiles(m.partition, m.bucket);
        }
    }

    auto expirer = table_->newExpirer();
    auto expired = expirer->expire(snapshot::ExpireConfig::fromOptions(table_->options()));
    if (!expired.isOk()) {
        LOG_WARN("[TableCommit] Snapshot expiration after commit failed: ", expired.error().toString());
    } else if (expired.value().expired_snapshots > 0) {
        LOG_INFO("[TableCommit] Expired ", expired.value().expired_snapshots, " snapshot(s)");
    }
}

} // namespace table
} // namespace lakestore
