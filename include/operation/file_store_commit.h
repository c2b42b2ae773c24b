// include/operation/file_store_commit.h
#pragma once

#include "commit_message.h"
#include "file_store_scan.h"
#include "../config/core_options.h"
#include "../manifest/manifest_file.h"
#include "../snapshot/snapshot_manager.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace lakestore {
namespace operation {

struct FileStoreCommitConfig {
    int32_t max_retries = 10;
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds min_retry_wait{10};
    std::chrono::milliseconds max_retry_wait{10000};
    manifest::ManifestFileMerger::Options manifest_merge;
    // Primary-key tables also reject commits that leave overlapping files on a level above 0.
    bool check_level_overlap = true;

    static FileStoreCommitConfig fromOptions(const CoreOptions& options, bool has_primary_key) {
        FileStoreCommitConfig config;
        config.max_retries = options.commit_max_retries;
        config.timeout = options.commit_timeout;
        config.min_retry_wait = options.commit_min_retry_wait;
        config.max_retry_wait = options.commit_max_retry_wait;
        config.manifest_merge.target_file_size = options.manifest_target_file_size;
        config.manifest_merge.merge_min_count = options.manifest_merge_min_count;
        config.manifest_merge.full_compaction_threshold = options.manifest_full_compaction_threshold_size;
        config.check_level_overlap = has_primary_key;
        return config;
    }

    bool is_valid() const {
        return max_retries >= 0 &&
               min_retry_wait.count() >= 0 &&
               max_retry_wait >= min_retry_wait &&
               (!timeout || timeout->count() > 0) &&
               manifest_merge.target_file_size > 0 &&
               manifest_merge.merge_min_count >= 1;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CommitConfig{retries=" << max_retries
            << ", timeout=" << (timeout ? std::to_string(timeout->count()) + "ms" : std::string("none"))
            << ", wait=" << min_retry_wait.count() << "-" << max_retry_wait.count() << "ms"
            << ", manifest_target=" << manifest_merge.target_file_size
            << ", manifest_min_count=" << manifest_merge.merge_min_count << "}";
        return oss.str();
    }
};

enum class CommitFailureKind {
    CONFLICT, // Re-plan against the new latest snapshot and try again.
    FATAL     // Do not retry.
};

CommitFailureKind classifyCommitFailure(const storage::StorageError& error);

/**
 * @class FileStoreCommit
 * @brief The only writer of snapshots. Turns file changes into manifests and
 * publishes them as the next snapshot with create-if-absent, retrying when
 * another committer wins the id.
 *
 * Each attempt re-reads the latest snapshot, checks that every file it deletes
 * is still live there, writes manifests and lists, then claims the next id.
 * A commit whose (commit user, identifier) already produced a snapshot of the
 * same kind returns that snapshot's id and writes nothing, so a caller can
 * retry a commit whose outcome it never learned.
 *
 * Identifiers of one commit user must increase from commit to commit.
 * Thread-safe as long as each thread uses its own instance.
 */
class FileStoreCommit {
public:
    using BeforeCommitHook = std::function<void(int64_t next_snapshot_id)>;

    /**
     * @throws storage::StorageError (INVALID_CONFIGURATION) if `config` is invalid.
     */
    FileStoreCommit(std::string commit_user,
                    int64_t schema_id,
                    FileStoreCommitConfig config,
                    std::shared_ptr<snapshot::SnapshotManager> snapshot_manager,
                    std::shared_ptr<const manifest::ManifestFile> manifest_file,
                    std::shared_ptr<const manifest::ManifestList> manifest_list,
                    std::shared_ptr<const FileStoreScan> scan);

    /**
     * @brief Publishes new files as an APPEND snapshot, then compaction
     * changes as a COMPACT snapshot. A committable without any change still
     * produces an (empty) APPEND snapshot, which records its identifier.
     * @return Id of the last snapshot written or found.
     */
    storage::Result<int64_t> commit(const ManifestCommittable& committable);

    /**
     * @brief Replaces every live file of the partitions matching `partition_filter`
     * (the whole table when unset) with the committable's new files.
     */
    storage::Result<int64_t> overwrite(const std::optional<fs::PartitionSpec>& partition_filter,
                                       const ManifestCommittable& committable);

    storage::Result<int64_t> dropPartitions(const std::vector<fs::PartitionSpec>& partitions, int64_t identifier);

    /**
     * @brief Rewrites the whole manifest history as ADD-only manifests in a
     * COMPACT snapshot. nullopt when the table has no snapshot.
     */
    storage::Result<std::optional<int64_t>> compactManifests();

    // Drops committables whose identifier this commit user already committed.
    storage::Result<std::vector<ManifestCommittable>> filterCommitted(std::vector<ManifestCommittable> committables) const;

    // Commits the committables not yet committed, in identifier order. Returns how many were committed.
    storage::Result<int32_t> filterAndCommit(std::vector<ManifestCommittable> committables);

    const std::string& commitUser() const { return commit_user_; }
    const FileStoreCommitConfig& config() const { return config_; }

    // Runs right before each attempt claims its snapshot id. Tests use it to interleave commits.
    void setBeforeCommitHook(BeforeCommitHook hook) { before_commit_hook_ = std::move(hook); }

    static constexpr int64_t COMPACT_MANIFEST_IDENTIFIER = INT64_MAX;

private:
    using ChangesFn = std::function<storage::Result<std::vector<manifest::ManifestEntry>>(
        const std::optional<snapshot::Snapshot>& latest)>;

    struct CommitRequest {
        snapshot::CommitKind kind = snapshot::CommitKind::APPEND;
        int64_t identifier = 0;
        std::optional<int64_t> watermark;
        ChangesFn changes;
        bool check_conflicts = true;
        bool check_idempotency = true;
        bool full_manifest_compaction = false;
    };

    storage::Result<int64_t> tryCommit(const CommitRequest& request);

    // nullopt when another committer claimed the id first.
    storage::Result<std::optional<int64_t>> tryCommitOnce(const CommitRequest& request,
                                                          const std::optional<snapshot::Snapshot>& latest,
                                                          const std::vector<manifest::ManifestEntry>& changes);

    storage::Result<std::optional<int64_t>> findCommitted(const std::optional<snapshot::Snapshot>& latest,
                                                          int64_t identifier,
                                                          snapshot::CommitKind kind) const;

    storage::Status checkConflicts(const std::optional<snapshot::Snapshot>& latest,
                                   const std::vector<manifest::ManifestEntry>& changes) const;

    storage::Result<std::vector<manifest::ManifestEntry>> overwriteChanges(
        const std::optional<snapshot::Snapshot>& latest,
        const std::function<bool(const Row&)>& partition_selected,
        const std::vector<manifest::ManifestEntry>& additions) const;

    void cleanUpAttempt(const std::vector<manifest::ManifestFileMeta>& manifests,
                        const std::vector<std::string>& lists) const;

    std::chrono::milliseconds retryWait(int32_t attempt) const;

    std::string commit_user_;
    int64_t schema_id_;
    FileStoreCommitConfig config_;
    std::shared_ptr<snapshot::SnapshotManager> snapshot_manager_;
    std::shared_ptr<const manifest::ManifestFile> manifest_file_;
    std::shared_ptr<const manifest::ManifestList> manifest_list_;
    std::shared_ptr<const FileStoreScan> scan_;
    BeforeCommitHook before_commit_hook_;
};

} // namespace operation
} // namespace lakestore
