// src/operation/file_store_commit.cpp
#include "../../include/operation/file_store_commit.h"
#include "../../include/lsm/levels.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <algorithm>
#include <random>
#include <set>
#include <thread>

namespace lakestore {
namespace operation {

CommitFailureKind classifyCommitFailure(const storage::StorageError& error) {
    return error.isConflict() ? CommitFailureKind::CONFLICT : CommitFailureKind::FATAL;
}

namespace {

int64_t recordDelta(const std::vector<manifest::ManifestEntry>& changes) {
    int64_t delta = 0;
    for (const auto& e : changes) {
        delta += e.kind == manifest::FileKind::ADD ? e.file->row_count : -e.file->row_count;
    }
    return delta;
}

std::vector<manifest::ManifestEntry> toEntries(manifest::FileKind kind,
                                               int32_t total_buckets,
                                               const std::vector<io::DataFileMetaPtr>& files) {
    std::vector<manifest::ManifestEntry> entries;
    entries.reserve(files.size());
    for (const auto& f : files) entries.emplace_back(kind, total_buckets, f);
    return entries;
}

} // namespace

FileStoreCommit::FileStoreCommit(std::string commit_user,
                                 int64_t schema_id,
                                 FileStoreCommitConfig config,
                                 std::shared_ptr<snapshot::SnapshotManager> snapshot_manager,
                                 std::shared_ptr<const manifest::ManifestFile> manifest_file,
                                 std::shared_ptr<const manifest::ManifestList> manifest_list,
                                 std::shared_ptr<const FileStoreScan> scan)
    : commit_user_(std::move(commit_user)),
      schema_id_(schema_id),
      config_(std::move(config)),
      snapshot_manager_(std::move(snapshot_manager)),
      manifest_file_(std::move(manifest_file)),
      manifest_list_(std::move(manifest_list)),
      scan_(std::move(scan))
{
    if (!config_.is_valid()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION,
                                    "FileStoreCommit: Invalid configuration - " + config_.to_string());
    }
    if (commit_user_.empty() || !isValidUtf8(commit_user_)) {
        throw storage::StorageError::invalidConfiguration("FileStoreCommit: commit user must be non-empty UTF-8");
    }
}

// --- Public entry points ---

storage::Result<int64_t> FileStoreCommit::commit(const ManifestCommittable& committable) {
    std::vector<manifest::ManifestEntry> append_changes;
    std::vector<manifest::ManifestEntry> compact_changes;
    for (const auto& msg : committable.messages) {
        auto added = toEntries(manifest::FileKind::ADD, msg.total_buckets, msg.new_files);
        append_changes.insert(append_changes.end(), added.begin(), added.end());
        auto removed = toEntries(manifest::FileKind::DELETE, msg.total_buckets, msg.compact_before);
        compact_changes.insert(compact_changes.end(), removed.begin(), removed.end());
        auto rewritten = toEntries(manifest::FileKind::ADD, msg.total_buckets, msg.compact_after);
        compact_changes.insert(compact_changes.end(), rewritten.begin(), rewritten.end());
    }

    std::optional<int64_t> last_id;
    if (!append_changes.empty() || compact_changes.empty()) {
        CommitRequest request;
        request.kind = snapshot::CommitKind::APPEND;
        request.identifier = committable.identifier;
        request.watermark = committable.watermark;
        request.changes = [append_changes](const std::optional<snapshot::Snapshot>&)
            -> storage::Result<std::vector<manifest::ManifestEntry>> {
            return append_changes;
        };
        int64_t id = 0;
        ASSIGN_OR_RETURN(id, tryCommit(request));
        last_id = id;
    }
    if (!compact_changes.empty()) {
        CommitRequest request;
        request.kind = snapshot::CommitKind::COMPACT;
        request.identifier = committable.identifier;
        request.watermark = committable.watermark;
        request.changes = [compact_changes](const std::optional<snapshot::Snapshot>&)
            -> storage::Result<std::vector<manifest::ManifestEntry>> {
            return compact_changes;
        };
        int64_t id = 0;
        ASSIGN_OR_RETURN(id, tryCommit(request));
        last_id = id;
    }
    return *last_id;
}

storage::Result<int64_t> FileStoreCommit::overwrite(const std::optional<fs::PartitionSpec>& partition_filter,
                                                    const ManifestCommittable& committable) {
    const auto& paths = snapshot_manager_->pathFactory();
    auto selected = [&paths, partition_filter](const Row& partition) {
        return !partition_filter || paths.partitionMatches(partition, *partition_filter);
    };

    std::vector<manifest::ManifestEntry> additions;
    for (const auto& msg : committable.messages) {
        if (!msg.compact_before.empty() || !msg.compact_after.empty()) {
            return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Overwrite cannot carry compaction changes")
                .withDetails(msg.toString());
        }
        if (!selected(msg.partition)) {
            return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Overwrite adds files outside the overwritten partitions")
                .withContext("partition", rowToString(msg.partition));
        }
        auto added = toEntries(manifest::FileKind::ADD, msg.total_buckets, msg.new_files);
        additions.insert(additions.end(), added.begin(), added.end());
    }

    CommitRequest request;
    request.kind = snapshot::CommitKind::OVERWRITE;
    request.identifier = committable.identifier;
    request.watermark = committable.watermark;
    request.changes = [this, selected, additions](const std::optional<snapshot::Snapshot>& latest) {
        return overwriteChanges(latest, selected, additions);
    };
    return tryCommit(request);
}

storage::Result<int64_t> FileStoreCommit::dropPartitions(const std::vector<fs::PartitionSpec>& partitions,
                                                         int64_t identifier) {
    if (partitions.empty()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "No partition to drop");
    }
    const auto& paths = snapshot_manager_->pathFactory();
    auto selected = [&paths, partitions](const Row& partition) {
        for (const auto& spec : partitions) {
            if (paths.partitionMatches(partition, spec)) return true;
        }
        return false;
    };

    CommitRequest request;
    request.kind = snapshot::CommitKind::OVERWRITE;
    request.identifier = identifier;
    request.changes = [this, selected](const std::optional<snapshot::Snapshot>& latest) {
        return overwriteChanges(latest, selected, {});
    };
    return tryCommit(request);
}

storage::Result<std::optional<int64_t>> FileStoreCommit::compactManifests() {
    std::optional<snapshot::Snapshot> latest;
    ASSIGN_OR_RETURN(latest, snapshot_manager_->latest());
    if (!latest) return std::optional<int64_t>();

    CommitRequest request;
    request.kind = snapshot::CommitKind::COMPACT;
    request.identifier = COMPACT_MANIFEST_IDENTIFIER;
    request.changes = [](const std::optional<snapshot::Snapshot>&)
        -> storage::Result<std::vector<manifest::ManifestEntry>> {
        return std::vector<manifest::ManifestEntry>{};
    };
    request.check_conflicts = false;
    request.check_idempotency = false;
    request.full_manifest_compaction = true;

    int64_t id = 0;
    ASSIGN_OR_RETURN(id, tryCommit(request));
    return std::optional<int64_t>(id);
}

storage::Result<std::vector<ManifestCommittable>> FileStoreCommit::filterCommitted(
        std::vector<ManifestCommittable> committables) const {
    std::sort(committables.begin(), committables.end(),
              [](const ManifestCommittable& a, const ManifestCommittable& b) { return a.identifier < b.identifier; });

    std::optional<int64_t> latest_id;
    ASSIGN_OR_RETURN(latest_id, snapshot_manager_->latestSnapshotId());
    if (!latest_id) return committables;

    // Newest snapshot of this user; manifest compactions do not count.
    std::optional<int64_t> committed_up_to;
    auto chain = snapshot_manager_->chainFrom(*latest_id);
    while (true) {
        std::optional<snapshot::Snapshot> s;
        ASSIGN_OR_RETURN(s, chain.next());
        if (!s) break;
        if (s->commit_user == commit_user_ && s->commit_identifier != COMPACT_MANIFEST_IDENTIFIER) {
            committed_up_to = s->commit_identifier;
            break;
        }
    }
    if (!committed_up_to) return committables;

    std::vector<ManifestCommittable> remaining;
    for (auto& c : committables) {
        if (c.identifier > *committed_up_to) {
            remaining.push_back(std::move(c));
        } else {
            LOG_INFO("[FileStoreCommit] Skipping committable ", c.identifier, " of user ", commit_user_,
                     ": already committed");
        }
    }
    return remaining;
}

storage::Result<int32_t> FileStoreCommit::filterAndCommit(std::vector<ManifestCommittable> committables) {
    std::vector<ManifestCommittable> remaining;
    ASSIGN_OR_RETURN(remaining, filterCommitted(std::move(committables)));
    int32_t committed = 0;
    for (const auto& c : remaining) {
        RETURN_IF_ERROR(commit(c));
        committed++;
    }
    return committed;
}

// --- Commit protocol ---

storage::Result<int64_t> FileStoreCommit::tryCommit(const CommitRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    for (int32_t attempt = 0; ; ++attempt) {
        std::optional<snapshot::Snapshot> latest;
        ASSIGN_OR_RETURN(latest, snapshot_manager_->latest());

        if (request.check_idempotency) {
            std::optional<int64_t> existing;
            ASSIGN_OR_RETURN(existing, findCommitted(latest, request.identifier, request.kind));
            if (existing) {
                LOG_INFO("[FileStoreCommit] ", snapshot::commitKindToString(request.kind), " commit ",
                         request.identifier, " of user ", commit_user_, " is already snapshot ", *existing);
                return *existing;
            }
        }

        std::vector<manifest::ManifestEntry> changes;
        ASSIGN_OR_RETURN(changes, request.changes(latest));

        if (request.check_conflicts) {
            auto conflict = checkConflicts(latest, changes);
            if (!conflict.isOk()) {
                LOG_WARN("[FileStoreCommit] ", snapshot::commitKindToString(request.kind), " commit ",
                         request.identifier, " conflicts with snapshot ", latest ? latest->id : 0, ": ",
                         conflict.error().toString());
                return conflict.error();
            }
        }

        std::optional<int64_t> committed;
        ASSIGN_OR_RETURN(committed, tryCommitOnce(request, latest, changes));
        if (committed) {
            LOG_INFO("[FileStoreCommit] Committed snapshot ", *committed, " (",
                     snapshot::commitKindToString(request.kind), ", user ", commit_user_,
                     ", identifier ", request.identifier, ", ", changes.size(), " change(s), attempt ",
                     attempt + 1, ")");
            return *committed;
        }

        if (attempt >= config_.max_retries) {
            return storage::StorageError::commitConflict(
                "Snapshot id still taken after " + std::to_string(attempt + 1) + " attempt(s)")
                .withContext("commit_user", commit_user_)
                .withContext("identifier", std::to_string(request.identifier));
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (config_.timeout && elapsed >= *config_.timeout) {
            return storage::StorageError::timeout("commit " + std::to_string(request.identifier), elapsed)
                .withContext("commit_user", commit_user_);
        }
        auto wait = retryWait(attempt);
        LOG_DEBUG(DEBUG, "[FileStoreCommit] Lost snapshot ", latest ? latest->id + 1 : snapshot::Snapshot::FIRST_SNAPSHOT_ID,
                  "; retrying in ", wait.count(), "ms");
        std::this_thread::sleep_for(wait);
    }
}

storage::Result<std::optional<int64_t>> FileStoreCommit::tryCommitOnce(
        const CommitRequest& request,
        const std::optional<snapshot::Snapshot>& latest,
        const std::vector<manifest::ManifestEntry>& changes) {
    const int64_t new_id = latest ? latest->id + 1 : snapshot::Snapshot::FIRST_SNAPSHOT_ID;

    std::vector<manifest::ManifestFileMeta> created;
    std::vector<std::string> lists;

    std::vector<manifest::ManifestFileMeta> previous;
    if (latest) {
        auto all = scan_->readAllManifests(*latest);
        if (!all.isOk()) return all.error();
        previous = std::move(all).value();
    }

    manifest::ManifestFileMerger::Options merge_options = config_.manifest_merge;
    if (request.full_manifest_compaction) {
        merge_options.merge_min_count = 1;
        merge_options.full_compaction_threshold = 1;
    }
    auto base = manifest::ManifestFileMerger::merge(previous, *manifest_file_, merge_options, &created);
    if (!base.isOk()) {
        cleanUpAttempt(created, lists);
        return base.error();
    }

    auto delta = manifest_file_->write(changes);
    if (!delta.isOk()) {
        cleanUpAttempt(created, lists);
        return delta.error();
    }
    created.insert(created.end(), delta.value().begin(), delta.value().end());

    auto base_list = manifest_list_->write(base.value());
    if (!base_list.isOk()) {
        cleanUpAttempt(created, lists);
        return base_list.error();
    }
    lists.push_back(base_list.value());

    auto delta_list = manifest_list_->write(delta.value());
    if (!delta_list.isOk()) {
        cleanUpAttempt(created, lists);
        return delta_list.error();
    }
    lists.push_back(delta_list.value());

    snapshot::Snapshot next;
    next.id = new_id;
    next.schema_id = schema_id_;
    next.base_manifest_list = base_list.value();
    next.delta_manifest_list = delta_list.value();
    next.commit_user = commit_user_;
    next.commit_identifier = request.identifier;
    next.commit_kind = request.kind;
    next.time_millis = currentTimeMillis();
    next.delta_record_count = recordDelta(changes);
    next.total_record_count = (latest ? latest->total_record_count : 0) + next.delta_record_count;
    next.watermark = latest ? latest->watermark : std::nullopt;
    if (request.watermark) {
        next.watermark = next.watermark ? std::max(*next.watermark, *request.watermark) : *request.watermark;
    }
    if (latest) next.previous_snapshot_id = latest->id;

    if (before_commit_hook_) before_commit_hook_(new_id);

    auto won = snapshot_manager_->tryCommit(next);
    if (!won.isOk()) {
        // The snapshot may or may not exist; its manifests must stay.
        LOG_ERROR("[FileStoreCommit] Publishing snapshot ", new_id, " failed: ", won.error().toString());
        return won.error();
    }
    if (!won.value()) {
        LOG_DEBUG(DEBUG, "[FileStoreCommit] Snapshot ", new_id, " was claimed by another committer");
        cleanUpAttempt(created, lists);
        return std::optional<int64_t>();
    }
    return std::optional<int64_t>(new_id);
}

storage::Result<std::optional<int64_t>> FileStoreCommit::findCommitted(const std::optional<snapshot::Snapshot>& latest,
                                                                       int64_t identifier,
                                                                       snapshot::CommitKind kind) const {
    if (!latest) return std::optional<int64_t>();
    auto chain = snapshot_manager_->chainFrom(latest->id);
    while (true) {
        std::optional<snapshot::Snapshot> s;
        ASSIGN_OR_RETURN(s, chain.next());
        if (!s) break;
        if (s->commit_user != commit_user_ || s->commit_identifier == COMPACT_MANIFEST_IDENTIFIER) continue;
        if (s->commit_identifier == identifier && s->commit_kind == kind) {
            return std::optional<int64_t>(s->id);
        }
        // Identifiers of one user only grow; nothing older can match.
        if (s->commit_identifier < identifier) break;
    }
    return std::optional<int64_t>();
}

storage::Status FileStoreCommit::checkConflicts(const std::optional<snapshot::Snapshot>& latest,
                                                const std::vector<manifest::ManifestEntry>& changes) const {
    std::set<BucketKey, BucketKeyLess> touched;
    for (const auto& e : changes) {
        if (e.kind == manifest::FileKind::DELETE || e.file->level > 0) {
            touched.insert(BucketKey(e.partition(), e.bucket()));
        }
    }
    if (touched.empty()) return storage::Status();

    manifest::FileEntry::MergedEntries merged;
    if (latest) {
        std::vector<manifest::ManifestEntry> live;
        ASSIGN_OR_RETURN(live, scan_->readLiveEntries(*latest));
        for (const auto& e : live) {
            if (touched.count(BucketKey(e.partition(), e.bucket()))) {
                RETURN_IF_ERROR(manifest::FileEntry::mergeEntry(e, merged));
            }
        }
    }
    for (const auto& e : changes) {
        if (!touched.count(BucketKey(e.partition(), e.bucket()))) continue;
        auto status = manifest::FileEntry::mergeEntry(e, merged);
        if (!status.isOk()) {
            return storage::StorageError::commitConflict("File changes are not based on the latest snapshot")
                .withDetails(status.error().toString())
                .withContext("snapshot", std::to_string(latest ? latest->id : 0));
        }
    }
    for (const auto& [id, entry] : merged) {
        if (entry.kind == manifest::FileKind::DELETE) {
            return storage::StorageError::commitConflict("Deleting a file that is no longer live")
                .withDetails(entry.file->toString())
                .withContext("snapshot", std::to_string(latest ? latest->id : 0));
        }
    }

    if (config_.check_level_overlap) {
        BucketFiles by_bucket;
        for (const auto& [id, entry] : merged) {
            by_bucket[BucketKey(entry.partition(), entry.bucket())].push_back(entry.file);
        }
        for (const auto& [bucket, files] : by_bucket) {
            auto levels = lsm::Levels::create(files, 1);
            if (!levels.isOk()) {
                return storage::StorageError::commitConflict("Commit would leave overlapping files on one level")
                    .withDetails(levels.error().toString())
                    .withContext("bucket", std::to_string(bucket.second));
            }
        }
    }
    return storage::Status();
}

storage::Result<std::vector<manifest::ManifestEntry>> FileStoreCommit::overwriteChanges(
        const std::optional<snapshot::Snapshot>& latest,
        const std::function<bool(const Row&)>& partition_selected,
        const std::vector<manifest::ManifestEntry>& additions) const {
    std::vector<manifest::ManifestEntry> changes;
    if (latest) {
        std::vector<manifest::ManifestEntry> live;
        ASSIGN_OR_RETURN(live, scan_->readLiveEntries(*latest));
        for (const auto& e : live) {
            if (partition_selected(e.partition())) {
                changes.emplace_back(manifest::FileKind::DELETE, e.total_buckets, e.file);
            }
        }
    }
    changes.insert(changes.end(), additions.begin(), additions.end());
    return changes;
}

void FileStoreCommit::cleanUpAttempt(const std::vector<manifest::ManifestFileMeta>& manifests,
                                     const std::vector<std::string>& lists) const {
    for (const auto& m : manifests) manifest_file_->deleteQuietly(m.file_name);
    for (const auto& l : lists) manifest_list_->deleteQuietly(l);
}

std::chrono::milliseconds FileStoreCommit::retryWait(int32_t attempt) const {
    thread_local std::mt19937_64 rng(std::random_device{}());
    const int64_t min_wait = config_.min_retry_wait.count();
    const int64_t max_wait = config_.max_retry_wait.count();
    int64_t base = min_wait;
    for (int32_t i = 0; i < attempt && base < max_wait; ++i) base *= 2;
    base = std::min(base, max_wait);
    std::uniform_int_distribution<int64_t> jitter(0, std::max<int64_t>(base / 5, 0));
    return std::chrono::milliseconds(base + jitter(rng));
}

} // namespace operation
} // namespace lakestore
