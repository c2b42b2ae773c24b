// src/snapshot/snapshot_expirer.cpp
#include "../../include/snapshot/snapshot_expirer.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"
#include "../../include/uuid_utils.h"

#include <algorithm>
#include <sstream>

namespace lakestore {
namespace snapshot {

ExpireConfig ExpireConfig::fromOptions(const CoreOptions& options) {
    ExpireConfig config;
    config.retain_min = options.snapshot_num_retained_min;
    config.retain_max = options.snapshot_num_retained_max;
    config.time_retained = options.snapshot_time_retained;
    config.max_deletes = options.snapshot_expire_limit;
    config.consumer_expiration = options.consumer_expiration_time;
    return config;
}

std::string ExpireConfig::to_string() const {
    std::ostringstream oss;
    oss << "ExpireConfig{retain_min=" << retain_min
        << ", retain_max=" << retain_max
        << ", time_retained_ms=" << time_retained.count()
        << ", max_deletes=" << max_deletes
        << ", consumer_expiration_ms=" << (consumer_expiration ? std::to_string(consumer_expiration->count()) : "none")
        << "}";
    return oss.str();
}

SnapshotExpirer::SnapshotExpirer(std::shared_ptr<fs::FileIO> file_io,
                                 std::shared_ptr<SnapshotManager> snapshot_manager,
                                 std::shared_ptr<ConsumerManager> consumer_manager,
                                 std::shared_ptr<const manifest::ManifestFile> manifest_file,
                                 std::shared_ptr<const manifest::ManifestList> manifest_list)
    : file_io_(std::move(file_io)),
      snapshot_manager_(std::move(snapshot_manager)),
      consumer_manager_(std::move(consumer_manager)),
      manifest_file_(std::move(manifest_file)),
      manifest_list_(std::move(manifest_list)) {}

storage::Result<ExpireResult> SnapshotExpirer::expire(const ExpireConfig& config) {
    if (config.retain_min < 1 || config.retain_max < config.retain_min || config.max_deletes < 1) {
        return storage::StorageError::invalidConfiguration("Invalid expiration policy: " + config.to_string());
    }

    auto latest = snapshot_manager_->latestSnapshotId();
    if (!latest.isOk()) return latest.error();
    auto earliest = snapshot_manager_->earliestSnapshotId();
    if (!earliest.isOk()) return earliest.error();
    if (!latest.value() || !earliest.value()) {
        return ExpireResult{};
    }
    int64_t latest_id = *latest.value();
    int64_t earliest_id = *earliest.value();

    // Snapshots below min_id exceed retain_max and go regardless of age.
    int64_t min_id = std::max<int64_t>(latest_id - config.retain_max + 1, earliest_id);
    int64_t max_exclusive = latest_id - config.retain_min + 1;

    auto pinned = consumer_manager_->minPinnedSnapshot(config.consumer_expiration);
    if (!pinned.isOk()) return pinned.error();
    if (pinned.value()) {
        max_exclusive = std::min(max_exclusive, *pinned.value());
    }
    max_exclusive = std::min(max_exclusive, earliest_id + config.max_deletes);

    int64_t end = max_exclusive;
    int64_t older_than = currentTimeMillis() - config.time_retained.count();
    for (int64_t id = min_id; id < max_exclusive; ++id) {
        auto s = snapshot_manager_->snapshot(id);
        if (!s.isOk()) return s.error();
        if (older_than <= s.value().time_millis) {
            end = id;
            break;
        }
    }
    if (end <= earliest_id) {
        return expireUntil(earliest_id, end);
    }

    // Announce the range, then look at the pins again: a reader that pinned
    // after the first look either shows up now or sees the marker and backs off.
    const std::string token = generateUuid();
    RETURN_IF_ERROR(snapshot_manager_->publishExpireMarker(token, end));
    auto result = [&]() -> storage::Result<ExpireResult> {
        auto repinned = consumer_manager_->minPinnedSnapshot(config.consumer_expiration);
        if (!repinned.isOk()) return repinned.error();
        if (repinned.value() && *repinned.value() < end) {
            end = std::max(earliest_id, *repinned.value());
            LOG_INFO("[SnapshotExpirer] Snapshot ", *repinned.value(), " was pinned during planning; expiring before ", end);
            RETURN_IF_ERROR(snapshot_manager_->publishExpireMarker(token, end));
        }
        return expireUntil(earliest_id, end);
    }();
    auto cleared = snapshot_manager_->clearExpireMarker(token);
    if (!cleared.isOk()) {
        LOG_WARN("[SnapshotExpirer] Failed to clear expire marker ", token, ": ", cleared.error().toString());
    }
    return result;
}

storage::Result<std::set<std::string>> SnapshotExpirer::manifestsOf(const Snapshot& snapshot) const {
    std::set<std::string> names;
    for (const auto& list : {snapshot.base_manifest_list, snapshot.delta_manifest_list}) {
        names.insert(list);
        auto metas = manifest_list_->read(list);
        if (!metas.isOk()) return metas.error();
        for (const auto& meta : metas.value()) names.insert(meta.file_name);
    }
    return names;
}

storage::Result<ExpireResult> SnapshotExpirer::expireUntil(int64_t earliest_id, int64_t end_exclusive_id) {
    ExpireResult result;
    result.earliest_retained = std::max(earliest_id, end_exclusive_id);
    if (end_exclusive_id <= earliest_id) {
        return result;
    }
    LOG_INFO("[SnapshotExpirer] Expiring snapshots [", earliest_id, ", ", end_exclusive_id, ")");

    // Files DELETEd by snapshot k were last live in k-1. For k in
    // (earliest, end] that snapshot is being expired.
    const auto& paths = snapshot_manager_->pathFactory();
    for (int64_t id = earliest_id + 1; id <= end_exclusive_id; ++id) {
        auto s = snapshot_manager_->snapshot(id);
        if (!s.isOk()) return s.error();
        auto metas = manifest_list_->read(s.value().delta_manifest_list);
        if (!metas.isOk()) return metas.error();
        for (const auto& meta : metas.value()) {
            auto status = manifest_file_->read(meta.file_name).forEach(
                [&](const manifest::ManifestEntry& entry) -> storage::Status {
                    if (entry.kind == manifest::FileKind::DELETE) {
                        file_io_->deleteQuietly(paths.dataFilePath(*entry.file));
                        result.deleted_data_files++;
                    }
                    return storage::Status();
                });
            RETURN_IF_ERROR(status);
        }
    }

    auto end_snapshot = snapshot_manager_->snapshot(end_exclusive_id);
    if (!end_snapshot.isOk()) return end_snapshot.error();
    auto keep = manifestsOf(end_snapshot.value());
    if (!keep.isOk()) return keep.error();

    std::set<std::string> doomed;
    for (int64_t id = earliest_id; id < end_exclusive_id; ++id) {
        auto s = snapshot_manager_->snapshot(id);
        if (!s.isOk()) return s.error();
        auto names = manifestsOf(s.value());
        if (!names.isOk()) return names.error();
        for (const auto& name : names.value()) {
            if (keep.value().count(name) == 0) doomed.insert(name);
        }
    }
    for (const auto& name : doomed) {
        file_io_->deleteQuietly(paths.manifestPath(name));
        result.deleted_manifests++;
    }

    for (int64_t id = earliest_id; id < end_exclusive_id; ++id) {
        RETURN_IF_ERROR(snapshot_manager_->deleteSnapshot(id));
        result.expired_snapshots++;
    }
    RETURN_IF_ERROR(snapshot_manager_->commitEarliestHint(end_exclusive_id));

    LOG_INFO("[SnapshotExpirer] Expired ", result.expired_snapshots, " snapshots, ", result.deleted_data_files,
             " data files, ", result.deleted_manifests, " manifest objects; earliest is now ", end_exclusive_id);
    return result;
}

// --- OrphanFilesCleaner ---

OrphanFilesCleaner::OrphanFilesCleaner(std::shared_ptr<fs::FileIO> file_io,
                                       std::shared_ptr<SnapshotManager> snapshot_manager,
                                       std::shared_ptr<const manifest::ManifestFile> manifest_file,
                                       std::shared_ptr<const manifest::ManifestList> manifest_list)
    : file_io_(std::move(file_io)),
      snapshot_manager_(std::move(snapshot_manager)),
      manifest_file_(std::move(manifest_file)),
      manifest_list_(std::move(manifest_list)) {}

storage::Status OrphanFilesCleaner::collectReferences(std::set<std::string>& manifests,
                                                      std::set<std::string>& data_files) const {
    auto ids = snapshot_manager_->listSnapshotIds();
    if (!ids.isOk()) return ids.error();
    for (int64_t id : ids.value()) {
        auto s = snapshot_manager_->snapshot(id);
        if (!s.isOk()) {
            // Expired concurrently.
            if (s.error().code == storage::ErrorCode::FILE_NOT_FOUND) continue;
            return s.error();
        }
        for (const auto& list : {s.value().base_manifest_list, s.value().delta_manifest_list}) {
            if (!manifests.insert(list).second) continue;
            auto metas = manifest_list_->read(list);
            if (!metas.isOk()) return metas.error();
            for (const auto& meta : metas.value()) {
                if (!manifests.insert(meta.file_name).second) continue;
                RETURN_IF_ERROR(manifest_file_->read(meta.file_name).forEach(
                    [&](const manifest::ManifestEntry& entry) -> storage::Status {
                        data_files.insert(entry.file->file_name);
                        return storage::Status();
                    }));
            }
        }
    }
    return storage::Status();
}

storage::Result<CleanResult> OrphanFilesCleaner::clean(int64_t older_than_millis) {
    const auto& paths = snapshot_manager_->pathFactory();

    // List before reading snapshots: a file committed after the listing is
    // either absent from it or referenced by a snapshot read below.
    auto files = file_io_->listFilesRecursive(paths.root());
    if (!files.isOk()) return files.error();

    std::set<std::string> manifests;
    std::set<std::string> data_files;
    RETURN_IF_ERROR(collectReferences(manifests, data_files));

    const std::string snapshot_dir = paths.snapshotDirectory() + "/";
    const std::string schema_dir = paths.schemaDirectory() + "/";
    const std::string consumer_dir = paths.consumerDirectory() + "/";
    const std::string manifest_dir = paths.manifestDirectory() + "/";

    CleanResult result;
    for (const auto& status : files.value()) {
        if (status.modification_time_millis >= older_than_millis) continue;
        const std::string& path = status.path;
        if (path.compare(0, snapshot_dir.size(), snapshot_dir) == 0
            || path.compare(0, schema_dir.size(), schema_dir) == 0
            || path.compare(0, consumer_dir.size(), consumer_dir) == 0) {
            continue;
        }
        std::string name = fs::fileNameOf(path);
        bool orphan = false;
        if (!name.empty() && name[0] == '.' && name.size() > 4 && name.compare(name.size() - 4, 4, ".tmp") == 0) {
            orphan = true;
        } else if (path.compare(0, manifest_dir.size(), manifest_dir) == 0) {
            orphan = manifests.count(name) == 0;
        } else if (name.compare(0, 5, fs::FileStorePathFactory::DATA_FILE_PREFIX) == 0) {
            orphan = data_files.count(name) == 0;
        }
        if (!orphan) continue;

        auto deleted = file_io_->deleteFile(path);
        if (!deleted.isOk()) {
            LOG_WARN("[OrphanFilesCleaner] Failed to delete ", path, ": ", deleted.error().toString());
            continue;
        }
        result.deleted_files++;
        result.deleted_bytes += status.size;
        result.deleted_paths.push_back(path);
    }
    LOG_INFO("[OrphanFilesCleaner] Removed ", result.deleted_files, " orphan files (", result.deleted_bytes, " bytes)");
    return result;
}

} // namespace snapshot
} // namespace lakestore
