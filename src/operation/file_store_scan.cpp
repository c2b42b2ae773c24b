// src/operation/file_store_scan.cpp
#include "../../include/operation/file_store_scan.h"
#include "../../include/operation/commit_message.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <sstream>

namespace lakestore {
namespace operation {

std::string CommitMessage::toString() const {
    std::ostringstream oss;
    oss << "CommitMessage{partition=" << rowToString(partition) << ", bucket=" << bucket
        << ", new=" << new_files.size() << ", compact_before=" << compact_before.size()
        << ", compact_after=" << compact_after.size() << "}";
    return oss.str();
}

std::vector<io::DataFileMetaPtr> ScanPlan::files() const {
    std::vector<io::DataFileMetaPtr> result;
    result.reserve(entries.size());
    for (const auto& e : entries) result.push_back(e.file);
    return result;
}

BucketFiles ScanPlan::groupByBucket() const {
    BucketFiles grouped;
    for (const auto& e : entries) {
        grouped[BucketKey(e.partition(), e.bucket())].push_back(e.file);
    }
    return grouped;
}

FileStoreScan::FileStoreScan(std::shared_ptr<fs::FileIO> file_io,
                             std::shared_ptr<const snapshot::SnapshotManager> snapshot_manager,
                             std::shared_ptr<const manifest::ManifestFile> manifest_file,
                             std::shared_ptr<const manifest::ManifestList> manifest_list)
    : file_io_(std::move(file_io)),
      snapshot_manager_(std::move(snapshot_manager)),
      manifest_file_(std::move(manifest_file)),
      manifest_list_(std::move(manifest_list)) {}

bool FileStoreScan::matches(const manifest::ManifestEntry& entry, const ScanOptions& filter) const {
    if (filter.bucket && entry.bucket() != *filter.bucket) return false;
    if (filter.partition && compareRows(entry.partition(), *filter.partition) != 0) return false;
    if (filter.partition_filter &&
        !snapshot_manager_->pathFactory().partitionMatches(entry.partition(), *filter.partition_filter)) {
        return false;
    }
    return true;
}

bool FileStoreScan::mayContain(const manifest::ManifestFileMeta& meta, const ScanOptions& filter) const {
    if (!filter.partition || meta.num_added_files + meta.num_deleted_files == 0) return true;
    return compareRows(*filter.partition, meta.partition_min) >= 0 &&
           compareRows(*filter.partition, meta.partition_max) <= 0;
}

storage::Result<std::vector<manifest::ManifestFileMeta>> FileStoreScan::readAllManifests(
        const snapshot::Snapshot& snapshot) const {
    std::vector<manifest::ManifestFileMeta> all;
    ASSIGN_OR_RETURN(all, manifest_list_->read(snapshot.base_manifest_list));
    std::vector<manifest::ManifestFileMeta> delta;
    ASSIGN_OR_RETURN(delta, manifest_list_->read(snapshot.delta_manifest_list));
    all.insert(all.end(), delta.begin(), delta.end());
    return all;
}

storage::Result<std::vector<manifest::ManifestEntry>> FileStoreScan::readDeltaEntries(
        const snapshot::Snapshot& snapshot) const {
    std::vector<manifest::ManifestFileMeta> delta;
    ASSIGN_OR_RETURN(delta, manifest_list_->read(snapshot.delta_manifest_list));
    std::vector<manifest::ManifestEntry> entries;
    for (const auto& meta : delta) {
        RETURN_IF_ERROR(manifest_file_->read(meta.file_name).forEach([&](const manifest::ManifestEntry& e) {
            entries.push_back(e);
            return storage::Status();
        }));
    }
    return entries;
}

storage::Result<std::vector<manifest::ManifestEntry>> FileStoreScan::readLiveEntries(
        const snapshot::Snapshot& snapshot,
        const ScanOptions& filter) const {
    std::vector<manifest::ManifestFileMeta> manifests;
    ASSIGN_OR_RETURN(manifests, readAllManifests(snapshot));

    manifest::FileEntry::MergedEntries merged;
    for (const auto& meta : manifests) {
        if (!mayContain(meta, filter)) continue;
        auto status = manifest_file_->read(meta.file_name).forEach([&](const manifest::ManifestEntry& e) {
            if (!matches(e, filter)) return storage::Status();
            return manifest::FileEntry::mergeEntry(e, merged);
        });
        if (!status.isOk()) {
            return std::move(status.error()
                .withContext("snapshot", std::to_string(snapshot.id))
                .withContext("manifest", meta.file_name));
        }
    }
    auto no_deletes = manifest::FileEntry::requireNoDeletes(merged);
    if (!no_deletes.isOk()) {
        return std::move(no_deletes.error().withContext("snapshot", std::to_string(snapshot.id)));
    }
    return manifest::FileEntry::toVector(merged);
}

storage::Result<ScanPlan> FileStoreScan::plan(const ScanOptions& options) const {
    ScanPlan result;
    if (options.snapshot_id) {
        snapshot::Snapshot s;
        ASSIGN_OR_RETURN(s, snapshot_manager_->snapshot(*options.snapshot_id));
        result.snapshot = std::move(s);
    } else {
        std::optional<snapshot::Snapshot> latest;
        ASSIGN_OR_RETURN(latest, snapshot_manager_->latest());
        result.snapshot = std::move(latest);
    }
    if (!result.snapshot) return result;

    ASSIGN_OR_RETURN(result.entries, readLiveEntries(*result.snapshot, options));
    LOG_TRACE("[FileStoreScan] Planned ", result.entries.size(), " file(s) at snapshot ", result.snapshot->id);
    return result;
}

storage::Result<IntegrityReport> FileStoreScan::verifyIntegrity() const {
    IntegrityReport report;
    std::optional<int64_t> earliest;
    ASSIGN_OR_RETURN(earliest, snapshot_manager_->earliestSnapshotId());
    std::optional<int64_t> latest;
    ASSIGN_OR_RETURN(latest, snapshot_manager_->latestSnapshotId());
    if (!earliest || !latest) return report;

    std::optional<snapshot::Snapshot> last;
    for (int64_t id = *earliest; id <= *latest; ++id) {
        auto s = snapshot_manager_->snapshot(id);
        if (!s.isOk()) {
            return std::move(s.error().withContext("check", "snapshot chain is gap free"));
        }
        if (id > *earliest && s.value().previous_snapshot_id != id - 1) {
            return STORAGE_ERROR(storage::ErrorCode::STORAGE_CORRUPTION, "Snapshot is not linked to its predecessor")
                .withContext("snapshot", std::to_string(id));
        }
        auto live = readLiveEntries(s.value());
        if (!live.isOk()) return live.error();

        int64_t total = 0;
        for (const auto& e : live.value()) total += e.file->row_count;
        if (total != s.value().total_record_count) {
            return STORAGE_ERROR(storage::ErrorCode::STORAGE_CORRUPTION, "Total record count does not match live files")
                .withContext("snapshot", std::to_string(id))
                .withContext("recorded", std::to_string(s.value().total_record_count))
                .withContext("replayed", std::to_string(total));
        }
        report.snapshots_checked++;
        last = std::move(s).value();
    }

    std::vector<manifest::ManifestEntry> live;
    ASSIGN_OR_RETURN(live, readLiveEntries(*last));
    const auto& paths = snapshot_manager_->pathFactory();
    for (const auto& e : live) {
        std::string path = paths.dataFilePath(*e.file);
        bool present = false;
        ASSIGN_OR_RETURN(present, file_io_->exists(path));
        if (!present) {
            return STORAGE_ERROR(storage::ErrorCode::FILE_NOT_FOUND, "Live data file is missing")
                .withFilePath(path)
                .withContext("snapshot", std::to_string(last->id));
        }
        report.live_files_checked++;
    }
    LOG_INFO("[FileStoreScan] Integrity verified: ", report.snapshots_checked, " snapshot(s), ",
             report.live_files_checked, " live file(s)");
    return report;
}

} // namespace operation
} // namespace lakestore
