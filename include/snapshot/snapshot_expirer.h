// include/snapshot/snapshot_expirer.h
#pragma once

#include "snapshot_manager.h"
#include "consumer_manager.h"
#include "../config/core_options.h"
#include "../manifest/manifest_file.h"

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lakestore {
namespace snapshot {

struct ExpireConfig {
    int32_t retain_min = 10;
    int32_t retain_max = 2147483647;
    std::chrono::milliseconds time_retained{3600 * 1000};
    // Maximum number of snapshots removed by one run.
    int32_t max_deletes = 10;
    std::optional<std::chrono::milliseconds> consumer_expiration;

    static ExpireConfig fromOptions(const CoreOptions& options);
    std::string to_string() const;
};

struct ExpireResult {
    int64_t expired_snapshots = 0;
    int64_t deleted_data_files = 0;
    int64_t deleted_manifests = 0;
    std::optional<int64_t> earliest_retained;
};

/**
 * @class SnapshotExpirer
 * @brief Removes old snapshots and the files only they reference.
 *
 * The retained window is [end, latest], where end is the smallest id allowed
 * by the retain counts, the time threshold, the minimum fresh consumer pin and
 * the per-run limit. Before deleting anything the run publishes an expire
 * marker and re-reads the pins (see SnapshotManager::publishExpireMarker).
 * Deletion order is data files, then manifests and manifest lists, then
 * snapshot files, then the EARLIEST hint; a crash part way leaves only
 * unreferenced files behind and a re-run completes the job.
 */
class SnapshotExpirer {
public:
    SnapshotExpirer(std::shared_ptr<fs::FileIO> file_io,
                    std::shared_ptr<SnapshotManager> snapshot_manager,
                    std::shared_ptr<ConsumerManager> consumer_manager,
                    std::shared_ptr<const manifest::ManifestFile> manifest_file,
                    std::shared_ptr<const manifest::ManifestList> manifest_list);

    storage::Result<ExpireResult> expire(const ExpireConfig& config);

private:
    storage::Result<ExpireResult> expireUntil(int64_t earliest_id, int64_t end_exclusive_id);
    storage::Result<std::set<std::string>> manifestsOf(const Snapshot& snapshot) const;

    std::shared_ptr<fs::FileIO> file_io_;
    std::shared_ptr<SnapshotManager> snapshot_manager_;
    std::shared_ptr<ConsumerManager> consumer_manager_;
    std::shared_ptr<const manifest::ManifestFile> manifest_file_;
    std::shared_ptr<const manifest::ManifestList> manifest_list_;
};

struct CleanResult {
    int64_t deleted_files = 0;
    int64_t deleted_bytes = 0;
    std::vector<std::string> deleted_paths;
};

/**
 * @class OrphanFilesCleaner
 * @brief Deletes data files, manifests and manifest lists that no retained
 * snapshot references, plus leftover temp files.
 *
 * Only files older than the threshold are touched, which protects the output
 * of writers that have not committed yet. Snapshot, schema and consumer files
 * are never touched.
 */
class OrphanFilesCleaner {
public:
    OrphanFilesCleaner(std::shared_ptr<fs::FileIO> file_io,
                       std::shared_ptr<SnapshotManager> snapshot_manager,
                       std::shared_ptr<const manifest::ManifestFile> manifest_file,
                       std::shared_ptr<const manifest::ManifestList> manifest_list);

    storage::Result<CleanResult> clean(int64_t older_than_millis);

private:
    storage::Status collectReferences(std::set<std::string>& manifests, std::set<std::string>& data_files) const;

    std::shared_ptr<fs::FileIO> file_io_;
    std::shared_ptr<SnapshotManager> snapshot_manager_;
    std::shared_ptr<const manifest::ManifestFile> manifest_file_;
    std::shared_ptr<const manifest::ManifestList> manifest_list_;
};

} // namespace snapshot
} // namespace lakestore
