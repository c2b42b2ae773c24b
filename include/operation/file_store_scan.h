// include/operation/file_store_scan.h
#pragma once

#include "../manifest/manifest_file.h"
#include "../snapshot/snapshot_manager.h"

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace lakestore {
namespace operation {

struct ScanOptions {
    // Latest when unset.
    std::optional<int64_t> snapshot_id;
    // Exact partition; also prunes whole manifests by their partition range.
    std::optional<Row> partition;
    std::optional<fs::PartitionSpec> partition_filter;
    std::optional<int32_t> bucket;
};

using BucketKey = std::pair<Row, int32_t>;

struct BucketKeyLess {
    bool operator()(const BucketKey& a, const BucketKey& b) const {
        int c = compareRows(a.first, b.first);
        if (c != 0) return c < 0;
        return a.second < b.second;
    }
};

using BucketFiles = std::map<BucketKey, std::vector<io::DataFileMetaPtr>, BucketKeyLess>;

/**
 * @struct ScanPlan
 * @brief The live files of one snapshot that match a scan. An empty table
 * yields a plan without snapshot.
 */
struct ScanPlan {
    std::optional<snapshot::Snapshot> snapshot;
    std::vector<manifest::ManifestEntry> entries;

    std::vector<io::DataFileMetaPtr> files() const;
    BucketFiles groupByBucket() const;
};

struct IntegrityReport {
    int64_t snapshots_checked = 0;
    int64_t live_files_checked = 0;
};

/**
 * @class FileStoreScan
 * @brief Reconstructs live file sets from snapshots by replaying their
 * manifests. Read-only; safe to share between threads.
 */
class FileStoreScan {
public:
    FileStoreScan(std::shared_ptr<fs::FileIO> file_io,
                  std::shared_ptr<const snapshot::SnapshotManager> snapshot_manager,
                  std::shared_ptr<const manifest::ManifestFile> manifest_file,
                  std::shared_ptr<const manifest::ManifestList> manifest_list);

    storage::Result<ScanPlan> plan(const ScanOptions& options = ScanOptions{}) const;

    /**
     * @brief Replays base then delta list of `snapshot` and returns the ADD
     * entries left standing. A DELETE without a matching ADD is corruption.
     */
    storage::Result<std::vector<manifest::ManifestEntry>> readLiveEntries(
        const snapshot::Snapshot& snapshot,
        const ScanOptions& filter = ScanOptions{}) const;

    // Base list followed by delta list.
    storage::Result<std::vector<manifest::ManifestFileMeta>> readAllManifests(const snapshot::Snapshot& snapshot) const;

    // Entries of the delta list only, unmerged.
    storage::Result<std::vector<manifest::ManifestEntry>> readDeltaEntries(const snapshot::Snapshot& snapshot) const;

    /**
     * @brief Checks every retained snapshot: ids are gap free and linked to
     * their predecessor, every manifest replays cleanly, and every live file
     * of the latest snapshot exists.
     */
    storage::Result<IntegrityReport> verifyIntegrity() const;

private:
    bool matches(const manifest::ManifestEntry& entry, const ScanOptions& filter) const;
    bool mayContain(const manifest::ManifestFileMeta& meta, const ScanOptions& filter) const;

    std::shared_ptr<fs::FileIO> file_io_;
    std::shared_ptr<const snapshot::SnapshotManager> snapshot_manager_;
    std::shared_ptr<const manifest::ManifestFile> manifest_file_;
    std::shared_ptr<const manifest::ManifestList> manifest_list_;
};

} // namespace operation
} // namespace lakestore
