// include/snapshot/snapshot_manager.h
#pragma once

#include "snapshot.h"
#include "../fs/file_io.h"
#include "../fs/path_factory.h"
#include "../manifest/metadata_codec.h"
#include "../storage_error/result.h"

#include <memory>
#include <optional>
#include <vector>

namespace lakestore {
namespace snapshot {

class SnapshotManager;

/**
 * @class SnapshotChain
 * @brief Pull-style backward walk over snapshots, starting at a given id.
 *
 * The walk ends after snapshot 1, or when it reaches an id below the earliest
 * retained snapshot (expired history). A missing snapshot at or above the
 * earliest retained id is corruption.
 */
class SnapshotChain {
public:
    SnapshotChain(const SnapshotManager* manager, int64_t start_id);

    // nullopt once the walk is exhausted.
    storage::Result<std::optional<Snapshot>> next();

private:
    const SnapshotManager* manager_;
    int64_t next_id_;
    std::optional<int64_t> earliest_;
};

/**
 * @class SnapshotManager
 * @brief Reads snapshot files and claims new snapshot ids.
 *
 * `snapshot-<id>` files are created with create-if-absent and never rewritten.
 * The LATEST and EARLIEST hints are advisory; readers probe past them.
 */
class SnapshotManager {
public:
    SnapshotManager(std::shared_ptr<fs::FileIO> file_io,
                    std::shared_ptr<const fs::FileStorePathFactory> path_factory,
                    std::shared_ptr<const manifest::MetadataCodec> codec,
                    fs::IoRetryPolicy io_retry = {});

    storage::Result<std::optional<Snapshot>> latest() const;
    storage::Result<std::optional<Snapshot>> earliest() const;
    storage::Result<std::optional<int64_t>> latestSnapshotId() const;
    storage::Result<std::optional<int64_t>> earliestSnapshotId() const;

    storage::Result<Snapshot> snapshot(int64_t id) const;
    storage::Result<bool> exists(int64_t id) const;
    // Ascending.
    storage::Result<std::vector<int64_t>> listSnapshotIds() const;

    /**
     * @brief Atomically publishes `snapshot` as `snapshot-<id>`.
     * @return false when another committer already claimed the id.
     */
    storage::Result<bool> tryCommit(const Snapshot& snapshot);

    SnapshotChain chainFrom(int64_t id) const;

    storage::Status commitEarliestHint(int64_t id);
    storage::Status deleteSnapshot(int64_t id);

    /**
     * @brief Expiration handshake. An expirer publishes the end of the range
     * it is about to delete before it reads the consumer pins; a reader
     * writes its pin before it reads the markers. Either the expirer sees the
     * pin or the reader sees the marker.
     */
    storage::Status publishExpireMarker(const std::string& token, int64_t end_exclusive_id);
    storage::Status clearExpireMarker(const std::string& token);
    // Highest end announced by any running expirer.
    storage::Result<std::optional<int64_t>> expiringBefore() const;

    const fs::FileStorePathFactory& pathFactory() const { return *path_factory_; }

private:
    storage::Result<std::optional<int64_t>> readHint(const std::string& path) const;
    void writeHintQuietly(const std::string& path, int64_t id);

    std::shared_ptr<fs::FileIO> file_io_;
    std::shared_ptr<const fs::FileStorePathFactory> path_factory_;
    std::shared_ptr<const manifest::MetadataCodec> codec_;
    fs::IoRetryPolicy io_retry_;
};

} // namespace snapshot
} // namespace lakestore
