// include/snapshot/consumer_manager.h
#pragma once

#include "../fs/file_io.h"
#include "../fs/path_factory.h"
#include "../storage_error/result.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace snapshot {

/**
 * @brief A persisted reader position. Expiration never removes the pinned
 * snapshot or anything newer while the pin is fresh.
 */
struct Consumer {
    std::string id;
    int64_t snapshot_id = 0;
    int64_t update_time_millis = 0;
};

class SnapshotLease;

/**
 * @class ConsumerManager
 * @brief Reads and writes `consumer/consumer-<id>` pin files.
 */
class ConsumerManager {
public:
    ConsumerManager(std::shared_ptr<fs::FileIO> file_io,
                    std::shared_ptr<const fs::FileStorePathFactory> path_factory,
                    fs::IoRetryPolicy io_retry = {});

    // Creates or moves the pin and refreshes its timestamp.
    storage::Status pin(const std::string& consumer_id, int64_t snapshot_id);
    storage::Status release(const std::string& consumer_id);

    storage::Result<std::optional<Consumer>> consumer(const std::string& consumer_id) const;
    storage::Result<std::vector<Consumer>> consumers() const;

    /**
     * @brief Smallest pinned snapshot id. Pins not refreshed within
     * `expiration` are ignored, so a crashed reader cannot block expiration.
     */
    storage::Result<std::optional<int64_t>> minPinnedSnapshot(
        std::optional<std::chrono::milliseconds> expiration) const;

    // Pins `snapshot_id` under a fresh consumer id for the lifetime of the lease.
    storage::Result<SnapshotLease> acquire(int64_t snapshot_id) const;

private:
    storage::Status validateId(const std::string& consumer_id) const;

    std::shared_ptr<fs::FileIO> file_io_;
    std::shared_ptr<const fs::FileStorePathFactory> path_factory_;
    fs::IoRetryPolicy io_retry_;
};

/**
 * @class SnapshotLease
 * @brief RAII pin of one snapshot. Move-only; the pin file is removed when
 * the lease is released or destroyed.
 */
class SnapshotLease {
public:
    SnapshotLease(ConsumerManager manager, std::string consumer_id, int64_t snapshot_id);
    ~SnapshotLease();

    SnapshotLease(SnapshotLease&& other) noexcept;
    SnapshotLease& operator=(SnapshotLease&& other) noexcept;
    SnapshotLease(const SnapshotLease&) = delete;
    SnapshotLease& operator=(const SnapshotLease&) = delete;

    int64_t snapshotId() const { return snapshot_id_; }
    const std::string& consumerId() const { return consumer_id_; }

    // Refreshes the pin timestamp. Long readers call this to stay fresh.
    storage::Status renew();
    storage::Status release();

private:
    std::optional<ConsumerManager> manager_;
    std::string consumer_id_;
    int64_t snapshot_id_;
    bool active_ = true;
};

} // namespace snapshot
} // namespace lakestore
