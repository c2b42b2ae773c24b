// src/snapshot/consumer_manager.cpp
#include "../../include/snapshot/consumer_manager.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/uuid_utils.h"
#include "../../include/debug_utils.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lakestore {
namespace snapshot {

void to_json(json& j, const Consumer& c) {
    j = json{{"snapshotId", c.snapshot_id}, {"updateTimeMillis", c.update_time_millis}};
}

void from_json(const json& j, Consumer& c) {
    j.at("snapshotId").get_to(c.snapshot_id);
    j.at("updateTimeMillis").get_to(c.update_time_millis);
}

ConsumerManager::ConsumerManager(std::shared_ptr<fs::FileIO> file_io,
                                 std::shared_ptr<const fs::FileStorePathFactory> path_factory,
                                 fs::IoRetryPolicy io_retry)
    : file_io_(std::move(file_io)),
      path_factory_(std::move(path_factory)),
      io_retry_(io_retry) {}

storage::Status ConsumerManager::validateId(const std::string& consumer_id) const {
    if (consumer_id.empty() || consumer_id.find('/') != std::string::npos || consumer_id[0] == '.' ||
        !isValidUtf8(consumer_id)) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Invalid consumer id")
            .withContext("consumer_id", consumer_id);
    }
    return storage::Status();
}

storage::Status ConsumerManager::pin(const std::string& consumer_id, int64_t snapshot_id) {
    RETURN_IF_ERROR(validateId(consumer_id));
    Consumer c{consumer_id, snapshot_id, currentTimeMillis()};
    std::string content = json(c).dump();
    return fs::retryIo(io_retry_, "pin consumer " + consumer_id, [&]() {
        return file_io_->writeFile(path_factory_->consumerPath(consumer_id), content, true);
    });
}

storage::Status ConsumerManager::release(const std::string& consumer_id) {
    RETURN_IF_ERROR(validateId(consumer_id));
    return fs::retryIo(io_retry_, "release consumer " + consumer_id, [&]() {
        return file_io_->deleteFile(path_factory_->consumerPath(consumer_id));
    });
}

storage::Result<std::optional<Consumer>> ConsumerManager::consumer(const std::string& consumer_id) const {
    RETURN_IF_ERROR(validateId(consumer_id));
    std::string path = path_factory_->consumerPath(consumer_id);
    auto content = fs::retryIo(io_retry_, "read consumer " + consumer_id, [&]() {
        return file_io_->readFile(path);
    });
    if (!content.isOk()) {
        if (content.error().code == storage::ErrorCode::FILE_NOT_FOUND) {
            return std::optional<Consumer>();
        }
        return content.error();
    }
    try {
        Consumer c = json::parse(content.value()).get<Consumer>();
        c.id = consumer_id;
        return std::optional<Consumer>(std::move(c));
    } catch (const std::exception& e) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Malformed consumer file")
            .withDetails(e.what())
            .withFilePath(path);
    }
}

storage::Result<std::vector<Consumer>> ConsumerManager::consumers() const {
    auto files = fs::retryIo(io_retry_, "list consumers", [&]() {
        return file_io_->listFiles(path_factory_->consumerDirectory());
    });
    if (!files.isOk()) return files.error();

    const std::string prefix = fs::FileStorePathFactory::CONSUMER_PREFIX;
    std::vector<Consumer> result;
    for (const auto& status : files.value()) {
        std::string name = fs::fileNameOf(status.path);
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        auto c = consumer(name.substr(prefix.size()));
        if (!c.isOk()) return c.error();
        // Released between listing and reading.
        if (c.value()) result.push_back(std::move(*c.value()));
    }
    return result;
}

storage::Result<std::optional<int64_t>> ConsumerManager::minPinnedSnapshot(
        std::optional<std::chrono::milliseconds> expiration) const {
    auto all = consumers();
    if (!all.isOk()) return all.error();
    int64_t now = currentTimeMillis();
    std::optional<int64_t> min;
    for (const auto& c : all.value()) {
        if (expiration && now - c.update_time_millis > expiration->count()) {
            LOG_WARN("[ConsumerManager] Ignoring stale consumer '", c.id, "' pinned at snapshot ", c.snapshot_id);
            continue;
        }
        if (!min || c.snapshot_id < *min) min = c.snapshot_id;
    }
    return min;
}

storage::Result<SnapshotLease> ConsumerManager::acquire(int64_t snapshot_id) const {
    std::string consumer_id = "lease-" + generateUuid();
    ConsumerManager self = *this;
    RETURN_IF_ERROR(self.pin(consumer_id, snapshot_id));
    return SnapshotLease(std::move(self), std::move(consumer_id), snapshot_id);
}

// --- SnapshotLease ---

SnapshotLease::SnapshotLease(ConsumerManager manager, std::string consumer_id, int64_t snapshot_id)
    : manager_(std::move(manager)), consumer_id_(std::move(consumer_id)), snapshot_id_(snapshot_id) {}

SnapshotLease::~SnapshotLease() {
    if (active_) {
        auto status = release();
        if (!status.isOk()) {
            LOG_WARN("[SnapshotLease] Failed to release ", consumer_id_, ": ", status.error().toString());
        }
    }
}

SnapshotLease::SnapshotLease(SnapshotLease&& other) noexcept
    : manager_(std::move(other.manager_)),
      consumer_id_(std::move(other.consumer_id_)),
      snapshot_id_(other.snapshot_id_),
      active_(other.active_) {
    other.active_ = false;
}

SnapshotLease& SnapshotLease::operator=(SnapshotLease&& other) noexcept {
    if (this != &other) {
        if (active_) {
            auto status = release();
            if (!status.isOk()) {
                LOG_WARN("[SnapshotLease] Failed to release ", consumer_id_, ": ", status.error().toString());
            }
        }
        manager_ = std::move(other.manager_);
        consumer_id_ = std::move(other.consumer_id_);
        snapshot_id_ = other.snapshot_id_;
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

storage::Status SnapshotLease::renew() {
    if (!active_) {
        return STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, "Lease already released");
    }
    return manager_->pin(consumer_id_, snapshot_id_);
}

storage::Status SnapshotLease::release() {
    if (!active_) return storage::Status();
    active_ = false;
    return manager_->release(consumer_id_);
}

} // namespace snapshot
} // namespace lakestore
