// src/snapshot/snapshot_manager.cpp
#include "../../include/snapshot/snapshot_manager.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace lakestore {
namespace snapshot {

std::string commitKindToString(CommitKind kind) {
    return std::string(magic_enum::enum_name(kind));
}

std::string Snapshot::toString() const {
    std::ostringstream oss;
    oss << "Snapshot{id=" << id
        << ", kind=" << commitKindToString(commit_kind)
        << ", user=" << commit_user
        << ", identifier=" << commit_identifier
        << ", base=" << base_manifest_list
        << ", delta=" << delta_manifest_list
        << ", records=" << total_record_count << " (+" << delta_record_count << ")"
        << "}";
    return oss.str();
}

namespace {
    std::optional<int64_t> parseSnapshotId(const std::string& file_name) {
        const std::string prefix = fs::FileStorePathFactory::SNAPSHOT_PREFIX;
        if (file_name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
        std::string digits = file_name.substr(prefix.size());
        auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit)) return std::nullopt;
        try {
            return std::stoll(digits);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
}

// --- SnapshotChain ---

SnapshotChain::SnapshotChain(const SnapshotManager* manager, int64_t start_id)
    : manager_(manager), next_id_(start_id) {}

storage::Result<std::optional<Snapshot>> SnapshotChain::next() {
    if (next_id_ < Snapshot::FIRST_SNAPSHOT_ID) {
        return std::optional<Snapshot>();
    }
    auto snapshot = manager_->snapshot(next_id_);
    if (!snapshot.isOk()) {
        if (snapshot.error().code != storage::ErrorCode::FILE_NOT_FOUND) {
            return snapshot.error();
        }
        // Missing: either expired history, or a hole in the chain.
        if (!earliest_) {
            auto earliest = manager_->earliestSnapshotId();
            if (!earliest.isOk()) return earliest.error();
            earliest_ = earliest.value().value_or(INT64_MAX);
        }
        if (next_id_ < *earliest_) {
            next_id_ = 0;
            return std::optional<Snapshot>();
        }
        return storage::StorageError::corruption("Snapshot " + std::to_string(next_id_) +
                                                 " is missing from the retained chain");
    }
    next_id_--;
    return std::optional<Snapshot>(std::move(snapshot).value());
}

// --- SnapshotManager ---

SnapshotManager::SnapshotManager(std::shared_ptr<fs::FileIO> file_io,
                                 std::shared_ptr<const fs::FileStorePathFactory> path_factory,
                                 std::shared_ptr<const manifest::MetadataCodec> codec,
                                 fs::IoRetryPolicy io_retry)
    : file_io_(std::move(file_io)),
      path_factory_(std::move(path_factory)),
      codec_(std::move(codec)),
      io_retry_(io_retry) {}

storage::Result<Snapshot> SnapshotManager::snapshot(int64_t id) const {
    std::string path = path_factory_->snapshotPath(id);
    auto content = fs::retryIo(io_retry_, "read snapshot " + std::to_string(id), [&]() {
        return file_io_->readFile(path);
    });
    if (!content.isOk()) return content.error();
    auto decoded = codec_->decodeSnapshot(content.value());
    if (!decoded.isOk()) {
        return std::move(decoded.error().withFilePath(path));
    }
    if (decoded.value().id != id) {
        return storage::StorageError::corruption("Snapshot file " + path + " holds id " +
                                                 std::to_string(decoded.value().id));
    }
    return decoded;
}

storage::Result<bool> SnapshotManager::exists(int64_t id) const {
    return fs::retryIo(io_retry_, "probe snapshot", [&]() {
        return file_io_->exists(path_factory_->snapshotPath(id));
    });
}

storage::Result<std::vector<int64_t>> SnapshotManager::listSnapshotIds() const {
    auto files = fs::retryIo(io_retry_, "list snapshots", [&]() {
        return file_io_->listFiles(path_factory_->snapshotDirectory());
    });
    if (!files.isOk()) return files.error();
    std::vector<int64_t> ids;
    for (const auto& status : files.value()) {
        auto id = parseSnapshotId(fs::fileNameOf(status.path));
        if (id) ids.push_back(*id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

storage::Result<std::optional<int64_t>> SnapshotManager::readHint(const std::string& path) const {
    auto content = file_io_->readFile(path);
    if (!content.isOk()) {
        if (content.error().code == storage::ErrorCode::FILE_NOT_FOUND) {
            return std::optional<int64_t>();
        }
        return content.error();
    }
    try {
        return std::optional<int64_t>(std::stoll(content.value()));
    } catch (const std::exception&) {
        LOG_WARN("[SnapshotManager] Ignoring malformed hint ", path);
        return std::optional<int64_t>();
    }
}

void SnapshotManager::writeHintQuietly(const std::string& path, int64_t id) {
    auto status = file_io_->writeFile(path, std::to_string(id), true);
    if (!status.isOk()) {
        LOG_WARN("[SnapshotManager] Failed to update hint ", path, ": ", status.error().toString());
    }
}

storage::Result<std::optional<int64_t>> SnapshotManager::latestSnapshotId() const {
    auto hint = readHint(path_factory_->latestHintPath());
    if (!hint.isOk()) return hint.error();

    if (hint.value()) {
        int64_t id = *hint.value();
        auto hinted = exists(id);
        if (!hinted.isOk()) return hinted.error();
        if (hinted.value()) {
            // The hint is written after the snapshot, so it may lag: probe forward.
            while (true) {
                auto next = exists(id + 1);
                if (!next.isOk()) return next.error();
                if (!next.value()) break;
                id++;
            }
            return std::optional<int64_t>(id);
        }
    }

    auto ids = listSnapshotIds();
    if (!ids.isOk()) return ids.error();
    if (ids.value().empty()) return std::optional<int64_t>();
    return std::optional<int64_t>(ids.value().back());
}

storage::Result<std::optional<int64_t>> SnapshotManager::earliestSnapshotId() const {
    auto hint = readHint(path_factory_->earliestHintPath());
    if (!hint.isOk()) return hint.error();
    if (hint.value()) {
        auto hinted = exists(*hint.value());
        if (!hinted.isOk()) return hinted.error();
        if (hinted.value()) {
            // Snapshots below the hint were deleted before the hint was written.
            return hint.value();
        }
    }
    auto ids = listSnapshotIds();
    if (!ids.isOk()) return ids.error();
    if (ids.value().empty()) return std::optional<int64_t>();
    return std::optional<int64_t>(ids.value().front());
}

storage::Result<std::optional<Snapshot>> SnapshotManager::latest() const {
    auto id = latestSnapshotId();
    if (!id.isOk()) return id.error();
    if (!id.value()) return std::optional<Snapshot>();
    auto s = snapshot(*id.value());
    if (!s.isOk()) return s.error();
    return std::optional<Snapshot>(std::move(s).value());
}

storage::Result<std::optional<Snapshot>> SnapshotManager::earliest() const {
    auto id = earliestSnapshotId();
    if (!id.isOk()) return id.error();
    if (!id.value()) return std::optional<Snapshot>();
    auto s = snapshot(*id.value());
    if (!s.isOk()) return s.error();
    return std::optional<Snapshot>(std::move(s).value());
}

storage::Result<bool> SnapshotManager::tryCommit(const Snapshot& snapshot) {
    std::string path = path_factory_->snapshotPath(snapshot.id);
    auto encoded = codec_->encodeSnapshot(snapshot);
    if (!encoded.isOk()) return encoded.error();
    const std::string& content = encoded.value();
    auto created = fs::retryIo(io_retry_, "commit snapshot " + std::to_string(snapshot.id), [&]() {
        return file_io_->tryAtomicCreate(path, content);
    });
    if (!created.isOk()) return created.error();
    if (created.value()) {
        writeHintQuietly(path_factory_->latestHintPath(), snapshot.id);
        LOG_TRACE("[SnapshotManager] Committed ", snapshot.toString());
    }
    return created;
}

SnapshotChain SnapshotManager::chainFrom(int64_t id) const {
    return SnapshotChain(this, id);
}

storage::Status SnapshotManager::commitEarliestHint(int64_t id) {
    return fs::retryIo(io_retry_, "write EARLIEST hint", [&]() {
        return file_io_->writeFile(path_factory_->earliestHintPath(), std::to_string(id), true);
    });
}

storage::Status SnapshotManager::deleteSnapshot(int64_t id) {
    return fs::retryIo(io_retry_, "delete snapshot " + std::to_string(id), [&]() {
        return file_io_->deleteFile(path_factory_->snapshotPath(id));
    });
}

storage::Status SnapshotManager::publishExpireMarker(const std::string& token, int64_t end_exclusive_id) {
    return fs::retryIo(io_retry_, "publish expire marker", [&]() {
        return file_io_->writeFile(path_factory_->expireMarkerPath(token), std::to_string(end_exclusive_id), true);
    });
}

storage::Status SnapshotManager::clearExpireMarker(const std::string& token) {
    return fs::retryIo(io_retry_, "clear expire marker", [&]() {
        return file_io_->deleteFile(path_factory_->expireMarkerPath(token));
    });
}

storage::Result<std::optional<int64_t>> SnapshotManager::expiringBefore() const {
    auto files = fs::retryIo(io_retry_, "list expire markers", [&]() {
        return file_io_->listFiles(path_factory_->snapshotDirectory());
    });
    if (!files.isOk()) {
        if (files.error().code == storage::ErrorCode::FILE_NOT_FOUND) return std::optional<int64_t>();
        return files.error();
    }
    const std::string prefix = fs::FileStorePathFactory::EXPIRE_MARKER_PREFIX;
    std::optional<int64_t> highest;
    for (const auto& status : files.value()) {
        std::string name = fs::fileNameOf(status.path);
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        // A marker cleared after listing reads as absent.
        auto end = readHint(status.path);
        if (!end.isOk()) return end.error();
        if (end.value() && (!highest || *end.value() > *highest)) highest = end.value();
    }
    return highest;
}

} // namespace snapshot
} // namespace lakestore
