// include/fs/file_io.h
#pragma once

#include "../storage_error/result.h"
#include "../debug_utils.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace lakestore {
namespace fs {

struct FileStatus {
    std::string path;
    int64_t size = 0;
    int64_t modification_time_millis = 0;
    bool is_directory = false;
};

/**
 * @class FileIO
 * @brief The storage substrate the table store runs on.
 *
 * Every object the table writes is immutable once visible. The only
 * conditional primitive required is tryAtomicCreate (create-if-absent),
 * which the commit protocol uses to claim the next snapshot id.
 *
 * Paths are plain strings; implementations for object stores map them to keys.
 */
class FileIO {
public:
    virtual ~FileIO() = default;

    virtual storage::Result<std::string> readFile(const std::string& path) const = 0;

    /**
     * @brief Makes `content` visible at `path` in one step (no torn reads).
     * @param overwrite When false, fails with FILE_ALREADY_EXISTS if the path exists.
     */
    virtual storage::Status writeFile(const std::string& path, const std::string& content, bool overwrite) = 0;

    /**
     * @brief Create-if-absent. Returns false, without touching the existing
     * object, when `path` already exists.
     */
    virtual storage::Result<bool> tryAtomicCreate(const std::string& path, const std::string& content) = 0;

    virtual storage::Result<bool> exists(const std::string& path) const = 0;

    // Succeeds when the file is already gone.
    virtual storage::Status deleteFile(const std::string& path) = 0;

    // Direct children that are regular files. A missing directory lists as empty.
    virtual storage::Result<std::vector<FileStatus>> listFiles(const std::string& dir) const = 0;
    virtual storage::Result<std::vector<FileStatus>> listDirectories(const std::string& dir) const = 0;
    virtual storage::Result<std::vector<FileStatus>> listFilesRecursive(const std::string& dir) const = 0;

    virtual storage::Status mkdirs(const std::string& dir) = 0;
    virtual storage::Result<FileStatus> getFileStatus(const std::string& path) const = 0;

    /**
     * @brief Best-effort delete for cleanup paths that must not mask the
     * caller's primary error.
     */
    void deleteQuietly(const std::string& path) {
        auto status = deleteFile(path);
        if (!status.isOk()) {
            LOG_WARN("[FileIO] Failed to delete '", path, "': ", status.error().toString());
        }
    }
};

/**
 * @class LocalFileIO
 * @brief POSIX file system implementation. Writes go to a hidden temp file
 * that is renamed (overwrite) or hard-linked (create-if-absent) into place.
 */
class LocalFileIO : public FileIO {
public:
    LocalFileIO() = default;

    storage::Result<std::string> readFile(const std::string& path) const override;
    storage::Status writeFile(const std::string& path, const std::string& content, bool overwrite) override;
    storage::Result<bool> tryAtomicCreate(const std::string& path, const std::string& content) override;
    storage::Result<bool> exists(const std::string& path) const override;
    storage::Status deleteFile(const std::string& path) override;
    storage::Result<std::vector<FileStatus>> listFiles(const std::string& dir) const override;
    storage::Result<std::vector<FileStatus>> listDirectories(const std::string& dir) const override;
    storage::Result<std::vector<FileStatus>> listFilesRecursive(const std::string& dir) const override;
    storage::Status mkdirs(const std::string& dir) override;
    storage::Result<FileStatus> getFileStatus(const std::string& path) const override;

private:
    storage::Result<std::string> writeTempFile(const std::string& path, const std::string& content);
};

struct IoRetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds retry_wait{50};
};

/**
 * @brief Runs `fn` and re-runs it while it fails with a transient I/O error,
 * backing off exponentially from policy.retry_wait. Any other error, and the
 * last transient one, is returned unchanged.
 */
template<typename F>
auto retryIo(const IoRetryPolicy& policy, const std::string& operation, F&& fn) -> decltype(fn()) {
    auto result = fn();
    for (int attempt = 1; !result.isOk() && result.error().isTransientIo() && attempt <= policy.max_retries; ++attempt) {
        LOG_WARN("[retryIo] ", operation, " failed (attempt ", attempt, "/", policy.max_retries + 1, "): ",
                 result.error().toString());
        std::this_thread::sleep_for(policy.retry_wait * (1 << (attempt - 1)));
        result = fn();
    }
    return result;
}

// Joins two path segments with exactly one '/'.
std::string joinPath(const std::string& parent, const std::string& child);
std::string fileNameOf(const std::string& path);
std::string parentOf(const std::string& path);

} // namespace fs
} // namespace lakestore
