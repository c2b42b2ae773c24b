// src/fs/local_file_io.cpp
#include "../../include/fs/file_io.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/uuid_utils.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

namespace stdfs = std::filesystem;

namespace lakestore {
namespace fs {

namespace {
    storage::ErrorCode errnoToCode(int err, bool writing) {
        switch (err) {
            case ENOENT: return storage::ErrorCode::FILE_NOT_FOUND;
            case EACCES:
            case EPERM:  return storage::ErrorCode::FILE_PERMISSION_DENIED;
            case ENOSPC: return storage::ErrorCode::DISK_FULL;
            case EEXIST: return storage::ErrorCode::FILE_ALREADY_EXISTS;
            default:     return writing ? storage::ErrorCode::IO_WRITE_ERROR : storage::ErrorCode::IO_READ_ERROR;
        }
    }

    storage::StorageError errnoError(int err, bool writing, const std::string& operation, const std::string& path) {
        return storage::StorageError::ioError(errnoToCode(err, writing), operation, path)
            .withContext("errno", std::strerror(err));
    }

    int64_t mtimeMillis(const struct stat& st) {
        return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
    }

    storage::Result<std::vector<FileStatus>> listEntries(const std::string& dir, bool want_dirs, bool recursive) {
        std::vector<FileStatus> out;
        std::error_code ec;
        if (!stdfs::exists(dir, ec)) {
            return out;
        }
        auto visit = [&](const stdfs::directory_entry& entry) -> bool {
            std::error_code entry_ec;
            bool is_dir = entry.is_directory(entry_ec);
            if (entry_ec) return true; // Vanished while listing.
            if (is_dir != want_dirs) return true;
            struct stat st {};
            if (::stat(entry.path().c_str(), &st) != 0) return true;
            out.push_back(FileStatus{entry.path().string(), static_cast<int64_t>(st.st_size), mtimeMillis(st), is_dir});
            return true;
        };
        if (recursive) {
            for (stdfs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                visit(*it);
            }
        } else {
            for (stdfs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                visit(*it);
            }
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return errnoError(ec.value(), false, "list", dir);
        }
        return out;
    }
}

std::string joinPath(const std::string& parent, const std::string& child) {
    if (parent.empty()) return child;
    if (parent.back() == '/') return parent + child;
    return parent + "/" + child;
}

std::string fileNameOf(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string parentOf(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

storage::Result<std::string> LocalFileIO::readFile(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return errnoError(errno, false, "open for read", path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return errnoError(errno, false, "read", path);
    }
    return buffer.str();
}

storage::Result<std::string> LocalFileIO::writeTempFile(const std::string& path, const std::string& content) {
    std::string parent = parentOf(path);
    if (!parent.empty()) {
        auto mk = mkdirs(parent);
        if (!mk.isOk()) return mk.error();
    }
    std::string tmp = joinPath(parent, "." + fileNameOf(path) + "." + generateUuid() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return errnoError(errno, true, "open for write", tmp);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            int err = errno;
            out.close();
            ::unlink(tmp.c_str());
            return errnoError(err, true, "write", tmp);
        }
    }
    return tmp;
}

storage::Status LocalFileIO::writeFile(const std::string& path, const std::string& content, bool overwrite) {
    if (!overwrite) {
        auto created = tryAtomicCreate(path, content);
        if (!created.isOk()) return created.error();
        if (!created.value()) {
            return STORAGE_ERROR(storage::ErrorCode::FILE_ALREADY_EXISTS, "File already exists").withFilePath(path);
        }
        return storage::Status();
    }

    auto tmp = writeTempFile(path, content);
    if (!tmp.isOk()) return tmp.error();
    if (::rename(tmp.value().c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tmp.value().c_str());
        return errnoError(err, true, "rename", path);
    }
    return storage::Status();
}

storage::Result<bool> LocalFileIO::tryAtomicCreate(const std::string& path, const std::string& content) {
    auto tmp = writeTempFile(path, content);
    if (!tmp.isOk()) return tmp.error();

    // link(2) fails with EEXIST instead of replacing the target.
    int rc = ::link(tmp.value().c_str(), path.c_str());
    int err = errno;
    ::unlink(tmp.value().c_str());
    if (rc == 0) {
        return true;
    }
    if (err == EEXIST) {
        return false;
    }
    return errnoError(err, true, "atomic create", path);
}

storage::Result<bool> LocalFileIO::exists(const std::string& path) const {
    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) {
        return true;
    }
    if (errno == ENOENT || errno == ENOTDIR) {
        return false;
    }
    return errnoError(errno, false, "stat", path);
}

storage::Status LocalFileIO::deleteFile(const std::string& path) {
    if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
        return storage::Status();
    }
    return errnoError(errno, true, "delete", path);
}

storage::Result<std::vector<FileStatus>> LocalFileIO::listFiles(const std::string& dir) const {
    return listEntries(dir, false, false);
}

storage::Result<std::vector<FileStatus>> LocalFileIO::listDirectories(const std::string& dir) const {
    return listEntries(dir, true, false);
}

storage::Result<std::vector<FileStatus>> LocalFileIO::listFilesRecursive(const std::string& dir) const {
    return listEntries(dir, false, true);
}

storage::Status LocalFileIO::mkdirs(const std::string& dir) {
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec) {
        return errnoError(ec.value(), true, "mkdirs", dir);
    }
    return storage::Status();
}

storage::Result<FileStatus> LocalFileIO::getFileStatus(const std::string& path) const {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return errnoError(errno, false, "stat", path);
    }
    return FileStatus{path, static_cast<int64_t>(st.st_size), mtimeMillis(st), S_ISDIR(st.st_mode)};
}

} // namespace fs
} // namespace lakestore
