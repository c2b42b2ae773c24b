//src/storage_error/error_utils.cpp

#include "../../include/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace lakestore {
namespace storage {
namespace error_utils {

// Codes run past magic_enum's reflection range, so they are spelled out.
std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        case ErrorCode::STORAGE_CORRUPTION: return "STORAGE_CORRUPTION";
        case ErrorCode::FORMAT_VERSION_MISMATCH: return "FORMAT_VERSION_MISMATCH";
        case ErrorCode::MANIFEST_ERROR: return "MANIFEST_ERROR";
        case ErrorCode::SNAPSHOT_ERROR: return "SNAPSHOT_ERROR";

        case ErrorCode::COMPACTION_FAILED: return "COMPACTION_FAILED";
        case ErrorCode::DATA_FILE_CORRUPTION: return "DATA_FILE_CORRUPTION";

        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_PERMISSION_DENIED: return "FILE_PERMISSION_DENIED";
        case ErrorCode::FILE_ALREADY_EXISTS: return "FILE_ALREADY_EXISTS";
        case ErrorCode::DISK_FULL: return "DISK_FULL";

        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";
        case ErrorCode::SCHEMA_VIOLATION: return "SCHEMA_VIOLATION";
        case ErrorCode::ENCODING_ERROR: return "ENCODING_ERROR";
        case ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";

        case ErrorCode::COMMIT_CONFLICT: return "COMMIT_CONFLICT";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN_ERROR_CODE";
}

std::string_view severityToString(ErrorSeverity severity) {
    auto name = magic_enum::enum_name(severity);
    return name.empty() ? std::string_view("UNKNOWN_SEVERITY") : name;
}

std::string_view categoryToString(ErrorCategory category) {
    auto name = magic_enum::enum_name(category);
    return name.empty() ? std::string_view("UNKNOWN_CATEGORY") : name;
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        // Corruption is never repaired silently.
        case ErrorCode::STORAGE_CORRUPTION:
        case ErrorCode::DATA_FILE_CORRUPTION:
        case ErrorCode::MANIFEST_ERROR:
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::FORMAT_VERSION_MISMATCH:
            return ErrorSeverity::FATAL;

        case ErrorCode::DISK_FULL:
            return ErrorSeverity::CRITICAL;

        // Another committer won; the caller re-plans.
        case ErrorCode::COMMIT_CONFLICT:
            return ErrorSeverity::WARNING;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::TABLE_METADATA;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::MERGE_TREE;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 6000 && code_value < 7000) {
        return ErrorCategory::CONCURRENCY;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

// Worth retrying with backoff; a missing file or full disk is not.
bool isTransientIoError(ErrorCode code) {
    return code == ErrorCode::IO_READ_ERROR || code == ErrorCode::IO_WRITE_ERROR;
}

bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

} // namespace error_utils
} // namespace storage
} // namespace lakestore
