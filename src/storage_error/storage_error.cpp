// src/storage_error/storage_error.cpp
#include "../../include/storage_error/storage_error.h"
#include "../../include/storage_error/error_utils.h"
#include <sstream>
#include <iomanip> // For std::put_time
#include <chrono>

namespace lakestore {
namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->file_path = file;
    this->line_number = line;
    this->function_name = function;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    this->underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    this->file_path = path; // Shares the member used by withLocation
    return *this;
}

bool StorageError::isRecoverable() const {
    return error_utils::isRecoverable(code);
}

bool StorageError::isTransientIo() const {
    return error_utils::isTransientIoError(code);
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (!details.empty()) {
        oss << " - " << details;
    }
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;

    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code)
        << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";

    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }

    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }

    if (file_path && line_number && function_name) {
        oss << "  Location: " << *function_name << " at " << *file_path << ":" << *line_number << "\n";
    } else if (file_path) {
        oss << "  File Path: " << *file_path << "\n";
    }

    if (underlying_error) {
        oss << "  Underlying Error: " << error_utils::errorCodeToString(*underlying_error)
            << " (" << static_cast<int>(*underlying_error) << ")\n";
    }

    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "\n";

    return oss.str();
}

// Static factory methods
StorageError StorageError::corruption(const std::string& details_param) {
    return StorageError(ErrorCode::STORAGE_CORRUPTION, "Table corruption detected")
        .withDetails(details_param)
        .withSuggestedAction("Run 'lakestore-admin <table> verify' and restore from a retained snapshot");
}

StorageError StorageError::ioError(ErrorCode code, const std::string& operation, const std::string& path) {
    return StorageError(code, "I/O operation failed")
        .withDetails("Operation: " + operation)
        .withFilePath(path)
        .withSuggestedAction("Check file permissions and disk space");
}

StorageError StorageError::timeout(const std::string& operation, std::chrono::milliseconds duration) {
    return StorageError(ErrorCode::TIMEOUT, "Operation timed out")
        .withDetails("Operation: " + operation + ", Duration: " + std::to_string(duration.count()) + "ms")
        .withSuggestedAction("Increase timeout value or check system performance");
}

StorageError StorageError::commitConflict(const std::string& reason) {
    return StorageError(ErrorCode::COMMIT_CONFLICT, "Commit conflict")
        .withDetails(reason)
        .withSuggestedAction("Re-read the latest snapshot and re-plan the change");
}

StorageError StorageError::compactionFailed(const std::string& reason) {
    return StorageError(ErrorCode::COMPACTION_FAILED, "Bucket compaction failed")
        .withDetails(reason)
        .withSuggestedAction("Check disk space and retry compaction");
}

StorageError StorageError::invalidConfiguration(const std::string& reason) {
    return StorageError(ErrorCode::INVALID_CONFIGURATION, "Invalid table configuration")
        .withDetails(reason)
        .withSuggestedAction("Fix the table options and reopen the table");
}

} // namespace storage
} // namespace lakestore
