//include/storage_error/storage_error.h

#pragma once

#include "error_codes.h"
#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <unordered_map>

namespace lakestore {
namespace storage {

/**
 * @brief Detailed error information with context
 */
class StorageError {
public:
    ErrorCode code;
    ErrorSeverity severity; // Will be set based on code
    ErrorCategory category; // Will be set based on code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<ErrorCode> underlying_error;
    std::unordered_map<std::string, std::string> context;

    // Constructors
    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    // Utility methods
    bool isRecoverable() const;
    bool isConflict() const { return code == ErrorCode::COMMIT_CONFLICT; }
    bool isTransientIo() const;
    std::string toString() const;
    std::string toDetailedString() const;

    // Static factory methods for common errors
    static StorageError corruption(const std::string& details);
    static StorageError ioError(ErrorCode code, const std::string& operation, const std::string& path);
    static StorageError timeout(const std::string& operation, std::chrono::milliseconds duration);
    static StorageError commitConflict(const std::string& reason);
    static StorageError compactionFailed(const std::string& reason);
    static StorageError invalidConfiguration(const std::string& reason);
};

} // namespace storage
} // namespace lakestore
