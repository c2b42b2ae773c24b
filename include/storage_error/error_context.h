//include/storage_error/error_context.h
#pragma once

#include "storage_error.h"
#include <memory>
#include <optional>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace lakestore {
namespace storage {

class ErrorHandler;

/**
 * @brief Collects errors raised by background work (compaction tasks) that has
 * no caller to return them to. Keeps per-code counts and a bounded history.
 */
class ErrorContext {
private:
    std::shared_ptr<ErrorHandler> handler_;
    std::vector<StorageError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    mutable std::mutex mutex_;

    static constexpr size_t MAX_RECENT_ERRORS = 100;

public:
    ErrorContext(std::shared_ptr<ErrorHandler> handler = nullptr);

    void setErrorHandler(std::shared_ptr<ErrorHandler> handler);
    void reportError(const StorageError& error);
    void reportError(ErrorCode code, const std::string& message);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    std::vector<StorageError> getRecentErrors(size_t count = 10) const;
    std::optional<StorageError> lastError() const;

    bool hasRepeatedErrors(ErrorCode code, size_t threshold = 5) const;

    void clearErrors();
};

} // namespace storage
} // namespace lakestore
