//include/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h" // Needed for STORAGE_ERROR macros
#include "result.h"        // Needed for RETURN_IF_ERROR macros

#include <string>
#include <string_view>

namespace lakestore {
namespace storage {
namespace error_utils {

    // Convert error code to string
    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    // Get error metadata
    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    // Error code predicates
    bool isTransientIoError(ErrorCode code);
    bool isRecoverable(ErrorCode code); // Checks severity

} // namespace error_utils

// Helper macros for error reporting with location info
#define STORAGE_ERROR(code, message) \
    ::lakestore::storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define STORAGE_ERROR_WITH_DETAILS(code, message, details) \
    ::lakestore::storage::StorageError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)

// Convenience macros for common patterns with Result<T>
#define RETURN_IF_ERROR(result_expression) \
    do { \
        auto&& _tmp_status_macro_result = (result_expression); \
        if (!_tmp_status_macro_result.isOk()) { \
            return std::move(_tmp_status_macro_result.error()); \
        } \
    } while(0)

// Requires var to be declared first
#define ASSIGN_OR_RETURN(var, result_expression) \
    do { \
        auto&& _tmp_assign_macro_result = (result_expression); \
        if (!_tmp_assign_macro_result.isOk()) { \
            return std::move(_tmp_assign_macro_result.error()); \
        } \
        var = std::move(_tmp_assign_macro_result.value()); \
    } while(0)

} // namespace storage
} // namespace lakestore
