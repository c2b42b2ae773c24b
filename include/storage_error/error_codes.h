// include/storage_error/error_codes.h
#pragma once

namespace lakestore {
namespace storage {

/**
 * @brief Error codes for table store operations, grouped by category range.
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Table metadata: snapshots, manifests, schemas (1000-1999)
    STORAGE_CORRUPTION = 1001,
    FORMAT_VERSION_MISMATCH = 1002,
    MANIFEST_ERROR = 1003,
    SNAPSHOT_ERROR = 1004,

    // Merge tree: data files and compaction (2000-2999)
    COMPACTION_FAILED = 2001,
    DATA_FILE_CORRUPTION = 2002,

    // I/O and File System Errors (4000-4999)
    IO_READ_ERROR = 4001,
    IO_WRITE_ERROR = 4002,
    FILE_NOT_FOUND = 4006,
    FILE_PERMISSION_DENIED = 4007,
    FILE_ALREADY_EXISTS = 4008,
    DISK_FULL = 4010,

    // Data Validation Errors (5000-5999)
    INVALID_VALUE = 5002,
    CHECKSUM_MISMATCH = 5005,
    INVALID_DATA_FORMAT = 5006,
    SCHEMA_VIOLATION = 5007,
    ENCODING_ERROR = 5008,
    COMPRESSION_ERROR = 5009,

    // Concurrency Errors (6000-6999)
    COMMIT_CONFLICT = 6003,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,

    // Generic Errors (10000+)
    TIMEOUT = 10001,
    INTERNAL_ERROR = 10004
};

enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Lost a race; re-plan and retry
    ERROR,      // Operation failed, table state is intact
    CRITICAL,   // The host is in trouble (disk full)
    FATAL       // The table must not be written until repaired
};

enum class ErrorCategory {
    TABLE_METADATA,
    MERGE_TREE,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    CONCURRENCY,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
} // namespace lakestore
