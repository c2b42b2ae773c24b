// include/fs/path_factory.h
#pragma once

#include "../types.h"
#include "../io/data_file_meta.h"

#include <atomic>
#include <map>
#include <string>
#include <vector>

namespace lakestore {
namespace fs {

// Equality filter on a subset of partition keys, e.g. {"dt": "2024-01-01"}.
using PartitionSpec = std::map<std::string, std::string>;

/**
 * @class FileStorePathFactory
 * @brief Owns the table directory layout and generates unique object names.
 *
 *   <root>/schema/schema-<id>
 *   <root>/snapshot/snapshot-<id>, LATEST, EARLIEST
 *   <root>/manifest/manifest-<uuid>-<n>, manifest-list-<uuid>-<n>
 *   <root>/consumer/consumer-<id>
 *   <root>/<k1=v1>/<k2=v2>/bucket-<n>/data-<uuid>-<n>
 *
 * Shared between threads; name generation is lock-free.
 */
class FileStorePathFactory {
public:
    static constexpr const char* DEFAULT_PARTITION_NAME = "__DEFAULT_PARTITION__";
    static constexpr const char* SNAPSHOT_PREFIX = "snapshot-";
    static constexpr const char* MANIFEST_PREFIX = "manifest-";
    static constexpr const char* MANIFEST_LIST_PREFIX = "manifest-list-";
    static constexpr const char* DATA_FILE_PREFIX = "data-";
    static constexpr const char* BUCKET_DIR_PREFIX = "bucket-";
    static constexpr const char* CONSUMER_PREFIX = "consumer-";
    static constexpr const char* EXPIRE_MARKER_PREFIX = "EXPIRING-";

    FileStorePathFactory(std::string root, std::vector<std::string> partition_keys);

    const std::string& root() const { return root_; }
    const std::vector<std::string>& partitionKeys() const { return partition_keys_; }

    std::string snapshotDirectory() const;
    std::string snapshotPath(int64_t id) const;
    std::string latestHintPath() const;
    std::string earliestHintPath() const;
    // Announces the end of an expiration in progress; one per running expirer.
    std::string expireMarkerPath(const std::string& token) const;

    std::string manifestDirectory() const;
    std::string manifestPath(const std::string& file_name) const;

    std::string consumerDirectory() const;
    std::string consumerPath(const std::string& consumer_id) const;

    std::string schemaDirectory() const;

    // "k1=v1/k2=v2", empty for an unpartitioned table.
    std::string partitionPath(const Row& partition) const;
    std::string bucketPath(const Row& partition, int32_t bucket) const;
    std::string dataFilePath(const io::DataFileMeta& file) const;
    std::string dataFilePath(const Row& partition, int32_t bucket, const std::string& file_name) const;

    std::string newDataFileName() const;
    std::string newManifestFileName() const;
    std::string newManifestListName() const;

    PartitionSpec partitionToSpec(const Row& partition) const;
    bool partitionMatches(const Row& partition, const PartitionSpec& spec) const;

private:
    std::string root_;
    std::vector<std::string> partition_keys_;
    std::string uuid_;
    mutable std::atomic<int64_t> data_file_count_{0};
    mutable std::atomic<int64_t> manifest_file_count_{0};
    mutable std::atomic<int64_t> manifest_list_count_{0};
};

std::string escapePathValue(const std::string& value);

} // namespace fs
} // namespace lakestore
