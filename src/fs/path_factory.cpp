// src/fs/path_factory.cpp
#include "../../include/fs/path_factory.h"
#include "../../include/fs/file_io.h"
#include "../../include/uuid_utils.h"

#include <iomanip>
#include <sstream>

namespace lakestore {
namespace fs {

std::string escapePathValue(const std::string& value) {
    std::ostringstream oss;
    for (unsigned char c : value) {
        if (c == '/' || c == '=' || c == '%' || c == '\\' || c < 0x20 || c == 0x7F) {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                << std::nouppercase << std::dec;
        } else {
            oss << c;
        }
    }
    return oss.str();
}

FileStorePathFactory::FileStorePathFactory(std::string root, std::vector<std::string> partition_keys)
    : root_(std::move(root)),
      partition_keys_(std::move(partition_keys)),
      uuid_(generateUuid()) {}

std::string FileStorePathFactory::snapshotDirectory() const {
    return joinPath(root_, "snapshot");
}

std::string FileStorePathFactory::snapshotPath(int64_t id) const {
    return joinPath(snapshotDirectory(), SNAPSHOT_PREFIX + std::to_string(id));
}

std::string FileStorePathFactory::latestHintPath() const {
    return joinPath(snapshotDirectory(), "LATEST");
}

std::string FileStorePathFactory::earliestHintPath() const {
    return joinPath(snapshotDirectory(), "EARLIEST");
}

std::string FileStorePathFactory::expireMarkerPath(const std::string& token) const {
    return joinPath(snapshotDirectory(), EXPIRE_MARKER_PREFIX + token);
}

std::string FileStorePathFactory::manifestDirectory() const {
    return joinPath(root_, "manifest");
}

std::string FileStorePathFactory::manifestPath(const std::string& file_name) const {
    return joinPath(manifestDirectory(), file_name);
}

std::string FileStorePathFactory::consumerDirectory() const {
    return joinPath(root_, "consumer");
}

std::string FileStorePathFactory::consumerPath(const std::string& consumer_id) const {
    return joinPath(consumerDirectory(), CONSUMER_PREFIX + consumer_id);
}

std::string FileStorePathFactory::schemaDirectory() const {
    return joinPath(root_, "schema");
}

std::string FileStorePathFactory::partitionPath(const Row& partition) const {
    std::string path;
    for (size_t i = 0; i < partition_keys_.size(); ++i) {
        if (i > 0) path += "/";
        const Value& v = i < partition.size() ? partition[i] : Value{};
        path += partition_keys_[i] + "=" + (isNull(v) ? DEFAULT_PARTITION_NAME : escapePathValue(valueToString(v)));
    }
    return path;
}

std::string FileStorePathFactory::bucketPath(const Row& partition, int32_t bucket) const {
    std::string partition_path = partitionPath(partition);
    std::string base = partition_path.empty() ? root_ : joinPath(root_, partition_path);
    return joinPath(base, BUCKET_DIR_PREFIX + std::to_string(bucket));
}

std::string FileStorePathFactory::dataFilePath(const io::DataFileMeta& file) const {
    return dataFilePath(file.partition, file.bucket, file.file_name);
}

std::string FileStorePathFactory::dataFilePath(const Row& partition, int32_t bucket, const std::string& file_name) const {
    return joinPath(bucketPath(partition, bucket), file_name);
}

std::string FileStorePathFactory::newDataFileName() const {
    return DATA_FILE_PREFIX + uuid_ + "-" + std::to_string(data_file_count_.fetch_add(1));
}

std::string FileStorePathFactory::newManifestFileName() const {
    return MANIFEST_PREFIX + uuid_ + "-" + std::to_string(manifest_file_count_.fetch_add(1));
}

std::string FileStorePathFactory::newManifestListName() const {
    return MANIFEST_LIST_PREFIX + uuid_ + "-" + std::to_string(manifest_list_count_.fetch_add(1));
}

PartitionSpec FileStorePathFactory::partitionToSpec(const Row& partition) const {
    PartitionSpec spec;
    for (size_t i = 0; i < partition_keys_.size(); ++i) {
        const Value& v = i < partition.size() ? partition[i] : Value{};
        spec[partition_keys_[i]] = isNull(v) ? DEFAULT_PARTITION_NAME : valueToString(v);
    }
    return spec;
}

bool FileStorePathFactory::partitionMatches(const Row& partition, const PartitionSpec& spec) const {
    PartitionSpec actual = partitionToSpec(partition);
    for (const auto& [key, value] : spec) {
        auto it = actual.find(key);
        if (it == actual.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

} // namespace fs
} // namespace lakestore
