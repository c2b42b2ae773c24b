// include/manifest/manifest_entry.h
#pragma once

#include "../io/data_file_meta.h"
#include "../storage_error/result.h"

#include <map>
#include <string>
#include <vector>

namespace lakestore {
namespace manifest {

enum class FileKind : uint8_t {
    ADD    = 0,
    DELETE = 1
};

/**
 * @brief One ADD or DELETE of one data file.
 */
struct ManifestEntry {
    FileKind kind = FileKind::ADD;
    int32_t total_buckets = 1;
    io::DataFileMetaPtr file;

    ManifestEntry() = default;
    ManifestEntry(FileKind k, int32_t buckets, io::DataFileMetaPtr f)
        : kind(k), total_buckets(buckets), file(std::move(f)) {}

    std::string identifier() const { return file->identifier(); }
    const Row& partition() const { return file->partition; }
    int32_t bucket() const { return file->bucket; }
    std::string toString() const;
};

/**
 * @brief Reference to one manifest file plus the summary used to prune it.
 */
struct ManifestFileMeta {
    std::string file_name;
    int64_t file_size = 0;
    int64_t num_added_files = 0;
    int64_t num_deleted_files = 0;
    Row partition_min;
    Row partition_max;
    int64_t schema_id = 0;

    bool operator==(const ManifestFileMeta& other) const;
};

/**
 * @brief Replay of ADD and DELETE entries, keyed by file identifier.
 *
 * Rules, applied in sequence order:
 *   ADD of a file already present (ADD or pending DELETE)  -> corruption
 *   DELETE of a file with a pending ADD                    -> both cancel
 *   DELETE of a file with a pending DELETE                 -> corruption
 *   DELETE of an unseen file                               -> kept as pending DELETE
 *
 * A pending DELETE is legal inside a partial replay (the ADD lives in an
 * earlier manifest). After a full replay from genesis any pending DELETE is
 * corruption; see requireNoDeletes().
 */
class FileEntry {
public:
    using MergedEntries = std::map<std::string, ManifestEntry>;

    static storage::Status mergeEntry(const ManifestEntry& entry, MergedEntries& merged);
    static storage::Status mergeEntries(const std::vector<ManifestEntry>& entries, MergedEntries& merged);
    static storage::Result<std::vector<ManifestEntry>> mergeEntries(const std::vector<ManifestEntry>& entries);

    static storage::Status requireNoDeletes(const MergedEntries& merged);

    static std::vector<ManifestEntry> toVector(const MergedEntries& merged);
};

std::string fileKindToString(FileKind kind);

} // namespace manifest
} // namespace lakestore
