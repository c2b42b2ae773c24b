// include/manifest/manifest_file.h
#pragma once

#include "manifest_entry.h"
#include "metadata_codec.h"
#include "../fs/file_io.h"
#include "../fs/path_factory.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace manifest {

/**
 * @brief Framing shared by manifest and manifest-list objects:
 *   "LSMF" | u8 version | u8 compression | u32 uncompressed size | u32 crc32 | body
 * The CRC covers the uncompressed payload.
 */
std::string encodeMetadataObject(const std::string& payload, CompressionType compression);
storage::Result<std::string> decodeMetadataObject(const std::string& bytes, const std::string& path);

/**
 * @brief Everything manifest readers and writers of one table share.
 */
struct ManifestContext {
    std::shared_ptr<fs::FileIO> file_io;
    std::shared_ptr<const fs::FileStorePathFactory> path_factory;
    std::shared_ptr<const MetadataCodec> codec;
    CompressionType compression = CompressionType::ZSTD;
    int64_t target_file_size = 8LL * 1024 * 1024;
    fs::IoRetryPolicy io_retry;
    int64_t schema_id = 0;
};

/**
 * @class ManifestEntrySequence
 * @brief Lazy view of one manifest file. Nothing is read until iterated, and
 * every iteration reads the object again, so the sequence can be restarted.
 */
class ManifestEntrySequence {
public:
    ManifestEntrySequence(ManifestContext context, std::string file_name);

    storage::Result<std::vector<ManifestEntry>> toVector() const;
    // Stops at, and returns, the first error from reading or from `fn`.
    storage::Status forEach(const std::function<storage::Status(const ManifestEntry&)>& fn) const;

    const std::string& fileName() const { return file_name_; }

private:
    ManifestContext context_;
    std::string file_name_;
};

/**
 * @class ManifestFile
 * @brief Writes and reads manifest files (`manifest-<uuid>-<n>`).
 */
class ManifestFile {
public:
    explicit ManifestFile(ManifestContext context);

    /**
     * @brief Writes `entries` in order, rolling to a new file whenever the
     * estimated size reaches the target. An empty input writes nothing.
     * On failure the files already written by this call are deleted.
     */
    storage::Result<std::vector<ManifestFileMeta>> write(const std::vector<ManifestEntry>& entries) const;

    ManifestEntrySequence read(const std::string& file_name) const;

    void deleteQuietly(const std::string& file_name) const;

    const ManifestContext& context() const { return context_; }
    int64_t targetFileSize() const { return context_.target_file_size; }

private:
    storage::Result<ManifestFileMeta> writeOne(const std::vector<ManifestEntry>& entries) const;

    ManifestContext context_;
};

/**
 * @class ManifestList
 * @brief Writes and reads manifest lists (`manifest-list-<uuid>-<n>`).
 */
class ManifestList {
public:
    explicit ManifestList(ManifestContext context);

    // Returns the new list's file name.
    storage::Result<std::string> write(const std::vector<ManifestFileMeta>& metas) const;
    storage::Result<std::vector<ManifestFileMeta>> read(const std::string& file_name) const;

    void deleteQuietly(const std::string& file_name) const;

private:
    ManifestContext context_;
};

/**
 * @class ManifestFileMerger
 * @brief Keeps the number of manifests referenced by a base list bounded.
 *
 * Minor merge: consecutive manifests are packed into new ones of about
 * `target_file_size`; a trailing group is merged only when it has at least
 * `merge_min_count` members. Full compaction: when the manifests that are
 * small or carry DELETE entries add up to `full_compaction_threshold`, the
 * whole list is replayed and rewritten as ADD-only manifests.
 *
 * The live file set is never changed by a merge.
 */
class ManifestFileMerger {
public:
    struct Options {
        int64_t target_file_size = 8LL * 1024 * 1024;
        int32_t merge_min_count = 30;
        int64_t full_compaction_threshold = 16LL * 1024 * 1024;
    };

    /**
     * @param newly_created Receives the manifests written by this call, so the
     * caller can delete them if its commit fails.
     */
    static storage::Result<std::vector<ManifestFileMeta>> merge(const std::vector<ManifestFileMeta>& input,
                                                                const ManifestFile& manifest_file,
                                                                const Options& options,
                                                                std::vector<ManifestFileMeta>* newly_created);

private:
    // nullopt when the threshold is not reached.
    static storage::Result<std::optional<std::vector<ManifestFileMeta>>> tryFullCompaction(
        const std::vector<ManifestFileMeta>& input, const ManifestFile& manifest_file,
        const Options& options, std::vector<ManifestFileMeta>* newly_created);

    static storage::Status mergeCandidates(const std::vector<ManifestFileMeta>& candidates,
                                           const ManifestFile& manifest_file,
                                           std::vector<ManifestFileMeta>& result,
                                           std::vector<ManifestFileMeta>* newly_created);
};

} // namespace manifest
} // namespace lakestore
