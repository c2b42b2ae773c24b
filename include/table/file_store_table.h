// include/table/file_store_table.h
#pragma once

#include "../schema/table_schema.h"
#include "../io/key_value_file.h"
#include "../lsm/compact_manager.h"
#include "../lsm/merge_function.h"
#include "../lsm/universal_compaction_strategy.h"
#include "../lsm/append_compaction_strategy.h"
#include "../manifest/manifest_file.h"
#include "../operation/compaction_coordinator.h"
#include "../operation/file_store_commit.h"
#include "../operation/file_store_scan.h"
#include "../snapshot/consumer_manager.h"
#include "../snapshot/snapshot_expirer.h"
#include "../snapshot/snapshot_manager.h"

#include <memory>
#include <optional>
#include <string>

namespace lakestore {
namespace table {

class TableWrite;
class TableRead;
class TableCommit;

/**
 * @class FileStoreTable
 * @brief One table directory: its schema, options and the components that
 * operate on it, all built once at open time.
 *
 * Every component shares the same FileIO, path factory and codecs. The table
 * itself holds no mutable state; it can be shared between threads, and each
 * thread creates its own writers and commits from it.
 */
class FileStoreTable : public std::enable_shared_from_this<FileStoreTable> {
public:
    /**
     * @brief Creates a new table with `schema` as schema 0.
     * @throws storage::StorageError (SCHEMA_VIOLATION, INVALID_CONFIGURATION)
     * for a malformed schema, before anything is written.
     * @return FILE_ALREADY_EXISTS if the directory already holds a table.
     */
    static storage::Result<std::shared_ptr<FileStoreTable>> create(std::shared_ptr<fs::FileIO> file_io,
                                                                   const std::string& path,
                                                                   const schema::TableSchema& schema);

    /**
     * @brief Opens an existing table with its latest schema.
     * @throws storage::StorageError (INVALID_CONFIGURATION) for persisted options that no longer validate.
     */
    static storage::Result<std::shared_ptr<FileStoreTable>> open(std::shared_ptr<fs::FileIO> file_io,
                                                                 const std::string& path);

    FileStoreTable(std::shared_ptr<fs::FileIO> file_io, std::string path, schema::TableSchema schema);

    const std::string& path() const { return path_; }
    const schema::TableSchema& schema() const { return schema_; }
    const CoreOptions& options() const { return schema_.coreOptions(); }
    bool hasPrimaryKey() const { return schema_.hasPrimaryKey(); }

    std::shared_ptr<fs::FileIO> fileIO() const { return file_io_; }
    std::shared_ptr<const fs::FileStorePathFactory> pathFactory() const { return path_factory_; }
    std::shared_ptr<snapshot::SnapshotManager> snapshotManager() const { return snapshot_manager_; }
    std::shared_ptr<const operation::FileStoreScan> newScan() const { return scan_; }
    std::shared_ptr<snapshot::ConsumerManager> consumerManager() const { return consumer_manager_; }
    std::shared_ptr<const lsm::MergeFunctionFactory> mergeFunctions() const { return merge_functions_; }

    // Shared by every data file of the table.
    io::KeyValueFileContext keyValueFileContext() const;

    std::unique_ptr<TableWrite> newWrite() const;
    std::unique_ptr<TableRead> newRead() const;
    std::unique_ptr<TableCommit> newCommit(const std::string& commit_user) const;
    std::unique_ptr<operation::FileStoreCommit> newFileStoreCommit(const std::string& commit_user) const;

    // Strategy and rewriter for one bucket, chosen by whether the table has a primary key.
    std::unique_ptr<lsm::CompactManager> newCompactManager(const Row& partition, int32_t bucket) const;
    std::unique_ptr<operation::CompactionCoordinator> newCompactionCoordinator(size_t num_threads = 2) const;

    std::unique_ptr<snapshot::SnapshotExpirer> newExpirer() const;
    std::unique_ptr<snapshot::OrphanFilesCleaner> newOrphanFilesCleaner() const;

    /**
     * @brief Pins the latest snapshot (or `snapshot_id`) against expiration for
     * the lease's lifetime. The pin is written before the snapshot is checked,
     * so a returned lease always guards a snapshot no expirer will delete.
     */
    storage::Result<snapshot::SnapshotLease> pinSnapshot(std::optional<int64_t> snapshot_id = std::nullopt) const;

private:
    // Not yet deleted and not inside a range an expirer has announced.
    storage::Result<bool> isRetained(int64_t snapshot_id) const;

    std::shared_ptr<fs::FileIO> file_io_;
    std::string path_;
    schema::TableSchema schema_;

    std::shared_ptr<const fs::FileStorePathFactory> path_factory_;
    std::shared_ptr<const manifest::MetadataCodec> codec_;
    std::shared_ptr<const io::FileFormat> format_;
    std::shared_ptr<const manifest::ManifestFile> manifest_file_;
    std::shared_ptr<const manifest::ManifestList> manifest_list_;
    std::shared_ptr<snapshot::SnapshotManager> snapshot_manager_;
    std::shared_ptr<const operation::FileStoreScan> scan_;
    std::shared_ptr<snapshot::ConsumerManager> consumer_manager_;

    std::shared_ptr<const lsm::MergeFunctionFactory> merge_functions_;
    std::shared_ptr<const lsm::UniversalCompactionStrategy> universal_strategy_;
    std::shared_ptr<const lsm::AppendCompactionStrategy> append_strategy_;
};

} // namespace table
} // namespace lakestore
