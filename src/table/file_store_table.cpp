// src/table/file_store_table.cpp
#include "../../include/table/file_store_table.h"
#include "../../include/table/table_commit.h"
#include "../../include/table/table_read.h"
#include "../../include/table/table_write.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace lakestore {
namespace table {

storage::Result<std::shared_ptr<FileStoreTable>> FileStoreTable::create(std::shared_ptr<fs::FileIO> file_io,
                                                                        const std::string& path,
                                                                        const schema::TableSchema& schema) {
    schema.validate();
    // Components are built, and option errors thrown, before the first write.
    auto table = std::make_shared<FileStoreTable>(file_io, path, schema);

    schema::SchemaManager schemas(file_io, path);
    std::optional<schema::TableSchema> existing;
    ASSIGN_OR_RETURN(existing, schemas.latest());
    if (existing) {
        return STORAGE_ERROR(storage::ErrorCode::FILE_ALREADY_EXISTS, "Table already exists")
            .withFilePath(path);
    }
    bool created = false;
    ASSIGN_OR_RETURN(created, schemas.commit(schema));
    if (!created) {
        return STORAGE_ERROR(storage::ErrorCode::FILE_ALREADY_EXISTS, "Table was created concurrently")
            .withFilePath(schemas.schemaPath(schema.id()));
    }
    LOG_INFO("[FileStoreTable] Created table at ", path, " (",
             schema.hasPrimaryKey() ? "primary key" : "append only", ", ",
             magic_enum::enum_name(schema.coreOptions().merge_engine), ", ",
             schema.coreOptions().bucket, " bucket(s))");
    return table;
}

storage::Result<std::shared_ptr<FileStoreTable>> FileStoreTable::open(std::shared_ptr<fs::FileIO> file_io,
                                                                      const std::string& path) {
    schema::SchemaManager schemas(file_io, path);
    std::optional<schema::TableSchema> latest;
    ASSIGN_OR_RETURN(latest, schemas.latest());
    if (!latest) {
        return STORAGE_ERROR(storage::ErrorCode::FILE_NOT_FOUND, "No table schema found")
            .withFilePath(path);
    }
    latest->validate();
    LOG_TRACE("[FileStoreTable] Opened ", path, " at schema ", latest->id());
    return std::make_shared<FileStoreTable>(std::move(file_io), path, std::move(*latest));
}

FileStoreTable::FileStoreTable(std::shared_ptr<fs::FileIO> file_io, std::string path, schema::TableSchema schema)
    : file_io_(std::move(file_io)),
      path_(std::move(path)),
      schema_(std::move(schema)) {
    const CoreOptions& opts = schema_.coreOptions();

    path_factory_ = std::make_shared<fs::FileStorePathFactory>(path_, schema_.partitionKeys());
    codec_ = std::make_shared<manifest::JsonMetadataCodec>();
    format_ = std::make_shared<io::RowFileFormat>(opts.file_compression, opts.file_block_size);

    manifest::ManifestContext manifest_context;
    manifest_context.file_io = file_io_;
    manifest_context.path_factory = path_factory_;
    manifest_context.codec = codec_;
    manifest_context.compression = opts.manifest_compression;
    manifest_context.target_file_size = opts.manifest_target_file_size;
    manifest_context.io_retry = opts.io_retry;
    manifest_context.schema_id = schema_.id();
    manifest_file_ = std::make_shared<manifest::ManifestFile>(manifest_context);
    manifest_list_ = std::make_shared<manifest::ManifestList>(manifest_context);

    snapshot_manager_ = std::make_shared<snapshot::SnapshotManager>(file_io_, path_factory_, codec_, opts.io_retry);
    scan_ = std::make_shared<operation::FileStoreScan>(file_io_, snapshot_manager_, manifest_file_, manifest_list_);
    consumer_manager_ = std::make_shared<snapshot::ConsumerManager>(file_io_, path_factory_, opts.io_retry);

    if (schema_.hasPrimaryKey()) {
        merge_functions_ = std::make_shared<lsm::MergeFunctionFactory>(schema_);
        universal_strategy_ = std::make_shared<lsm::UniversalCompactionStrategy>(
            lsm::UniversalCompactionConfig::fromOptions(opts));
    } else {
        append_strategy_ = std::make_shared<lsm::AppendCompactionStrategy>(
            lsm::AppendCompactionConfig::fromOptions(opts));
    }
}

io::KeyValueFileContext FileStoreTable::keyValueFileContext() const {
    io::KeyValueFileContext context;
    context.file_io = file_io_;
    context.path_factory = path_factory_;
    context.format = format_;
    context.io_retry = options().io_retry;
    context.schema_id = schema_.id();
    context.key_arity = hasPrimaryKey() ? schema_.trimmedPrimaryKeyIndices().size() : 0;
    context.value_arity = schema_.fields().size();
    context.target_file_size = options().target_file_size;
    return context;
}

std::unique_ptr<TableWrite> FileStoreTable::newWrite() const {
    return std::make_unique<TableWrite>(shared_from_this());
}

std::unique_ptr<TableRead> FileStoreTable::newRead() const {
    return std::make_unique<TableRead>(shared_from_this());
}

std::unique_ptr<TableCommit> FileStoreTable::newCommit(const std::string& commit_user) const {
    return std::make_unique<TableCommit>(shared_from_this(), commit_user);
}

std::unique_ptr<operation::FileStoreCommit> FileStoreTable::newFileStoreCommit(const std::string& commit_user) const {
    return std::make_unique<operation::FileStoreCommit>(
        commit_user,
        schema_.id(),
        operation::FileStoreCommitConfig::fromOptions(options(), hasPrimaryKey()),
        snapshot_manager_,
        manifest_file_,
        manifest_list_,
        scan_);
}

std::unique_ptr<lsm::CompactManager> FileStoreTable::newCompactManager(const Row& partition, int32_t bucket) const {
    if (hasPrimaryKey()) {
        auto rewriter = std::make_unique<lsm::MergeTreeCompactRewriter>(
            keyValueFileContext(), merge_functions_, partition, bucket, options().num_levels);
        return std::make_unique<lsm::MergeTreeCompactManager>(
            universal_strategy_, std::move(rewriter), merge_functions_->requiresFullCompaction());
    }
    auto rewriter = std::make_unique<lsm::AppendCompactRewriter>(keyValueFileContext(), partition, bucket);
    return std::make_unique<lsm::AppendOnlyCompactManager>(append_strategy_, std::move(rewriter));
}

std::unique_ptr<operation::CompactionCoordinator> FileStoreTable::newCompactionCoordinator(size_t num_threads) const {
    auto self = shared_from_this();
    operation::CompactionEnvironment environment;
    environment.snapshot_manager = snapshot_manager_;
    environment.scan = scan_;
    environment.file_io = file_io_;
    environment.compact_manager_factory = [self](const Row& partition, int32_t bucket) {
        return self->newCompactManager(partition, bucket);
    };
    environment.commit_factory = [self](const std::string& commit_user) {
        return self->newFileStoreCommit(commit_user);
    };
    return std::make_unique<operation::CompactionCoordinator>(
        std::move(environment), operation::CompactionCoordinatorConfig::fromOptions(options(), num_threads));
}

std::unique_ptr<snapshot::SnapshotExpirer> FileStoreTable::newExpirer() const {
    return std::make_unique<snapshot::SnapshotExpirer>(
        file_io_, snapshot_manager_, consumer_manager_, manifest_file_, manifest_list_);
}

std::unique_ptr<snapshot::OrphanFilesCleaner> FileStoreTable::newOrphanFilesCleaner() const {
    return std::make_unique<snapshot::OrphanFilesCleaner>(file_io_, snapshot_manager_, manifest_file_, manifest_list_);
}

storage::Result<snapshot::SnapshotLease> FileStoreTable::pinSnapshot(std::optional<int64_t> snapshot_id) const {
    // Only the latest can be chased; an explicit id that expired stays gone.
    const int attempts = snapshot_id ? 1 : 3;
    for (int attempt = 1;; ++attempt) {
        int64_t id = 0;
        if (snapshot_id) {
            id = *snapshot_id;
        } else {
            std::optional<int64_t> latest;
            ASSIGN_OR_RETURN(latest, snapshot_manager_->latestSnapshotId());
            if (!latest) {
                return STORAGE_ERROR(storage::ErrorCode::SNAPSHOT_ERROR, "Table has no snapshot to pin")
                    .withFilePath(path_);
            }
            id = *latest;
        }

        // Pin first, then verify: an expirer that planned before the pin
        // was written has published its marker by now.
        auto lease = consumer_manager_->acquire(id);
        if (!lease.isOk()) return lease.error();
        auto live = isRetained(id);
        if (!live.isOk()) return live.error();
        if (live.value()) return lease;

        RETURN_IF_ERROR(lease.value().release());
        if (attempt >= attempts) {
            return STORAGE_ERROR(storage::ErrorCode::SNAPSHOT_ERROR, "Snapshot does not exist or is being expired")
                .withContext("snapshot", std::to_string(id));
        }
        LOG_TRACE("[FileStoreTable] Snapshot ", id, " expired while pinning; retrying with the latest");
    }
}

storage::Result<bool> FileStoreTable::isRetained(int64_t snapshot_id) const {
    std::optional<int64_t> expiring;
    ASSIGN_OR_RETURN(expiring, snapshot_manager_->expiringBefore());
    if (expiring && snapshot_id < *expiring) return false;
    return snapshot_manager_->exists(snapshot_id);
}

} // namespace table
} // namespace lakestore
