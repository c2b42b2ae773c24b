// include/schema/table_schema.h
#pragma once

#include "../types.h"
#include "../config/core_options.h"
#include "../fs/file_io.h"
#include "../storage_error/result.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace schema {

struct DataField {
    int32_t id = 0;
    std::string name;
    DataType type = DataType::STRING;
    bool nullable = true;
};

/**
 * @class TableSchema
 * @brief Immutable table definition: fields, partition keys, primary keys and
 * options. Persisted as JSON under `schema/schema-<id>`.
 *
 * The bucket-local key of a primary-key table is the primary key with the
 * partition keys removed ("trimmed primary key").
 */
class TableSchema {
public:
    TableSchema() = default;
    TableSchema(int64_t id,
                std::vector<DataField> fields,
                std::vector<std::string> partition_keys,
                std::vector<std::string> primary_keys,
                std::map<std::string, std::string> options);

    int64_t id() const { return id_; }
    const std::vector<DataField>& fields() const { return fields_; }
    const std::vector<std::string>& partitionKeys() const { return partition_keys_; }
    const std::vector<std::string>& primaryKeys() const { return primary_keys_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const CoreOptions& coreOptions() const { return core_options_; }

    bool hasPrimaryKey() const { return !primary_keys_.empty(); }
    std::optional<size_t> fieldIndex(const std::string& name) const;

    const std::vector<size_t>& partitionIndices() const { return partition_indices_; }
    const std::vector<size_t>& trimmedPrimaryKeyIndices() const { return key_indices_; }
    const std::vector<size_t>& bucketKeyIndices() const { return bucket_key_indices_; }
    std::vector<DataType> partitionTypes() const;

    /**
     * @brief Fails fast on a malformed definition, before any I/O.
     * @throws storage::StorageError with SCHEMA_VIOLATION or INVALID_CONFIGURATION.
     */
    void validate() const;

    // Checks arity, per-field type and NOT NULL constraints of one row.
    storage::Status validateRow(const Row& row) const;

    std::string toJson() const;
    static storage::Result<TableSchema> fromJson(const std::string& text);

private:
    void resolveIndices();

    int64_t id_ = 0;
    std::vector<DataField> fields_;
    std::vector<std::string> partition_keys_;
    std::vector<std::string> primary_keys_;
    std::map<std::string, std::string> options_;
    CoreOptions core_options_;

    std::vector<size_t> partition_indices_;
    std::vector<size_t> key_indices_;
    std::vector<size_t> bucket_key_indices_;
};

/**
 * @class SchemaManager
 * @brief Reads and creates schema files under `<table>/schema/`.
 */
class SchemaManager {
public:
    SchemaManager(std::shared_ptr<fs::FileIO> file_io, std::string table_root);

    // Writes schema-<id> with create-if-absent. Returns false when it already exists.
    storage::Result<bool> commit(const TableSchema& schema);
    storage::Result<std::optional<TableSchema>> latest() const;
    storage::Result<TableSchema> schema(int64_t id) const;
    storage::Result<std::vector<int64_t>> listIds() const;

    std::string schemaPath(int64_t id) const;

private:
    std::shared_ptr<fs::FileIO> file_io_;
    std::string schema_dir_;
};

} // namespace schema
} // namespace lakestore
