// src/schema/table_schema.cpp
#include "../../include/schema/table_schema.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>

using json = nlohmann::json;

namespace lakestore {

// Declared in the enum's namespace so nlohmann finds it through ADL.
NLOHMANN_JSON_SERIALIZE_ENUM(DataType, {
    {DataType::BOOLEAN, "BOOLEAN"},
    {DataType::BIGINT, "BIGINT"},
    {DataType::DOUBLE, "DOUBLE"},
    {DataType::STRING, "STRING"},
})

namespace schema {

void to_json(json& j, const DataField& f) {
    j = json{{"id", f.id}, {"name", f.name}, {"type", f.type}, {"nullable", f.nullable}};
}

void from_json(const json& j, DataField& f) {
    j.at("id").get_to(f.id);
    j.at("name").get_to(f.name);
    j.at("type").get_to(f.type);
    f.nullable = j.value("nullable", true);
}

namespace {
    const char* const SCHEMA_PREFIX = "schema-";

    storage::StorageError schemaViolation(const std::string& message) {
        return STORAGE_ERROR(storage::ErrorCode::SCHEMA_VIOLATION, message)
            .withSuggestedAction("Fix the table definition; nothing has been written");
    }
}

TableSchema::TableSchema(int64_t id,
                         std::vector<DataField> fields,
                         std::vector<std::string> partition_keys,
                         std::vector<std::string> primary_keys,
                         std::map<std::string, std::string> options)
    : id_(id),
      fields_(std::move(fields)),
      partition_keys_(std::move(partition_keys)),
      primary_keys_(std::move(primary_keys)),
      options_(std::move(options)),
      core_options_(CoreOptions::fromMap(options_)) {
    // Primary key fields are implicitly NOT NULL.
    for (auto& f : fields_) {
        if (std::find(primary_keys_.begin(), primary_keys_.end(), f.name) != primary_keys_.end()) {
            f.nullable = false;
        }
    }
    validate();
    resolveIndices();
}

std::optional<size_t> TableSchema::fieldIndex(const std::string& name) const {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return std::nullopt;
}

std::vector<DataType> TableSchema::partitionTypes() const {
    std::vector<DataType> types;
    for (size_t idx : partition_indices_) types.push_back(fields_[idx].type);
    return types;
}

void TableSchema::validate() const {
    if (fields_.empty()) {
        throw schemaViolation("Table must have at least one field");
    }
    std::set<std::string> names;
    for (const auto& f : fields_) {
        if (f.name.empty()) throw schemaViolation("Field name must not be empty");
        if (!isValidUtf8(f.name)) throw schemaViolation("Field name must be valid UTF-8");
        if (!names.insert(f.name).second) throw schemaViolation("Duplicate field name '" + f.name + "'");
    }
    auto requireField = [&](const std::string& name, const std::string& role) {
        if (!names.count(name)) {
            throw schemaViolation(role + " '" + name + "' is not a field of the table");
        }
    };
    for (const auto& p : partition_keys_) requireField(p, "Partition key");
    for (const auto& k : primary_keys_) requireField(k, "Primary key");
    for (const auto& b : core_options_.bucket_key) requireField(b, "Bucket key");

    if (hasPrimaryKey()) {
        for (const auto& p : partition_keys_) {
            if (std::find(primary_keys_.begin(), primary_keys_.end(), p) == primary_keys_.end()) {
                throw schemaViolation("Primary key must contain partition key '" + p + "'");
            }
        }
        if (primary_keys_.size() == partition_keys_.size()) {
            throw schemaViolation("Primary key must have at least one field besides the partition keys");
        }
        for (const auto& b : core_options_.bucket_key) {
            if (std::find(primary_keys_.begin(), primary_keys_.end(), b) == primary_keys_.end()) {
                throw schemaViolation("Bucket key '" + b + "' must be part of the primary key");
            }
        }
    } else if (core_options_.merge_engine != MergeEngine::DEDUPLICATE) {
        throw storage::StorageError::invalidConfiguration(
            "merge-engine '" + mergeEngineToString(core_options_.merge_engine) + "' requires a primary key");
    }

    for (const auto& [field, fn] : core_options_.field_aggregate_functions) {
        (void)fn;
        requireField(field, "Aggregated field");
    }
    for (const auto& [key, value] : options_) {
        if (!isValidUtf8(key) || !isValidUtf8(value)) {
            throw storage::StorageError::invalidConfiguration("Table option '" + key + "' must be valid UTF-8");
        }
    }
}

void TableSchema::resolveIndices() {
    partition_indices_.clear();
    key_indices_.clear();
    bucket_key_indices_.clear();
    for (const auto& p : partition_keys_) partition_indices_.push_back(*fieldIndex(p));
    for (const auto& k : primary_keys_) {
        if (std::find(partition_keys_.begin(), partition_keys_.end(), k) == partition_keys_.end()) {
            key_indices_.push_back(*fieldIndex(k));
        }
    }
    if (!core_options_.bucket_key.empty()) {
        for (const auto& b : core_options_.bucket_key) bucket_key_indices_.push_back(*fieldIndex(b));
    } else if (hasPrimaryKey()) {
        bucket_key_indices_ = key_indices_;
    } else {
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (std::find(partition_indices_.begin(), partition_indices_.end(), i) == partition_indices_.end()) {
                bucket_key_indices_.push_back(i);
            }
        }
    }
}

storage::Status TableSchema::validateRow(const Row& row) const {
    if (row.size() != fields_.size()) {
        return STORAGE_ERROR(storage::ErrorCode::SCHEMA_VIOLATION, "Row arity mismatch")
            .withDetails("expected " + std::to_string(fields_.size()) + " fields, got " + std::to_string(row.size()));
    }
    for (size_t i = 0; i < row.size(); ++i) {
        const auto& f = fields_[i];
        if (isNull(row[i]) && !f.nullable) {
            return STORAGE_ERROR(storage::ErrorCode::SCHEMA_VIOLATION, "NULL in NOT NULL field")
                .withContext("field", f.name);
        }
        if (!valueMatchesType(row[i], f.type)) {
            return STORAGE_ERROR(storage::ErrorCode::SCHEMA_VIOLATION, "Value type mismatch")
                .withContext("field", f.name)
                .withContext("expected", dataTypeToString(f.type))
                .withContext("value", valueToString(row[i]));
        }
    }
    return storage::Status();
}

std::string TableSchema::toJson() const {
    json j{
        {"version", 1},
        {"id", id_},
        {"fields", fields_},
        {"partitionKeys", partition_keys_},
        {"primaryKeys", primary_keys_},
        {"options", options_},
    };
    return j.dump(2);
}

storage::Result<TableSchema> TableSchema::fromJson(const std::string& text) {
    try {
        json j = json::parse(text);
        return TableSchema(j.at("id").get<int64_t>(),
                           j.at("fields").get<std::vector<DataField>>(),
                           j.at("partitionKeys").get<std::vector<std::string>>(),
                           j.at("primaryKeys").get<std::vector<std::string>>(),
                           j.at("options").get<std::map<std::string, std::string>>());
    } catch (const json::exception& e) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Malformed schema file")
            .withDetails(e.what());
    } catch (const storage::StorageError& e) {
        return e;
    }
}

// --- SchemaManager ---

SchemaManager::SchemaManager(std::shared_ptr<fs::FileIO> file_io, std::string table_root)
    : file_io_(std::move(file_io)),
      schema_dir_(fs::joinPath(table_root, "schema")) {}

std::string SchemaManager::schemaPath(int64_t id) const {
    return fs::joinPath(schema_dir_, SCHEMA_PREFIX + std::to_string(id));
}

storage::Result<bool> SchemaManager::commit(const TableSchema& schema) {
    return file_io_->tryAtomicCreate(schemaPath(schema.id()), schema.toJson());
}

storage::Result<std::vector<int64_t>> SchemaManager::listIds() const {
    auto files = file_io_->listFiles(schema_dir_);
    if (!files.isOk()) return files.error();
    std::vector<int64_t> ids;
    for (const auto& f : files.value()) {
        std::string name = fs::fileNameOf(f.path);
        if (name.rfind(SCHEMA_PREFIX, 0) != 0) continue;
        try {
            ids.push_back(std::stoll(name.substr(std::string(SCHEMA_PREFIX).size())));
        } catch (const std::exception&) {
            LOG_WARN("[SchemaManager] Ignoring unexpected file ", f.path);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

storage::Result<TableSchema> SchemaManager::schema(int64_t id) const {
    auto content = file_io_->readFile(schemaPath(id));
    if (!content.isOk()) return content.error();
    return TableSchema::fromJson(content.value());
}

storage::Result<std::optional<TableSchema>> SchemaManager::latest() const {
    auto ids = listIds();
    if (!ids.isOk()) return ids.error();
    if (ids.value().empty()) return std::optional<TableSchema>();
    auto s = schema(ids.value().back());
    if (!s.isOk()) return s.error();
    return std::optional<TableSchema>(std::move(s).value());
}

} // namespace schema
} // namespace lakestore
