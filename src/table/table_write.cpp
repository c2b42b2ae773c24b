// src/table/table_write.cpp
#include "../../include/table/table_write.h"
#include "../../include/serialization_utils.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <algorithm>

namespace lakestore {
namespace table {

TableWrite::TableWrite(std::shared_ptr<const FileStoreTable> table)
    : table_(std::move(table)) {}

TableWrite::~TableWrite() = default;

Row TableWrite::partitionOf(const Row& row) const {
    return projectRow(row, table_->schema().partitionIndices());
}

int32_t TableWrite::bucketOf(const Row& row) const {
    const int32_t num_buckets = table_->options().bucket;
    if (num_buckets <= 1) return 0;
    std::string encoded = EncodeRowBinary(projectRow(row, table_->schema().bucketKeyIndices()));
    return static_cast<int32_t>(computeChecksum(encoded.data(), encoded.size()) % static_cast<uint32_t>(num_buckets));
}

storage::Status TableWrite::write(const Row& row, RowKind kind) {
    return writeRow(row, kind, std::nullopt, std::nullopt);
}

storage::Status TableWrite::write(const WriteRequest& request) {
    if (!request.kinds.empty() && request.kinds.size() != request.rows.size()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Write request needs one row kind per row")
            .withContext("rows", std::to_string(request.rows.size()))
            .withContext("kinds", std::to_string(request.kinds.size()));
    }
    for (size_t i = 0; i < request.rows.size(); ++i) {
        RowKind kind = request.kinds.empty() ? RowKind::INSERT : request.kinds[i];
        auto status = writeRow(request.rows[i], kind, request.partition, request.bucket);
        if (!status.isOk()) {
            return std::move(status.error().withContext("row_index", std::to_string(i)));
        }
    }
    return storage::Status();
}

storage::Status TableWrite::writeRow(const Row& row, RowKind kind, const std::optional<Row>& partition,
                                     const std::optional<int32_t>& bucket) {
    RETURN_IF_ERROR(table_->schema().validateRow(row));

    Row row_partition = partitionOf(row);
    if (partition && compareRows(row_partition, *partition) != 0) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Row does not belong to the requested partition")
            .withContext("requested", rowToString(*partition))
            .withContext("actual", rowToString(row_partition));
    }

    int32_t row_bucket = bucketOf(row);
    if (bucket) {
        if (*bucket < 0 || *bucket >= table_->options().bucket) {
            return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Bucket out of range")
                .withContext("bucket", std::to_string(*bucket))
                .withContext("num_buckets", std::to_string(table_->options().bucket));
        }
        // A key living in two buckets would never be merged.
        if (table_->hasPrimaryKey() && *bucket != row_bucket) {
            return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Row key does not hash to the requested bucket")
                .withContext("requested", std::to_string(*bucket))
                .withContext("actual", std::to_string(row_bucket));
        }
        row_bucket = *bucket;
    }

    lsm::BucketWriter* writer = nullptr;
    ASSIGN_OR_RETURN(writer, writerFor(row_partition, row_bucket));
    if (table_->hasPrimaryKey()) {
        return writer->write(kind, projectRow(row, table_->schema().trimmedPrimaryKeyIndices()), row);
    }
    return writer->write(kind, Row{}, row);
}

storage::Result<lsm::BucketWriter*> TableWrite::writerFor(const Row& partition, int32_t bucket) {
    operation::BucketKey key(partition, bucket);
    auto it = writers_.find(key);
    if (it != writers_.end()) return it->second.get();

    operation::ScanOptions options;
    options.partition = partition;
    options.bucket = bucket;
    operation::ScanPlan plan;
    ASSIGN_OR_RETURN(plan, table_->newScan()->plan(options));
    int64_t max_sequence_number = 0;
    for (const auto& file : plan.files()) {
        max_sequence_number = std::max(max_sequence_number, file->max_sequence_number);
    }

    std::unique_ptr<lsm::BucketWriter> writer;
    if (table_->hasPrimaryKey()) {
        writer = std::make_unique<lsm::MergeTreeWriter>(table_->keyValueFileContext(), partition, bucket,
                                                        max_sequence_number, table_->options().write_buffer_size);
    } else {
        writer = std::make_unique<lsm::AppendOnlyWriter>(table_->keyValueFileContext(), partition, bucket,
                                                         max_sequence_number, table_->options().write_buffer_size);
    }
    LOG_TRACE("[TableWrite] Opened writer for bucket ", bucket, " of partition ", rowToString(partition),
              " at sequence ", max_sequence_number);
    lsm::BucketWriter* raw = writer.get();
    writers_.emplace(std::move(key), std::move(writer));
    return raw;
}

storage::Result<std::vector<operation::CommitMessage>> TableWrite::prepareCommit() {
    std::vector<operation::CommitMessage> messages;
    for (auto& [key, writer] : writers_) {
        auto files = writer->prepareCommit();
        if (!files.isOk()) {
            // Files of buckets already prepared were handed over; nothing else will delete them.
            for (const auto& m : messages) {
                LOG_WARN("[TableWrite] Abandoning ", m.toString(), " after a failed prepare");
                for (const auto& file : m.new_files) {
                    table_->fileIO()->deleteQuietly(table_->pathFactory()->dataFilePath(*file));
                }
            }
            auto error = std::move(files.error().withContext("bucket", std::to_string(key.second)));
            abort();
            return error;
        }
        if (files.value().empty()) continue;

        operation::CommitMessage message;
        message.partition = key.first;
        message.bucket = key.second;
        message.total_buckets = table_->options().bucket;
        message.new_files = std::move(files).value();
        messages.push_back(std::move(message));
    }
    return messages;
}

void TableWrite::abort() {
    for (auto& entry : writers_) {
        entry.second->abort();
    }
    writers_.clear();
}

} // namespace table
} // namespace lakestore
