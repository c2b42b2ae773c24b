// src/io/key_value_file.cpp
#include "../../include/io/key_value_file.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <algorithm>
#include <cstdint>

namespace lakestore {
namespace io {

Row toRecord(const KeyValue& kv) {
    Row record;
    record.reserve(kv.key.size() + 2 + kv.value.size());
    record.insert(record.end(), kv.key.begin(), kv.key.end());
    record.emplace_back(kv.sequence_number);
    record.emplace_back(static_cast<int64_t>(kv.kind));
    record.insert(record.end(), kv.value.begin(), kv.value.end());
    return record;
}

// --- RollingKeyValueWriter ---

RollingKeyValueWriter::RollingKeyValueWriter(KeyValueFileContext context,
                                             Row partition,
                                             int32_t bucket,
                                             int32_t level,
                                             FileSource source,
                                             bool key_grouped)
    : context_(std::move(context)),
      partition_(std::move(partition)),
      bucket_(bucket),
      level_(level),
      source_(source),
      key_grouped_(key_grouped) {}

RollingKeyValueWriter::~RollingKeyValueWriter() {
    if (!finished_ && (current_ || !results_.empty())) {
        LOG_WARN("[RollingKeyValueWriter] Destroyed without close(); discarding ", results_.size() + (current_ ? 1 : 0),
                 " file(s) in bucket ", bucket_);
        abort();
    }
}

storage::Status RollingKeyValueWriter::openFile() {
    current_name_ = context_.path_factory->newDataFileName();
    current_path_ = context_.path_factory->dataFilePath(partition_, bucket_, current_name_);
    current_ = context_.format->createWriter(context_.file_io, current_path_, context_.io_retry);
    min_key_.reset();
    max_key_.clear();
    min_seq_ = INT64_MAX;
    max_seq_ = INT64_MIN;
    rows_ = 0;
    deletes_ = 0;
    stats_ = std::make_unique<SimpleStatsCollector>(context_.value_arity);
    return storage::Status();
}

storage::Status RollingKeyValueWriter::closeFile() {
    if (!current_) return storage::Status();
    std::unique_ptr<RecordWriter> writer = std::move(current_);
    if (rows_ == 0) {
        writer->abort();
        return storage::Status();
    }
    auto size = writer->close();
    if (!size.isOk()) {
        writer->abort();
        return size.error();
    }

    auto meta = std::make_shared<DataFileMeta>();
    meta->file_name = current_name_;
    meta->partition = partition_;
    meta->bucket = bucket_;
    meta->level = level_;
    meta->min_key = min_key_ ? *min_key_ : Row{};
    meta->max_key = max_key_;
    meta->min_sequence_number = min_seq_;
    meta->max_sequence_number = max_seq_;
    meta->row_count = rows_;
    meta->delete_row_count = deletes_;
    meta->file_size = size.value();
    meta->schema_id = context_.schema_id;
    meta->creation_time_millis = currentTimeMillis();
    meta->file_source = source_;
    meta->value_stats = stats_->result();

    LOG_TRACE("[RollingKeyValueWriter] Closed ", meta->toString());
    results_.push_back(std::move(meta));
    return storage::Status();
}

storage::Status RollingKeyValueWriter::write(const KeyValue& kv) {
    if (finished_) {
        return STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, "write() on a closed data file writer");
    }
    if (kv.key.size() != context_.key_arity || kv.value.size() != context_.value_arity) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_DATA_FORMAT, "Record arity does not match the table")
            .withContext("key_arity", std::to_string(kv.key.size()))
            .withContext("value_arity", std::to_string(kv.value.size()));
    }

    if (current_ && current_->estimatedSize() >= context_.target_file_size) {
        bool boundary = !key_grouped_ || compareRows(kv.key, max_key_) != 0;
        if (boundary) {
            RETURN_IF_ERROR(closeFile());
        }
    }
    if (!current_) {
        RETURN_IF_ERROR(openFile());
    }

    RETURN_IF_ERROR(current_->write(toRecord(kv)));

    if (!min_key_) min_key_ = kv.key;
    max_key_ = kv.key;
    min_seq_ = std::min(min_seq_, kv.sequence_number);
    max_seq_ = std::max(max_seq_, kv.sequence_number);
    rows_++;
    if (!kv.isAdd()) deletes_++;
    stats_->collect(kv.value);
    total_records_++;
    return storage::Status();
}

storage::Result<std::vector<DataFileMetaPtr>> RollingKeyValueWriter::close() {
    if (finished_) {
        return results_;
    }
    auto status = closeFile();
    if (!status.isOk()) {
        abort();
        return status.error();
    }
    finished_ = true;
    return results_;
}

void RollingKeyValueWriter::abort() {
    if (current_) {
        current_->abort();
        current_.reset();
    }
    for (const auto& file : results_) {
        context_.file_io->deleteQuietly(context_.path_factory->dataFilePath(*file));
    }
    results_.clear();
    finished_ = true;
}

// --- KeyValueFileReader ---

KeyValueFileReader::KeyValueFileReader(std::unique_ptr<RecordReader> reader, size_t key_arity, size_t value_arity,
                                       std::string path)
    : reader_(std::move(reader)), key_arity_(key_arity), value_arity_(value_arity), path_(std::move(path)) {}

storage::Result<std::optional<KeyValue>> KeyValueFileReader::next() {
    auto row = reader_->next();
    if (!row.isOk()) return row.error();
    if (!row.value()) return std::optional<KeyValue>();

    Row& record = *row.value();
    if (record.size() != key_arity_ + 2 + value_arity_) {
        return STORAGE_ERROR(storage::ErrorCode::DATA_FILE_CORRUPTION, "Unexpected record arity in data file")
            .withFilePath(path_)
            .withContext("arity", std::to_string(record.size()));
    }
    const Value& seq = record[key_arity_];
    const Value& kind = record[key_arity_ + 1];
    if (!std::holds_alternative<int64_t>(seq) || !std::holds_alternative<int64_t>(kind)
        || std::get<int64_t>(kind) < 0 || std::get<int64_t>(kind) > static_cast<int64_t>(RowKind::DELETE)) {
        return STORAGE_ERROR(storage::ErrorCode::DATA_FILE_CORRUPTION, "Malformed record header in data file")
            .withFilePath(path_);
    }

    KeyValue kv;
    kv.key.assign(std::make_move_iterator(record.begin()),
                  std::make_move_iterator(record.begin() + key_arity_));
    kv.sequence_number = std::get<int64_t>(seq);
    kv.kind = static_cast<RowKind>(std::get<int64_t>(kind));
    kv.value.assign(std::make_move_iterator(record.begin() + key_arity_ + 2),
                    std::make_move_iterator(record.end()));
    return std::optional<KeyValue>(std::move(kv));
}

// --- KeyValueFileReaderFactory ---

KeyValueFileReaderFactory::KeyValueFileReaderFactory(KeyValueFileContext context)
    : context_(std::move(context)) {}

std::unique_ptr<KeyValueFileReader> KeyValueFileReaderFactory::createReader(
        const DataFileMeta& file, std::optional<std::vector<bool>> selection) const {
    FormatReaderContext ctx;
    ctx.path = context_.path_factory->dataFilePath(file);
    ctx.file_size = file.file_size;
    ctx.selection = std::move(selection);
    auto reader = context_.format->createReader(context_.file_io, ctx);
    return std::make_unique<KeyValueFileReader>(std::move(reader), context_.key_arity, context_.value_arity, ctx.path);
}

storage::Result<std::vector<KeyValue>> KeyValueFileReaderFactory::readAll(const DataFileMeta& file) const {
    auto reader = createReader(file);
    std::vector<KeyValue> records;
    records.reserve(static_cast<size_t>(file.row_count));
    while (true) {
        auto next = reader->next();
        if (!next.isOk()) return next.error();
        if (!next.value()) break;
        records.push_back(std::move(*next.value()));
    }
    if (static_cast<int64_t>(records.size()) != file.row_count) {
        return STORAGE_ERROR(storage::ErrorCode::DATA_FILE_CORRUPTION, "Row count does not match file metadata")
            .withFilePath(context_.path_factory->dataFilePath(file))
            .withContext("expected", std::to_string(file.row_count))
            .withContext("actual", std::to_string(records.size()));
    }
    return records;
}

} // namespace io
} // namespace lakestore
