// src/lsm/bucket_writer.cpp
#include "../../include/lsm/bucket_writer.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

namespace lakestore {
namespace lsm {

// --- MergeTreeWriter ---

MergeTreeWriter::MergeTreeWriter(io::KeyValueFileContext context,
                                 Row partition,
                                 int32_t bucket,
                                 int64_t restored_max_sequence_number,
                                 int64_t write_buffer_size)
    : context_(std::move(context)),
      partition_(std::move(partition)),
      bucket_(bucket),
      last_sequence_number_(restored_max_sequence_number),
      buffer_(write_buffer_size) {}

MergeTreeWriter::~MergeTreeWriter() {
    if (!new_files_.empty() || !buffer_.isEmpty()) {
        LOG_WARN("[MergeTreeWriter] Bucket ", bucket_, " destroyed with ", new_files_.size(),
                 " uncommitted file(s) and ", buffer_.size(), " buffered record(s); discarding");
        abort();
    }
}

storage::Status MergeTreeWriter::write(RowKind kind, Row key, Row value) {
    buffer_.put(KeyValue(std::move(key), ++last_sequence_number_, kind, std::move(value)));
    if (buffer_.isFull()) {
        return flush();
    }
    return storage::Status();
}

storage::Status MergeTreeWriter::flush() {
    if (buffer_.isEmpty()) return storage::Status();

    std::vector<KeyValue> records = buffer_.drainSorted();
    io::RollingKeyValueWriter writer(context_, partition_, bucket_, 0, io::FileSource::APPEND, keyGrouped());
    for (const auto& kv : records) {
        auto status = writer.write(kv);
        if (!status.isOk()) {
            writer.abort();
            LOG_ERROR("[MergeTreeWriter] Flush of bucket ", bucket_, " failed; discarded ", records.size(),
                      " record(s): ", status.error().toString());
            return status.error();
        }
    }
    auto files = writer.close();
    if (!files.isOk()) {
        LOG_ERROR("[MergeTreeWriter] Flush of bucket ", bucket_, " failed; discarded ", records.size(),
                  " record(s): ", files.error().toString());
        return files.error();
    }
    new_files_.insert(new_files_.end(), files.value().begin(), files.value().end());
    LOG_TRACE("[MergeTreeWriter] Flushed ", records.size(), " record(s) of bucket ", bucket_, " into ",
              files.value().size(), " file(s)");
    return storage::Status();
}

storage::Result<std::vector<io::DataFileMetaPtr>> MergeTreeWriter::prepareCommit() {
    RETURN_IF_ERROR(flush());
    std::vector<io::DataFileMetaPtr> files = std::move(new_files_);
    new_files_.clear();
    return files;
}

void MergeTreeWriter::abort() {
    buffer_.clear();
    for (const auto& file : new_files_) {
        context_.file_io->deleteQuietly(context_.path_factory->dataFilePath(*file));
    }
    new_files_.clear();
}

// --- AppendOnlyWriter ---

AppendOnlyWriter::AppendOnlyWriter(io::KeyValueFileContext context,
                                   Row partition,
                                   int32_t bucket,
                                   int64_t restored_max_sequence_number,
                                   int64_t write_buffer_size)
    : MergeTreeWriter(std::move(context), std::move(partition), bucket,
                      restored_max_sequence_number, write_buffer_size) {}

storage::Status AppendOnlyWriter::write(RowKind kind, Row key, Row value) {
    if (kind != RowKind::INSERT) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Append-only tables accept INSERT records only")
            .withContext("kind", rowKindToShortString(kind));
    }
    if (!key.empty()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Append-only records carry no key");
    }
    return MergeTreeWriter::write(kind, std::move(key), std::move(value));
}

} // namespace lsm
} // namespace lakestore
