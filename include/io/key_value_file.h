// include/io/key_value_file.h
#pragma once

#include "file_format.h"
#include "data_file_meta.h"
#include "../fs/path_factory.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace io {

/**
 * @brief What every data file of one bucket shares.
 * A record on disk is [key fields..., sequence number, row kind, value fields...].
 */
struct KeyValueFileContext {
    std::shared_ptr<fs::FileIO> file_io;
    std::shared_ptr<const fs::FileStorePathFactory> path_factory;
    std::shared_ptr<const FileFormat> format;
    fs::IoRetryPolicy io_retry;
    int64_t schema_id = 0;
    size_t key_arity = 0;
    size_t value_arity = 0;
    int64_t target_file_size = 128LL * 1024 * 1024;
};

/**
 * @class RollingKeyValueWriter
 * @brief Writes a (key, seq)-ordered record stream into one or more data files
 * of a single bucket and level.
 *
 * When `key_grouped` is set, a new file is started only between two distinct
 * keys, so all versions of a key land in the same file and files of one run
 * never overlap. Append tables pass false and may roll anywhere.
 *
 * Not thread-safe.
 */
class RollingKeyValueWriter {
public:
    RollingKeyValueWriter(KeyValueFileContext context,
                          Row partition,
                          int32_t bucket,
                          int32_t level,
                          FileSource source,
                          bool key_grouped = true);
    ~RollingKeyValueWriter();

    RollingKeyValueWriter(const RollingKeyValueWriter&) = delete;
    RollingKeyValueWriter& operator=(const RollingKeyValueWriter&) = delete;

    storage::Status write(const KeyValue& kv);

    /**
     * @brief Closes the open file and returns the metadata of every file written.
     * On failure all files written so far are deleted.
     */
    storage::Result<std::vector<DataFileMetaPtr>> close();

    // Deletes every file written, including ones already closed.
    void abort();

    int64_t recordCount() const { return total_records_; }

private:
    storage::Status openFile();
    storage::Status closeFile();

    KeyValueFileContext context_;
    Row partition_;
    int32_t bucket_;
    int32_t level_;
    FileSource source_;
    bool key_grouped_;

    std::unique_ptr<RecordWriter> current_;
    std::string current_name_;
    std::string current_path_;
    std::optional<Row> min_key_;
    Row max_key_;
    int64_t min_seq_ = 0;
    int64_t max_seq_ = 0;
    int64_t rows_ = 0;
    int64_t deletes_ = 0;
    std::unique_ptr<SimpleStatsCollector> stats_;

    std::vector<DataFileMetaPtr> results_;
    int64_t total_records_ = 0;
    bool finished_ = false;
};

/**
 * @class KeyValueFileReader
 * @brief Streams the records of one data file in stored (key, seq) order.
 */
class KeyValueFileReader {
public:
    KeyValueFileReader(std::unique_ptr<RecordReader> reader, size_t key_arity, size_t value_arity, std::string path);

    storage::Result<std::optional<KeyValue>> next();

private:
    std::unique_ptr<RecordReader> reader_;
    size_t key_arity_;
    size_t value_arity_;
    std::string path_;
};

class KeyValueFileReaderFactory {
public:
    explicit KeyValueFileReaderFactory(KeyValueFileContext context);

    std::unique_ptr<KeyValueFileReader> createReader(const DataFileMeta& file,
                                                     std::optional<std::vector<bool>> selection = std::nullopt) const;

    // Reads a whole file into memory.
    storage::Result<std::vector<KeyValue>> readAll(const DataFileMeta& file) const;

    const KeyValueFileContext& context() const { return context_; }

private:
    KeyValueFileContext context_;
};

Row toRecord(const KeyValue& kv);

} // namespace io
} // namespace lakestore
