// include/io/file_format.h
#pragma once

#include "../types.h"
#include "../fs/file_io.h"
#include "../storage_error/result.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace io {

/**
 * @brief Everything a reader needs to open one data file.
 * `selection`, when present, holds one flag per row; unselected rows are skipped.
 */
struct FormatReaderContext {
    std::string path;
    int64_t file_size = 0;
    std::optional<std::vector<bool>> selection;
};

class RecordWriter {
public:
    virtual ~RecordWriter() = default;
    virtual storage::Status write(const Row& row) = 0;
    // Bytes the file would occupy if closed now.
    virtual int64_t estimatedSize() const = 0;
    virtual int64_t rowCount() const = 0;
    // Publishes the file. Returns its final size in bytes.
    virtual storage::Result<int64_t> close() = 0;
    // Discards everything written; nothing becomes visible.
    virtual void abort() = 0;
};

class RecordReader {
public:
    virtual ~RecordReader() = default;
    // nullopt at end of file.
    virtual storage::Result<std::optional<Row>> next() = 0;
};

/**
 * @class FileFormat
 * @brief Opaque data-file encoding. The table store only ever sees rows.
 */
class FileFormat {
public:
    virtual ~FileFormat() = default;
    virtual std::string identifier() const = 0;
    virtual std::unique_ptr<RecordWriter> createWriter(std::shared_ptr<fs::FileIO> file_io,
                                                       const std::string& path,
                                                       const fs::IoRetryPolicy& retry) const = 0;
    virtual std::unique_ptr<RecordReader> createReader(std::shared_ptr<fs::FileIO> file_io,
                                                       const FormatReaderContext& context) const = 0;
};

/**
 * @class RowFileFormat
 * @brief Row-oriented block format.
 *
 * Layout:
 *   "LSDF" | u8 version
 *   block*: u32 compressed size | u32 uncompressed size | u32 crc32 | u8 compression | payload
 *           payload = u32 row count | row*
 *   footer: u64 total rows | u32 block count | "LSDF"
 *
 * The whole file is assembled in memory and published with a single
 * FileIO::writeFile, so a failed write never leaves a partial file visible.
 */
class RowFileFormat : public FileFormat {
public:
    RowFileFormat(CompressionType compression, int64_t block_size);

    std::string identifier() const override { return "row"; }
    std::unique_ptr<RecordWriter> createWriter(std::shared_ptr<fs::FileIO> file_io,
                                               const std::string& path,
                                               const fs::IoRetryPolicy& retry) const override;
    std::unique_ptr<RecordReader> createReader(std::shared_ptr<fs::FileIO> file_io,
                                               const FormatReaderContext& context) const override;

    static constexpr char MAGIC[4] = {'L', 'S', 'D', 'F'};
    static constexpr uint8_t VERSION = 1;

private:
    CompressionType compression_;
    int64_t block_size_;
};

} // namespace io
} // namespace lakestore
