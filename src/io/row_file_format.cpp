// src/io/row_file_format.cpp
#include "../../include/io/file_format.h"
#include "../../include/compression_utils.h"
#include "../../include/serialization_utils.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <cstring>
#include <sstream>

namespace lakestore {
namespace io {

constexpr char RowFileFormat::MAGIC[4];

namespace {
    constexpr size_t HEADER_SIZE = 5;
    constexpr size_t BLOCK_HEADER_SIZE = 13;
    constexpr size_t FOOTER_SIZE = 16;

    template<typename T>
    void appendFixed(std::string& out, T v) {
        out.append(reinterpret_cast<const char*>(&v), sizeof(T));
    }

    template<typename T>
    T readFixed(const std::string& in, size_t offset) {
        T v;
        std::memcpy(&v, in.data() + offset, sizeof(T));
        return v;
    }

    storage::StorageError corrupted(const std::string& path, const std::string& what) {
        return STORAGE_ERROR(storage::ErrorCode::DATA_FILE_CORRUPTION, "Corrupted data file")
            .withDetails(what)
            .withFilePath(path);
    }

    class RowFileWriter : public RecordWriter {
    public:
        RowFileWriter(std::shared_ptr<fs::FileIO> file_io, std::string path, fs::IoRetryPolicy retry,
                      CompressionType compression, int64_t block_size)
            : file_io_(std::move(file_io)), path_(std::move(path)), retry_(retry),
              compression_(compression), block_size_(block_size),
              block_stream_(std::ios::binary) {
            file_.append(RowFileFormat::MAGIC, 4);
            file_.push_back(static_cast<char>(RowFileFormat::VERSION));
        }

        storage::Status write(const Row& row) override {
            if (closed_) {
                return STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, "write() after close()").withFilePath(path_);
            }
            try {
                SerializeRow(block_stream_, row);
            } catch (const std::exception& e) {
                return STORAGE_ERROR(storage::ErrorCode::ENCODING_ERROR, "Failed to encode row").withDetails(e.what());
            }
            block_rows_++;
            total_rows_++;
            block_bytes_ = static_cast<int64_t>(block_stream_.tellp());
            if (block_bytes_ >= block_size_) {
                return flushBlock();
            }
            return storage::Status();
        }

        int64_t estimatedSize() const override {
            return static_cast<int64_t>(file_.size() + FOOTER_SIZE) + block_bytes_;
        }

        int64_t rowCount() const override { return total_rows_; }

        storage::Result<int64_t> close() override {
            if (closed_) {
                return STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, "close() called twice").withFilePath(path_);
            }
            RETURN_IF_ERROR(flushBlock());
            appendFixed<uint64_t>(file_, static_cast<uint64_t>(total_rows_));
            appendFixed<uint32_t>(file_, block_count_);
            file_.append(RowFileFormat::MAGIC, 4);
            closed_ = true;

            auto status = fs::retryIo(retry_, "write data file " + path_, [&]() {
                return file_io_->writeFile(path_, file_, false);
            });
            if (!status.isOk()) {
                return status.error();
            }
            LOG_TRACE("[RowFileWriter] Wrote ", path_, " rows=", total_rows_, " bytes=", file_.size());
            return static_cast<int64_t>(file_.size());
        }

        void abort() override {
            closed_ = true;
            file_.clear();
            // close() may have published the file before a later step failed.
            file_io_->deleteQuietly(path_);
        }

    private:
        storage::Status flushBlock() {
            if (block_rows_ == 0) return storage::Status();
            std::string rows = block_stream_.str();
            std::string payload;
            appendFixed<uint32_t>(payload, block_rows_);
            payload += rows;

            std::vector<uint8_t> compressed;
            try {
                compressed = CompressionManager::compress(
                    reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), compression_);
            } catch (const std::exception& e) {
                return STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Block compression failed").withDetails(e.what());
            }
            appendFixed<uint32_t>(file_, static_cast<uint32_t>(compressed.size()));
            appendFixed<uint32_t>(file_, static_cast<uint32_t>(payload.size()));
            appendFixed<uint32_t>(file_, computeChecksum(payload.data(), payload.size()));
            file_.push_back(static_cast<char>(compression_));
            file_.append(reinterpret_cast<const char*>(compressed.data()), compressed.size());

            block_stream_.str(std::string());
            block_stream_.clear();
            block_rows_ = 0;
            block_bytes_ = 0;
            block_count_++;
            return storage::Status();
        }

        std::shared_ptr<fs::FileIO> file_io_;
        std::string path_;
        fs::IoRetryPolicy retry_;
        CompressionType compression_;
        int64_t block_size_;

        std::string file_;
        std::ostringstream block_stream_;
        uint32_t block_rows_ = 0;
        int64_t block_bytes_ = 0;
        uint32_t block_count_ = 0;
        int64_t total_rows_ = 0;
        bool closed_ = false;
    };

    class RowFileReader : public RecordReader {
    public:
        RowFileReader(std::shared_ptr<fs::FileIO> file_io, FormatReaderContext context)
            : file_io_(std::move(file_io)), context_(std::move(context)) {}

        storage::Result<std::optional<Row>> next() override {
            if (!opened_) {
                RETURN_IF_ERROR(open());
            }
            while (true) {
                if (block_rows_remaining_ == 0) {
                    if (blocks_read_ == block_count_) {
                        return std::optional<Row>();
                    }
                    RETURN_IF_ERROR(loadBlock());
                    continue;
                }
                Row row;
                try {
                    row = DeserializeRow(block_in_);
                } catch (const std::exception& e) {
                    return corrupted(context_.path, std::string("row decode failed: ") + e.what());
                }
                block_rows_remaining_--;
                int64_t position = row_position_++;
                if (context_.selection) {
                    const auto& sel = *context_.selection;
                    if (position >= static_cast<int64_t>(sel.size()) || !sel[position]) {
                        continue;
                    }
                }
                return std::optional<Row>(std::move(row));
            }
        }

    private:
        storage::Status open() {
            auto content = file_io_->readFile(context_.path);
            if (!content.isOk()) return content.error();
            data_ = std::move(content).value();
            opened_ = true;

            if (context_.file_size > 0 && static_cast<int64_t>(data_.size()) != context_.file_size) {
                return corrupted(context_.path, "size " + std::to_string(data_.size()) +
                                 " does not match recorded size " + std::to_string(context_.file_size));
            }
            if (data_.size() < HEADER_SIZE + FOOTER_SIZE
                || std::memcmp(data_.data(), RowFileFormat::MAGIC, 4) != 0
                || std::memcmp(data_.data() + data_.size() - 4, RowFileFormat::MAGIC, 4) != 0) {
                return corrupted(context_.path, "bad magic");
            }
            if (static_cast<uint8_t>(data_[4]) != RowFileFormat::VERSION) {
                return STORAGE_ERROR(storage::ErrorCode::FORMAT_VERSION_MISMATCH, "Unsupported data file version")
                    .withFilePath(context_.path);
            }
            size_t footer = data_.size() - FOOTER_SIZE;
            total_rows_ = static_cast<int64_t>(readFixed<uint64_t>(data_, footer));
            block_count_ = readFixed<uint32_t>(data_, footer + 8);
            offset_ = HEADER_SIZE;
            end_of_blocks_ = footer;
            if (context_.selection && static_cast<int64_t>(context_.selection->size()) != total_rows_) {
                return STORAGE_ERROR(storage::ErrorCode::INVALID_VALUE, "Row selection does not match file row count")
                    .withFilePath(context_.path)
                    .withContext("rows", std::to_string(total_rows_))
                    .withContext("selection", std::to_string(context_.selection->size()));
            }
            return storage::Status();
        }

        storage::Status loadBlock() {
            if (offset_ + BLOCK_HEADER_SIZE > end_of_blocks_) {
                return corrupted(context_.path, "truncated block header");
            }
            uint32_t compressed_size = readFixed<uint32_t>(data_, offset_);
            uint32_t uncompressed_size = readFixed<uint32_t>(data_, offset_ + 4);
            uint32_t crc = readFixed<uint32_t>(data_, offset_ + 8);
            auto compression = static_cast<CompressionType>(static_cast<uint8_t>(data_[offset_ + 12]));
            offset_ += BLOCK_HEADER_SIZE;
            if (offset_ + compressed_size > end_of_blocks_) {
                return corrupted(context_.path, "truncated block payload");
            }

            std::vector<uint8_t> payload;
            try {
                payload = CompressionManager::decompress(
                    reinterpret_cast<const uint8_t*>(data_.data() + offset_), compressed_size,
                    uncompressed_size, compression);
            } catch (const std::exception& e) {
                return corrupted(context_.path, std::string("block decompression failed: ") + e.what());
            }
            offset_ += compressed_size;
            if (payload.size() < 4 || computeChecksum(payload.data(), payload.size()) != crc) {
                return STORAGE_ERROR(storage::ErrorCode::CHECKSUM_MISMATCH, "Data block checksum mismatch")
                    .withFilePath(context_.path)
                    .withContext("block", std::to_string(blocks_read_));
            }
            uint32_t rows;
            std::memcpy(&rows, payload.data(), sizeof(rows));
            block_in_.str(std::string(reinterpret_cast<const char*>(payload.data()) + 4, payload.size() - 4));
            block_in_.clear();
            block_rows_remaining_ = rows;
            blocks_read_++;
            return storage::Status();
        }

        std::shared_ptr<fs::FileIO> file_io_;
        FormatReaderContext context_;
        bool opened_ = false;

        std::string data_;
        size_t offset_ = 0;
        size_t end_of_blocks_ = 0;
        int64_t total_rows_ = 0;
        uint32_t block_count_ = 0;
        uint32_t blocks_read_ = 0;
        uint32_t block_rows_remaining_ = 0;
        int64_t row_position_ = 0;
        std::istringstream block_in_{std::ios::binary};
    };
}

RowFileFormat::RowFileFormat(CompressionType compression, int64_t block_size)
    : compression_(compression), block_size_(block_size > 0 ? block_size : 64 * 1024) {}

std::unique_ptr<RecordWriter> RowFileFormat::createWriter(std::shared_ptr<fs::FileIO> file_io,
                                                          const std::string& path,
                                                          const fs::IoRetryPolicy& retry) const {
    return std::make_unique<RowFileWriter>(std::move(file_io), path, retry, compression_, block_size_);
}

std::unique_ptr<RecordReader> RowFileFormat::createReader(std::shared_ptr<fs::FileIO> file_io,
                                                          const FormatReaderContext& context) const {
    return std::make_unique<RowFileReader>(std::move(file_io), context);
}

} // namespace io
} // namespace lakestore
