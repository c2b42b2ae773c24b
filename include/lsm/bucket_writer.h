// include/lsm/bucket_writer.h
#pragma once

#include "write_buffer.h"
#include "../io/key_value_file.h"

#include <memory>
#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @class BucketWriter
 * @brief Buffers the records one writer sends to one bucket and turns them
 * into new level-0 files. Files are only written here; they become visible
 * when the caller commits what prepareCommit() returned.
 *
 * Not thread-safe. One instance per (writer, partition, bucket).
 */
class BucketWriter {
public:
    virtual ~BucketWriter() = default;

    virtual storage::Status write(RowKind kind, Row key, Row value) = 0;

    /**
     * @brief Writes the buffer out as level-0 files. On failure the buffer is
     * discarded and no partial file is left behind; files of earlier flushes
     * are kept.
     */
    virtual storage::Status flush() = 0;

    // Flushes and hands over every file written since the last call.
    virtual storage::Result<std::vector<io::DataFileMetaPtr>> prepareCommit() = 0;

    // Drops the buffer and deletes files not yet handed over.
    virtual void abort() = 0;

    virtual int64_t maxSequenceNumber() const = 0;
    virtual size_t bufferedRecords() const = 0;
};

/**
 * @class MergeTreeWriter
 * @brief Writer of a primary-key bucket. Every record gets the next sequence
 * number after the highest one restored from the bucket's live files, so that
 * newer writes always shadow older ones on merge.
 */
class MergeTreeWriter : public BucketWriter {
public:
    MergeTreeWriter(io::KeyValueFileContext context,
                    Row partition,
                    int32_t bucket,
                    int64_t restored_max_sequence_number,
                    int64_t write_buffer_size);
    ~MergeTreeWriter() override;

    storage::Status write(RowKind kind, Row key, Row value) override;
    storage::Status flush() override;
    storage::Result<std::vector<io::DataFileMetaPtr>> prepareCommit() override;
    void abort() override;

    int64_t maxSequenceNumber() const override { return last_sequence_number_; }
    size_t bufferedRecords() const override { return buffer_.size(); }

protected:
    // Level-0 files of append tables may split anywhere.
    virtual bool keyGrouped() const { return true; }

    io::KeyValueFileContext context_;
    Row partition_;
    int32_t bucket_;
    int64_t last_sequence_number_;
    WriteBuffer buffer_;
    std::vector<io::DataFileMetaPtr> new_files_;
};

/**
 * @class AppendOnlyWriter
 * @brief Writer of a bucket without primary key. Only INSERT is accepted;
 * records keep insertion order and are never merged.
 */
class AppendOnlyWriter : public MergeTreeWriter {
public:
    AppendOnlyWriter(io::KeyValueFileContext context,
                     Row partition,
                     int32_t bucket,
                     int64_t restored_max_sequence_number,
                     int64_t write_buffer_size);

    storage::Status write(RowKind kind, Row key, Row value) override;

protected:
    bool keyGrouped() const override { return false; }
};

} // namespace lsm
} // namespace lakestore
