// include/lsm/write_buffer.h
#pragma once

#include "../types.h"

#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @class WriteBuffer
 * @brief In-memory records of one bucket awaiting flush.
 *
 * Every version is kept; merging happens on read and in compaction so that the
 * same merge function sees the same inputs either way. Not thread-safe.
 */
class WriteBuffer {
public:
    explicit WriteBuffer(int64_t max_bytes);

    void put(KeyValue kv);

    bool isFull() const { return memory_usage_ >= max_bytes_; }
    bool isEmpty() const { return records_.empty(); }
    size_t size() const { return records_.size(); }
    int64_t memoryUsage() const { return memory_usage_; }

    // Returns all records ordered by (key, sequence) and empties the buffer.
    std::vector<KeyValue> drainSorted();
    void clear();

private:
    int64_t max_bytes_;
    int64_t memory_usage_ = 0;
    std::vector<KeyValue> records_;
};

} // namespace lsm
} // namespace lakestore
