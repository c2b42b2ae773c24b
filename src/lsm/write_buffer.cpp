// src/lsm/write_buffer.cpp
#include "../../include/lsm/write_buffer.h"

#include <algorithm>

namespace lakestore {
namespace lsm {

namespace {
    constexpr int64_t RECORD_OVERHEAD = 32;
}

WriteBuffer::WriteBuffer(int64_t max_bytes)
    : max_bytes_(max_bytes) {}

void WriteBuffer::put(KeyValue kv) {
    memory_usage_ += static_cast<int64_t>(estimateRowSize(kv.key) + estimateRowSize(kv.value)) + RECORD_OVERHEAD;
    records_.push_back(std::move(kv));
}

std::vector<KeyValue> WriteBuffer::drainSorted() {
    std::vector<KeyValue> out = std::move(records_);
    records_.clear();
    memory_usage_ = 0;
    // Sequence numbers are unique within a bucket, so the order is total.
    std::sort(out.begin(), out.end(), KeyValueOrder());
    return out;
}

void WriteBuffer::clear() {
    records_.clear();
    memory_usage_ = 0;
}

} // namespace lsm
} // namespace lakestore
