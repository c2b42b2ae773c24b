// src/lsm/sort_merge_reader.cpp
#include "../../include/lsm/sort_merge_reader.h"
#include "../../include/storage_error/error_utils.h"

namespace lakestore {
namespace lsm {

bool KeyRange::contains(const Row& key) const {
    if (min && compareRows(key, *min) < 0) return false;
    if (max && compareRows(key, *max) > 0) return false;
    return true;
}

bool KeyRange::overlaps(const io::DataFileMeta& file) const {
    if (min && compareRows(file.max_key, *min) < 0) return false;
    if (max && compareRows(file.min_key, *max) > 0) return false;
    return true;
}

// --- VectorRecordSource ---

VectorRecordSource::VectorRecordSource(std::vector<KeyValue> records)
    : records_(std::move(records)) {}

storage::Result<std::optional<KeyValue>> VectorRecordSource::next() {
    if (position_ >= records_.size()) return std::optional<KeyValue>();
    return std::optional<KeyValue>(std::move(records_[position_++]));
}

// --- SortedRunRecordSource ---

SortedRunRecordSource::SortedRunRecordSource(std::shared_ptr<const io::KeyValueFileReaderFactory> readers,
                                             SortedRun run,
                                             std::optional<KeyRange> range)
    : readers_(std::move(readers)), run_(std::move(run)), range_(std::move(range)) {}

storage::Result<std::optional<KeyValue>> SortedRunRecordSource::next() {
    while (true) {
        if (!current_) {
            const auto& files = run_.files();
            while (file_index_ < files.size() && range_ && !range_->overlaps(*files[file_index_])) {
                file_index_++;
            }
            if (file_index_ >= files.size()) return std::optional<KeyValue>();
            current_ = readers_->createReader(*files[file_index_++]);
        }
        auto kv = current_->next();
        if (!kv.isOk()) return kv.error();
        if (kv.value()) return kv;
        current_.reset();
    }
}

// --- SortMergeReader ---

SortMergeReader::SortMergeReader(std::vector<std::unique_ptr<RecordSource>> sources,
                                 std::unique_ptr<MergeFunction> merge_function,
                                 std::optional<KeyRange> range)
    : sources_(std::move(sources)),
      merge_function_(std::move(merge_function)),
      range_(std::move(range)) {}

storage::Status SortMergeReader::advance(size_t source) {
    while (true) {
        auto kv = sources_[source]->next();
        if (!kv.isOk()) return kv.error();
        if (!kv.value()) return storage::Status();
        if (range_ && !range_->contains(kv.value()->key)) {
            // Past the upper bound this source has nothing more to offer.
            if (range_->max && compareRows(kv.value()->key, *range_->max) > 0) return storage::Status();
            continue;
        }
        heap_.push(HeapItem{std::move(*kv.value()), source});
        return storage::Status();
    }
}

storage::Result<std::optional<KeyValue>> SortMergeReader::next() {
    if (!initialized_) {
        initialized_ = true;
        for (size_t i = 0; i < sources_.size(); ++i) {
            RETURN_IF_ERROR(advance(i));
        }
    }

    while (!heap_.empty()) {
        merge_function_->reset();
        Row key = heap_.top().kv.key;
        while (!heap_.empty() && compareRows(heap_.top().kv.key, key) == 0) {
            HeapItem item = heap_.top();
            heap_.pop();
            merge_function_->add(item.kv);
            RETURN_IF_ERROR(advance(item.source));
        }
        auto result = merge_function_->getResult();
        if (result) return result;
    }
    return std::optional<KeyValue>();
}

storage::Result<std::vector<KeyValue>> SortMergeReader::readAll() {
    std::vector<KeyValue> out;
    while (true) {
        auto kv = next();
        if (!kv.isOk()) return kv.error();
        if (!kv.value()) break;
        out.push_back(std::move(*kv.value()));
    }
    return out;
}

std::vector<std::unique_ptr<RecordSource>> createRunSources(
        const std::vector<LevelSortedRun>& runs,
        std::shared_ptr<const io::KeyValueFileReaderFactory> readers,
        const std::optional<KeyRange>& range) {
    std::vector<std::unique_ptr<RecordSource>> sources;
    for (const auto& run : runs) {
        bool relevant = !range;
        if (range) {
            for (const auto& f : run.run.files()) {
                if (range->overlaps(*f)) {
                    relevant = true;
                    break;
                }
            }
        }
        if (relevant) {
            sources.push_back(std::make_unique<SortedRunRecordSource>(readers, run.run, range));
        }
    }
    return sources;
}

} // namespace lsm
} // namespace lakestore
