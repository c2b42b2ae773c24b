// include/lsm/sort_merge_reader.h
#pragma once

#include "levels.h"
#include "merge_function.h"
#include "../io/key_value_file.h"

#include <memory>
#include <optional>
#include <queue>
#include <vector>

namespace lakestore {
namespace lsm {

// Inclusive key bounds; an absent bound is open.
struct KeyRange {
    std::optional<Row> min;
    std::optional<Row> max;

    bool contains(const Row& key) const;
    bool overlaps(const io::DataFileMeta& file) const;
};

// A stream of records in (key, sequence) order.
class RecordSource {
public:
    virtual ~RecordSource() = default;
    virtual storage::Result<std::optional<KeyValue>> next() = 0;
};

class VectorRecordSource : public RecordSource {
public:
    // `records` must already be ordered by (key, sequence).
    explicit VectorRecordSource(std::vector<KeyValue> records);
    storage::Result<std::optional<KeyValue>> next() override;

private:
    std::vector<KeyValue> records_;
    size_t position_ = 0;
};

/**
 * @brief Reads the files of one sorted run back to back, opening each file
 * only when the previous one is exhausted and skipping files outside `range`.
 */
class SortedRunRecordSource : public RecordSource {
public:
    SortedRunRecordSource(std::shared_ptr<const io::KeyValueFileReaderFactory> readers,
                          SortedRun run,
                          std::optional<KeyRange> range);
    storage::Result<std::optional<KeyValue>> next() override;

private:
    std::shared_ptr<const io::KeyValueFileReaderFactory> readers_;
    SortedRun run_;
    std::optional<KeyRange> range_;
    size_t file_index_ = 0;
    std::unique_ptr<io::KeyValueFileReader> current_;
};

/**
 * @class SortMergeReader
 * @brief K-way merge of sorted sources. All versions of a key, across every
 * source, are fed to the merge function oldest first and folded into at most
 * one output record.
 *
 * `sources` must be ordered newest first, as Levels::levelSortedRuns() is.
 */
class SortMergeReader {
public:
    SortMergeReader(std::vector<std::unique_ptr<RecordSource>> sources,
                    std::unique_ptr<MergeFunction> merge_function,
                    std::optional<KeyRange> range = std::nullopt);

    // nullopt once every source is exhausted.
    storage::Result<std::optional<KeyValue>> next();

    // Drains the reader.
    storage::Result<std::vector<KeyValue>> readAll();

private:
    struct HeapItem {
        KeyValue kv;
        size_t source;
    };
    // Min-heap on (key, sequence). Sources are ordered newest run first, so
    // on a sequence tie the higher source index (the older run) pops first.
    struct HeapGreater {
        bool operator()(const HeapItem& a, const HeapItem& b) const {
            if (KeyValueOrder()(b.kv, a.kv)) return true;
            if (KeyValueOrder()(a.kv, b.kv)) return false;
            return a.source < b.source;
        }
    };

    storage::Status advance(size_t source);

    std::vector<std::unique_ptr<RecordSource>> sources_;
    std::unique_ptr<MergeFunction> merge_function_;
    std::optional<KeyRange> range_;
    std::priority_queue<HeapItem, std::vector<HeapItem>, HeapGreater> heap_;
    bool initialized_ = false;
};

/**
 * @brief Opens one source per sorted run (and per level-0 file) that
 * overlaps `range`.
 */
std::vector<std::unique_ptr<RecordSource>> createRunSources(
    const std::vector<LevelSortedRun>& runs,
    std::shared_ptr<const io::KeyValueFileReaderFactory> readers,
    const std::optional<KeyRange>& range = std::nullopt);

} // namespace lsm
} // namespace lakestore
