// src/table/table_read.cpp
#include "../../include/table/table_read.h"
#include "../../include/lsm/levels.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <algorithm>

namespace lakestore {
namespace table {

TableRead::TableRead(std::shared_ptr<const FileStoreTable> table)
    : table_(std::move(table)),
      readers_(std::make_shared<io::KeyValueFileReaderFactory>(table_->keyValueFileContext())) {}

storage::Result<std::vector<Row>> TableRead::read(const operation::ScanOptions& options) const {
    operation::ScanPlan plan;
    ASSIGN_OR_RETURN(plan, table_->newScan()->plan(options));
    return read(plan);
}

storage::Result<std::vector<Row>> TableRead::read(const operation::ScanPlan& plan) const {
    std::vector<Row> rows;
    for (const auto& [bucket_key, files] : plan.groupByBucket()) {
        std::vector<Row> bucket_rows;
        ASSIGN_OR_RETURN(bucket_rows, readBucket(bucket_key.first, bucket_key.second, files));
        rows.insert(rows.end(), std::make_move_iterator(bucket_rows.begin()),
                    std::make_move_iterator(bucket_rows.end()));
    }
    LOG_TRACE("[TableRead] Read ", rows.size(), " row(s) from ", plan.entries.size(), " file(s)");
    return rows;
}

storage::Result<std::vector<Row>> TableRead::readBucket(const Row& partition,
                                                        int32_t bucket,
                                                        const std::vector<io::DataFileMetaPtr>& files,
                                                        const std::optional<lsm::KeyRange>& range) const {
    std::vector<Row> rows;
    if (!table_->hasPrimaryKey()) {
        // Insertion order is sequence order.
        std::vector<io::DataFileMetaPtr> ordered = files;
        std::sort(ordered.begin(), ordered.end(), [](const io::DataFileMetaPtr& a, const io::DataFileMetaPtr& b) {
            return a->min_sequence_number < b->min_sequence_number;
        });
        for (const auto& file : ordered) {
            std::vector<KeyValue> records;
            ASSIGN_OR_RETURN(records, readers_->readAll(*file));
            for (auto& kv : records) rows.push_back(std::move(kv.value));
        }
        return rows;
    }

    auto levels = lsm::Levels::create(files, table_->options().num_levels);
    if (!levels.isOk()) {
        return std::move(levels.error()
            .withContext("partition", rowToString(partition))
            .withContext("bucket", std::to_string(bucket)));
    }
    lsm::SortMergeReader reader(lsm::createRunSources(levels.value().levelSortedRuns(), readers_, range),
                                table_->mergeFunctions()->create(),
                                range);
    std::vector<KeyValue> merged;
    ASSIGN_OR_RETURN(merged, reader.readAll());
    rows.reserve(merged.size());
    for (auto& kv : merged) {
        if (kv.isAdd()) rows.push_back(std::move(kv.value));
    }
    return rows;
}

} // namespace table
} // namespace lakestore
