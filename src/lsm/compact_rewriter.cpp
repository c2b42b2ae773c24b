// src/lsm/compact_rewriter.cpp
#include "../../include/lsm/compact_rewriter.h"
#include "../../include/lsm/sort_merge_reader.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <algorithm>
#include <sstream>

namespace lakestore {
namespace lsm {

std::string CompactResult::toString() const {
    std::ostringstream oss;
    oss << "CompactResult{before=" << before.size() << " files/" << io::totalFileSize(before) << "B"
        << ", after=" << after.size() << " files/" << io::totalFileSize(after) << "B}";
    return oss.str();
}

// --- MergeTreeCompactRewriter ---

MergeTreeCompactRewriter::MergeTreeCompactRewriter(io::KeyValueFileContext context,
                                                   std::shared_ptr<const MergeFunctionFactory> merge_functions,
                                                   Row partition,
                                                   int32_t bucket,
                                                   int32_t num_levels)
    : context_(context),
      readers_(std::make_shared<io::KeyValueFileReaderFactory>(context)),
      merge_functions_(std::move(merge_functions)),
      partition_(std::move(partition)),
      bucket_(bucket),
      num_levels_(num_levels) {}

storage::Result<CompactResult> MergeTreeCompactRewriter::rewrite(const CompactUnit& unit, bool drop_delete) {
    CompactResult result;
    result.before = unit.files;
    if (unit.files.empty()) return result;

    // Regroups the unit's files into the runs they came from.
    Levels layout;
    ASSIGN_OR_RETURN(layout, Levels::create(unit.files, num_levels_));

    SortMergeReader reader(createRunSources(layout.levelSortedRuns(), readers_),
                           merge_functions_->create());
    io::RollingKeyValueWriter writer(context_, partition_, bucket_, unit.output_level, io::FileSource::COMPACT);

    while (true) {
        auto next = reader.next();
        if (!next.isOk()) {
            writer.abort();
            return std::move(next.error().withContext("bucket", std::to_string(bucket_)));
        }
        if (!next.value()) break;
        const KeyValue& kv = *next.value();
        if (drop_delete && !kv.isAdd()) continue;
        auto status = writer.write(kv);
        if (!status.isOk()) {
            writer.abort();
            return status.error();
        }
    }

    ASSIGN_OR_RETURN(result.after, writer.close());
    LOG_TRACE("[MergeTreeCompactRewriter] bucket ", bucket_, " -> L", unit.output_level, ": ", result.toString());
    return result;
}

// --- AppendCompactRewriter ---

AppendCompactRewriter::AppendCompactRewriter(io::KeyValueFileContext context, Row partition, int32_t bucket)
    : context_(context),
      readers_(std::make_shared<io::KeyValueFileReaderFactory>(context)),
      partition_(std::move(partition)),
      bucket_(bucket) {}

storage::Result<CompactResult> AppendCompactRewriter::rewrite(const CompactUnit& unit, bool /*drop_delete*/) {
    CompactResult result;
    result.before = unit.files;
    if (unit.files.empty()) return result;

    std::vector<io::DataFileMetaPtr> ordered = unit.files;
    std::sort(ordered.begin(), ordered.end(), [](const io::DataFileMetaPtr& a, const io::DataFileMetaPtr& b) {
        return a->min_sequence_number < b->min_sequence_number;
    });

    io::RollingKeyValueWriter writer(context_, partition_, bucket_, 0, io::FileSource::COMPACT, false);
    for (const auto& file : ordered) {
        auto reader = readers_->createReader(*file);
        while (true) {
            auto next = reader->next();
            if (!next.isOk()) {
                writer.abort();
                return next.error();
            }
            if (!next.value()) break;
            auto status = writer.write(*next.value());
            if (!status.isOk()) {
                writer.abort();
                return status.error();
            }
        }
    }

    ASSIGN_OR_RETURN(result.after, writer.close());
    return result;
}

} // namespace lsm
} // namespace lakestore
