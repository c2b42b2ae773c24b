// include/lsm/compact_rewriter.h
#pragma once

#include "compaction_strategy.h"
#include "merge_function.h"
#include "../io/key_value_file.h"

#include <memory>
#include <string>
#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @struct CompactResult
 * @brief Files a compaction removed and the files that replace them.
 */
struct CompactResult {
    std::vector<io::DataFileMetaPtr> before;
    std::vector<io::DataFileMetaPtr> after;

    bool isEmpty() const { return before.empty() && after.empty(); }
    std::string toString() const;
};

/**
 * @class CompactRewriter
 * @brief Turns a picked CompactUnit into new files. Output is only written,
 * never committed; on failure no output file is left behind.
 */
class CompactRewriter {
public:
    virtual ~CompactRewriter() = default;

    virtual storage::Result<CompactResult> rewrite(const CompactUnit& unit, bool drop_delete) = 0;
};

/**
 * @class MergeTreeCompactRewriter
 * @brief Merges the unit's runs through the table's merge function into a
 * single sorted run at the unit's output level.
 */
class MergeTreeCompactRewriter : public CompactRewriter {
public:
    MergeTreeCompactRewriter(io::KeyValueFileContext context,
                             std::shared_ptr<const MergeFunctionFactory> merge_functions,
                             Row partition,
                             int32_t bucket,
                             int32_t num_levels);

    storage::Result<CompactResult> rewrite(const CompactUnit& unit, bool drop_delete) override;

private:
    io::KeyValueFileContext context_;
    std::shared_ptr<const io::KeyValueFileReaderFactory> readers_;
    std::shared_ptr<const MergeFunctionFactory> merge_functions_;
    Row partition_;
    int32_t bucket_;
    int32_t num_levels_;
};

/**
 * @class AppendCompactRewriter
 * @brief Concatenates append-only files oldest first; no record is merged or dropped.
 */
class AppendCompactRewriter : public CompactRewriter {
public:
    AppendCompactRewriter(io::KeyValueFileContext context, Row partition, int32_t bucket);

    storage::Result<CompactResult> rewrite(const CompactUnit& unit, bool drop_delete) override;

private:
    io::KeyValueFileContext context_;
    std::shared_ptr<const io::KeyValueFileReaderFactory> readers_;
    Row partition_;
    int32_t bucket_;
};

} // namespace lsm
} // namespace lakestore
