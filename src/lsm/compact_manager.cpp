// src/lsm/compact_manager.cpp
#include "../../include/lsm/compact_manager.h"
#include "../../include/debug_utils.h"

namespace lakestore {
namespace lsm {

// --- MergeTreeCompactManager ---

MergeTreeCompactManager::MergeTreeCompactManager(std::shared_ptr<const CompactionStrategy> strategy,
                                                 std::unique_ptr<CompactRewriter> rewriter,
                                                 bool promote_to_full)
    : strategy_(std::move(strategy)),
      rewriter_(std::move(rewriter)),
      promote_to_full_(promote_to_full) {}

std::optional<CompactUnit> MergeTreeCompactManager::pick(const Levels& levels, bool full) const {
    const auto runs = levels.levelSortedRuns();
    if (full) {
        return full_strategy_.SelectCompaction(levels.numberOfLevels(), runs);
    }
    auto unit = strategy_->SelectCompaction(levels.numberOfLevels(), runs);
    if (unit && promote_to_full_ && unit->files.size() != levels.allFiles().size()) {
        LOG_TRACE("[MergeTreeCompactManager] Promoting ", unit->toString(), " to a full compaction");
        return full_strategy_.SelectCompaction(levels.numberOfLevels(), runs);
    }
    return unit;
}

std::optional<CompactUnit> MergeTreeCompactManager::pickFiles(const Levels& levels,
                                                              const std::set<std::string>& file_names) const {
    const auto runs = levels.levelSortedRuns();
    // The oldest run holding a requested file bounds the prefix to compact.
    size_t run_count = 0;
    for (size_t i = 0; i < runs.size(); ++i) {
        for (const auto& f : runs[i].run.files()) {
            if (file_names.count(f->file_name)) {
                run_count = i + 1;
                break;
            }
        }
    }
    if (run_count == 0) return std::nullopt;
    if (promote_to_full_) run_count = runs.size();
    if (run_count == 1 && runs.size() == 1 && runs[0].level == levels.maxLevel()) return std::nullopt;
    return CompactUnit::fromRunPrefix(runs, levels.maxLevel(), run_count);
}

bool MergeTreeCompactManager::dropDelete(const Levels& levels, const CompactUnit& unit) {
    return unit.output_level != 0 && unit.output_level >= levels.nonEmptyHighestLevel();
}

storage::Result<CompactResult> MergeTreeCompactManager::rewrite(const Levels& levels, const CompactUnit& unit) {
    return rewriter_->rewrite(unit, dropDelete(levels, unit));
}

// --- AppendOnlyCompactManager ---

AppendOnlyCompactManager::AppendOnlyCompactManager(std::shared_ptr<const AppendCompactionStrategy> strategy,
                                                   std::unique_ptr<CompactRewriter> rewriter)
    : strategy_(std::move(strategy)),
      rewriter_(std::move(rewriter)) {}

std::optional<CompactUnit> AppendOnlyCompactManager::pick(const Levels& levels, bool full) const {
    const auto runs = levels.levelSortedRuns();
    if (full) return strategy_->SelectFullCompaction(runs);
    return strategy_->SelectCompaction(levels.numberOfLevels(), runs);
}

std::optional<CompactUnit> AppendOnlyCompactManager::pickFiles(const Levels& levels,
                                                               const std::set<std::string>& file_names) const {
    std::vector<io::DataFileMetaPtr> files;
    for (const auto& f : levels.allFiles()) {
        if (file_names.count(f->file_name)) files.push_back(f);
    }
    if (files.size() < 2) return std::nullopt;
    return CompactUnit::fromFiles(0, std::move(files));
}

storage::Result<CompactResult> AppendOnlyCompactManager::rewrite(const Levels& /*levels*/, const CompactUnit& unit) {
    return rewriter_->rewrite(unit, false);
}

} // namespace lsm
} // namespace lakestore
