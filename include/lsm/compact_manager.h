// include/lsm/compact_manager.h
#pragma once

#include "append_compaction_strategy.h"
#include "compact_rewriter.h"
#include "compaction_strategy.h"

#include <memory>
#include <optional>
#include <set>
#include <string>

namespace lakestore {
namespace lsm {

/**
 * @class CompactManager
 * @brief Compaction of one bucket: which files, to which level, and the
 * rewrite itself. Holds no layout of its own; every call takes the layout
 * restored from the snapshot the caller planned against.
 */
class CompactManager {
public:
    virtual ~CompactManager() = default;

    // `full` rewrites every run into the highest level.
    virtual std::optional<CompactUnit> pick(const Levels& levels, bool full) const = 0;

    /**
     * @brief A unit covering the named files. Names that are not live in
     * `levels` are ignored; nullopt when none is.
     */
    virtual std::optional<CompactUnit> pickFiles(const Levels& levels, const std::set<std::string>& file_names) const = 0;

    virtual storage::Result<CompactResult> rewrite(const Levels& levels, const CompactUnit& unit) = 0;
};

class MergeTreeCompactManager : public CompactManager {
public:
    /**
     * @param promote_to_full Set for merge functions that are not associative
     * across partial runs; every pick then covers all runs.
     */
    MergeTreeCompactManager(std::shared_ptr<const CompactionStrategy> strategy,
                            std::unique_ptr<CompactRewriter> rewriter,
                            bool promote_to_full);

    std::optional<CompactUnit> pick(const Levels& levels, bool full) const override;
    std::optional<CompactUnit> pickFiles(const Levels& levels, const std::set<std::string>& file_names) const override;
    storage::Result<CompactResult> rewrite(const Levels& levels, const CompactUnit& unit) override;

    // Retractions can go once nothing older than the output can resurface them.
    static bool dropDelete(const Levels& levels, const CompactUnit& unit);

private:
    std::shared_ptr<const CompactionStrategy> strategy_;
    ForceFullCompaction full_strategy_;
    std::unique_ptr<CompactRewriter> rewriter_;
    bool promote_to_full_;
};

class AppendOnlyCompactManager : public CompactManager {
public:
    AppendOnlyCompactManager(std::shared_ptr<const AppendCompactionStrategy> strategy,
                             std::unique_ptr<CompactRewriter> rewriter);

    std::optional<CompactUnit> pick(const Levels& levels, bool full) const override;
    std::optional<CompactUnit> pickFiles(const Levels& levels, const std::set<std::string>& file_names) const override;
    storage::Result<CompactResult> rewrite(const Levels& levels, const CompactUnit& unit) override;

private:
    std::shared_ptr<const AppendCompactionStrategy> strategy_;
    std::unique_ptr<CompactRewriter> rewriter_;
};

} // namespace lsm
} // namespace lakestore
