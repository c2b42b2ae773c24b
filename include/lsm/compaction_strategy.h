// include/lsm/compaction_strategy.h
#pragma once

#include "levels.h"

#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @struct CompactUnit
 * @brief The files one compaction rewrites and the level its output lands on.
 */
struct CompactUnit {
    int32_t output_level = 0;
    std::vector<io::DataFileMetaPtr> files;

    static CompactUnit fromLevelRuns(int32_t output_level, const std::vector<LevelSortedRun>& runs);
    static CompactUnit fromFiles(int32_t output_level, std::vector<io::DataFileMetaPtr> files);

    /**
     * @brief The first `run_count` runs (newest first), landing just below the
     * next untouched run, or on `max_level` when every run is taken.
     *
     * Output never lands on level 0: when the next untouched run sits on
     * level 0 too, the unit is extended up to the first run above level 0.
     */
    static CompactUnit fromRunPrefix(const std::vector<LevelSortedRun>& runs, int32_t max_level, size_t run_count);

    std::string toString() const;
};

/**
 * @class CompactionStrategy
 * @brief Picks the next compaction of one bucket from its sorted runs.
 *
 * `runs` is Levels::levelSortedRuns(): level-0 files newest first, one run
 * each, then every non-empty level above 0 in ascending order. Strategies are
 * stateless between calls apart from metrics, and may be shared by buckets.
 */
class CompactionStrategy {
public:
    virtual ~CompactionStrategy() = default;

    /**
     * @return The unit to compact, or std::nullopt when the layout needs no
     * work right now.
     */
    virtual std::optional<CompactUnit> SelectCompaction(
        int32_t num_levels,
        const std::vector<LevelSortedRun>& runs
    ) const = 0;
};

/**
 * @class ForceFullCompaction
 * @brief Rewrites every run into the highest level. A bucket that is already a
 * single run at the highest level is left alone.
 */
class ForceFullCompaction : public CompactionStrategy {
public:
    std::optional<CompactUnit> SelectCompaction(
        int32_t num_levels,
        const std::vector<LevelSortedRun>& runs
    ) const override;
};

} // namespace lsm
} // namespace lakestore
