// src/lsm/compaction_strategy.cpp
#include "../../include/lsm/compaction_strategy.h"

#include <algorithm>
#include <sstream>

namespace lakestore {
namespace lsm {

CompactUnit CompactUnit::fromLevelRuns(int32_t output_level, const std::vector<LevelSortedRun>& runs) {
    CompactUnit unit;
    unit.output_level = output_level;
    for (const auto& run : runs) {
        unit.files.insert(unit.files.end(), run.run.files().begin(), run.run.files().end());
    }
    return unit;
}

CompactUnit CompactUnit::fromFiles(int32_t output_level, std::vector<io::DataFileMetaPtr> files) {
    CompactUnit unit;
    unit.output_level = output_level;
    unit.files = std::move(files);
    return unit;
}

CompactUnit CompactUnit::fromRunPrefix(const std::vector<LevelSortedRun>& runs, int32_t max_level, size_t run_count) {
    run_count = std::min(run_count, runs.size());
    int32_t output_level;
    if (run_count == runs.size()) {
        output_level = max_level;
    } else {
        output_level = std::max(0, runs[run_count].level - 1);
    }

    if (output_level == 0) {
        for (size_t i = run_count; i < runs.size(); ++i) {
            const auto& next = runs[i];
            run_count++;
            if (next.level != 0) {
                output_level = next.level;
                break;
            }
        }
    }

    if (run_count == runs.size()) {
        output_level = max_level;
    }

    std::vector<LevelSortedRun> picked(runs.begin(), runs.begin() + static_cast<std::ptrdiff_t>(run_count));
    return fromLevelRuns(output_level, picked);
}

std::string CompactUnit::toString() const {
    std::ostringstream oss;
    oss << "CompactUnit{output_level=" << output_level << ", files=" << files.size()
        << ", bytes=" << io::totalFileSize(files) << "}";
    return oss.str();
}

std::optional<CompactUnit> ForceFullCompaction::SelectCompaction(
    int32_t num_levels,
    const std::vector<LevelSortedRun>& runs
) const {
    const int32_t max_level = num_levels - 1;
    if (runs.empty()) return std::nullopt;
    if (runs.size() == 1 && runs.front().level == max_level) return std::nullopt;
    return CompactUnit::fromLevelRuns(max_level, runs);
}

} // namespace lsm
} // namespace lakestore
