// src/lsm/universal_compaction_strategy.cpp
#include "../../include/lsm/universal_compaction_strategy.h"
#include "../../include/debug_utils.h"
#include "../../include/storage_error/storage_error.h"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace lakestore {
namespace lsm {

UniversalCompactionStrategy::UniversalCompactionStrategy(const UniversalCompactionConfig& config)
    : config_(config)
{
    if (!config_.is_valid()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION,
                                    "UniversalCompactionStrategy: Invalid configuration - " + config_.to_string());
    }
    LOG_TRACE("[UniversalStrategy] Created with config: ", config_.to_string());
}

std::optional<CompactUnit> UniversalCompactionStrategy::SelectCompaction(
    int32_t num_levels,
    const std::vector<LevelSortedRun>& runs
) const {
    auto start_time = std::chrono::steady_clock::now();
    const int32_t max_level = num_levels - 1;

    std::optional<CompactUnit> result;
    CompactionTrigger trigger = CompactionTrigger::SIZE_AMPLIFICATION;

    if (auto unit = pickForSizeAmp(max_level, runs)) {
        result = std::move(unit);
        trigger = CompactionTrigger::SIZE_AMPLIFICATION;
    } else if (auto ratio_unit = pickForSizeRatio(max_level, runs)) {
        result = std::move(ratio_unit);
        trigger = CompactionTrigger::SIZE_RATIO;
    } else if (runs.size() > static_cast<size_t>(config_.num_run_compaction_trigger)) {
        // Surplus runs are compacted whatever their sizes.
        size_t candidate_count = runs.size() - static_cast<size_t>(config_.num_run_compaction_trigger) + 1;
        result = pickForSizeRatio(max_level, runs, candidate_count, true);
        trigger = CompactionTrigger::RUN_COUNT;
    }

    if (result) {
        recordPick(trigger, *result);
    } else {
        metrics_.selections_without_work.fetch_add(1, std::memory_order_relaxed);
    }
    metrics_.record_selection_time(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time));
    return result;
}

std::optional<CompactUnit> UniversalCompactionStrategy::pickForSizeAmp(
    int32_t max_level,
    const std::vector<LevelSortedRun>& runs
) const {
    if (runs.size() < static_cast<size_t>(config_.num_run_compaction_trigger) || runs.size() < 2) {
        return std::nullopt;
    }
    int64_t candidate_size = 0;
    for (size_t i = 0; i + 1 < runs.size(); ++i) {
        candidate_size += runs[i].run.totalSize();
    }
    int64_t earliest_run_size = runs.back().run.totalSize();

    // size amplification = percentage of additional size
    if (candidate_size * 100 > static_cast<int64_t>(config_.max_size_amplification_percent) * earliest_run_size) {
        return CompactUnit::fromLevelRuns(max_level, runs);
    }
    return std::nullopt;
}

std::optional<CompactUnit> UniversalCompactionStrategy::pickForSizeRatio(
    int32_t max_level,
    const std::vector<LevelSortedRun>& runs
) const {
    if (runs.size() < static_cast<size_t>(config_.num_run_compaction_trigger)) {
        return std::nullopt;
    }
    return pickForSizeRatio(max_level, runs, 1, false);
}

std::optional<CompactUnit> UniversalCompactionStrategy::pickForSizeRatio(
    int32_t max_level,
    const std::vector<LevelSortedRun>& runs,
    size_t candidate_count,
    bool force_pick
) const {
    candidate_count = std::min(candidate_count, runs.size());
    int64_t candidate_size = 0;
    for (size_t i = 0; i < candidate_count; ++i) {
        candidate_size += runs[i].run.totalSize();
    }

    for (size_t i = candidate_count; i < runs.size(); ++i) {
        const auto& next = runs[i];
        if (static_cast<double>(candidate_size) * (100.0 + config_.size_ratio) / 100.0 <
            static_cast<double>(next.run.totalSize())) {
            break;
        }
        candidate_size += next.run.totalSize();
        candidate_count++;
    }

    if (force_pick || candidate_count > 1) {
        return CompactUnit::fromRunPrefix(runs, max_level, candidate_count);
    }
    return std::nullopt;
}

void UniversalCompactionStrategy::recordPick(CompactionTrigger trigger, const CompactUnit& unit) const {
    switch (trigger) {
        case CompactionTrigger::SIZE_AMPLIFICATION:
            metrics_.size_amplification_selected.fetch_add(1, std::memory_order_relaxed);
            break;
        case CompactionTrigger::SIZE_RATIO:
            metrics_.size_ratio_selected.fetch_add(1, std::memory_order_relaxed);
            break;
        case CompactionTrigger::RUN_COUNT:
            metrics_.run_count_selected.fetch_add(1, std::memory_order_relaxed);
            break;
    }
    metrics_.record_unit(unit.files.size(), static_cast<uint64_t>(io::totalFileSize(unit.files)));
    LOG_TRACE("[UniversalStrategy] Picked ", unit.toString(), " trigger=", magic_enum::enum_name(trigger));
}

UniversalCompactionMetricsSnapshot UniversalCompactionStrategy::get_metrics() const {
    UniversalCompactionMetricsSnapshot snapshot;
    snapshot.size_amplification_selected = metrics_.size_amplification_selected.load(std::memory_order_relaxed);
    snapshot.size_ratio_selected = metrics_.size_ratio_selected.load(std::memory_order_relaxed);
    snapshot.run_count_selected = metrics_.run_count_selected.load(std::memory_order_relaxed);
    snapshot.selections_without_work = metrics_.selections_without_work.load(std::memory_order_relaxed);
    snapshot.total_files_selected = metrics_.total_files_selected.load(std::memory_order_relaxed);
    snapshot.total_bytes_selected = metrics_.total_bytes_selected.load(std::memory_order_relaxed);
    snapshot.average_selection_time_us = metrics_.average_selection_time_us();
    return snapshot;
}

} // namespace lsm
} // namespace lakestore
