// include/lsm/universal_compaction_strategy.h
#pragma once

#include "compaction_strategy.h"
#include "../config/core_options.h"

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @struct UniversalCompactionMetricsSnapshot
 * @brief A copyable snapshot of universal compaction metrics.
 */
struct UniversalCompactionMetricsSnapshot {
    uint64_t size_amplification_selected = 0;
    uint64_t size_ratio_selected = 0;
    uint64_t run_count_selected = 0;
    uint64_t selections_without_work = 0;
    uint64_t total_files_selected = 0;
    uint64_t total_bytes_selected = 0;
    double average_selection_time_us = 0.0;
};

/**
 * @struct UniversalCompactionMetrics
 * @brief Thread-safe counters; a strategy instance is shared by all buckets of a table.
 */
struct UniversalCompactionMetrics {
    std::atomic<uint64_t> size_amplification_selected{0};
    std::atomic<uint64_t> size_ratio_selected{0};
    std::atomic<uint64_t> run_count_selected{0};
    std::atomic<uint64_t> selections_without_work{0};
    std::atomic<uint64_t> total_files_selected{0};
    std::atomic<uint64_t> total_bytes_selected{0};
    std::atomic<uint64_t> total_selection_time_us{0};
    std::atomic<uint64_t> selection_calls{0};

    void record_selection_time(std::chrono::microseconds duration) {
        total_selection_time_us.fetch_add(static_cast<uint64_t>(duration.count()), std::memory_order_relaxed);
        selection_calls.fetch_add(1, std::memory_order_relaxed);
    }

    void record_unit(size_t file_count, uint64_t bytes) {
        total_files_selected.fetch_add(file_count, std::memory_order_relaxed);
        total_bytes_selected.fetch_add(bytes, std::memory_order_relaxed);
    }

    double average_selection_time_us() const {
        uint64_t calls = selection_calls.load(std::memory_order_relaxed);
        return calls > 0 ? static_cast<double>(total_selection_time_us.load(std::memory_order_relaxed)) / calls : 0.0;
    }
};

/**
 * @enum CompactionTrigger
 * @brief Why a universal compaction unit was selected. Used for metrics and logging.
 */
enum class CompactionTrigger {
    SIZE_AMPLIFICATION,
    SIZE_RATIO,
    RUN_COUNT
};

/**
 * @struct UniversalCompactionConfig
 * @brief Thresholds of the universal (size-tiered) strategy.
 */
struct UniversalCompactionConfig {
    // Compact everything once the younger runs exceed this percentage of the oldest run.
    int32_t max_size_amplification_percent = 200;
    // A run joins the candidate set while it is at most (100 + ratio)% of the candidate size.
    int32_t size_ratio = 1;
    int32_t num_run_compaction_trigger = 5;

    static UniversalCompactionConfig fromOptions(const CoreOptions& options) {
        UniversalCompactionConfig config;
        config.max_size_amplification_percent = options.max_size_amplification_percent;
        config.size_ratio = options.size_ratio;
        config.num_run_compaction_trigger = options.num_sorted_run_compaction_trigger;
        return config;
    }

    bool is_valid() const {
        return max_size_amplification_percent >= 0 &&
               size_ratio >= 0 &&
               num_run_compaction_trigger >= 1;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "UniversalConfig{size_amp=" << max_size_amplification_percent << "%"
            << ", size_ratio=" << size_ratio << "%"
            << ", run_trigger=" << num_run_compaction_trigger << "}";
        return oss.str();
    }
};

/**
 * @class UniversalCompactionStrategy
 * @brief Size-tiered picking over the sorted runs of one bucket.
 *
 * Checked in order:
 *  1. size amplification: all runs but the oldest together against the oldest;
 *     a hit compacts every run into the highest level.
 *  2. size ratio: starting from the newest run, absorbs the next run while it
 *     is not much larger than everything absorbed so far.
 *  3. run count: beyond the trigger, the surplus runs are compacted
 *     regardless of their sizes, still absorbing by ratio.
 *
 * Units are always a prefix of the runs; see CompactUnit::fromRunPrefix.
 */
class UniversalCompactionStrategy : public CompactionStrategy {
public:
    /**
     * @throws storage::StorageError (INVALID_CONFIGURATION) if `config` is invalid.
     */
    explicit UniversalCompactionStrategy(const UniversalCompactionConfig& config = UniversalCompactionConfig{});

    std::optional<CompactUnit> SelectCompaction(
        int32_t num_levels,
        const std::vector<LevelSortedRun>& runs
    ) const override;

    UniversalCompactionMetricsSnapshot get_metrics() const;
    const UniversalCompactionConfig& get_config() const { return config_; }

private:
    std::optional<CompactUnit> pickForSizeAmp(int32_t max_level, const std::vector<LevelSortedRun>& runs) const;
    std::optional<CompactUnit> pickForSizeRatio(int32_t max_level, const std::vector<LevelSortedRun>& runs) const;
    std::optional<CompactUnit> pickForSizeRatio(int32_t max_level,
                                                const std::vector<LevelSortedRun>& runs,
                                                size_t candidate_count,
                                                bool force_pick) const;

    void recordPick(CompactionTrigger trigger, const CompactUnit& unit) const;

    const UniversalCompactionConfig config_;
    mutable UniversalCompactionMetrics metrics_;
};

} // namespace lsm
} // namespace lakestore
