// src/lsm/append_compaction_strategy.cpp
#include "../../include/lsm/append_compaction_strategy.h"
#include "../../include/storage_error/storage_error.h"

#include <algorithm>
#include <deque>

namespace lakestore {
namespace lsm {

AppendCompactionStrategy::AppendCompactionStrategy(const AppendCompactionConfig& config)
    : config_(config)
{
    if (!config_.is_valid()) {
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION,
                                    "AppendCompactionStrategy: Invalid configuration - " + config_.to_string());
    }
}

std::vector<io::DataFileMetaPtr> AppendCompactionStrategy::smallFilesOldestFirst(
    const std::vector<LevelSortedRun>& runs
) const {
    std::vector<io::DataFileMetaPtr> files;
    for (const auto& run : runs) {
        for (const auto& f : run.run.files()) {
            if (f->file_size < config_.target_file_size) files.push_back(f);
        }
    }
    std::sort(files.begin(), files.end(), [](const io::DataFileMetaPtr& a, const io::DataFileMetaPtr& b) {
        return a->min_sequence_number < b->min_sequence_number;
    });
    return files;
}

std::optional<CompactUnit> AppendCompactionStrategy::SelectCompaction(
    int32_t /*num_levels*/,
    const std::vector<LevelSortedRun>& runs
) const {
    std::deque<io::DataFileMetaPtr> candidates;
    int64_t total_size = 0;
    for (const auto& file : smallFilesOldestFirst(runs)) {
        candidates.push_back(file);
        total_size += file->file_size;
        const auto count = static_cast<int32_t>(candidates.size());
        if ((total_size >= config_.target_file_size && count >= config_.min_file_num) ||
            count >= config_.max_file_num) {
            return CompactUnit::fromFiles(0, std::vector<io::DataFileMetaPtr>(candidates.begin(), candidates.end()));
        }
        if (total_size >= config_.target_file_size) {
            // Slide the window right by one.
            total_size -= candidates.front()->file_size;
            candidates.pop_front();
        }
    }
    return std::nullopt;
}

std::optional<CompactUnit> AppendCompactionStrategy::SelectFullCompaction(
    const std::vector<LevelSortedRun>& runs
) const {
    auto files = smallFilesOldestFirst(runs);
    if (files.size() < 2) return std::nullopt;
    return CompactUnit::fromFiles(0, std::move(files));
}

} // namespace lsm
} // namespace lakestore
