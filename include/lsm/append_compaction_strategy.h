// include/lsm/append_compaction_strategy.h
#pragma once

#include "compaction_strategy.h"
#include "../config/core_options.h"

#include <sstream>
#include <string>

namespace lakestore {
namespace lsm {

struct AppendCompactionConfig {
    int32_t min_file_num = 5;
    int32_t max_file_num = 50;
    // Files at least this large are left alone.
    int64_t target_file_size = 128LL * 1024 * 1024;

    static AppendCompactionConfig fromOptions(const CoreOptions& options) {
        AppendCompactionConfig config;
        config.min_file_num = options.compaction_min_file_num;
        config.max_file_num = options.compaction_max_file_num;
        config.target_file_size = options.target_file_size;
        return config;
    }

    bool is_valid() const {
        return min_file_num >= 1 && max_file_num >= min_file_num && target_file_size > 0;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "AppendConfig{file_num=" << min_file_num << "-" << max_file_num
            << ", target_file_size=" << target_file_size << "}";
        return oss.str();
    }
};

/**
 * @class AppendCompactionStrategy
 * @brief Concatenates small files of an append-only bucket.
 *
 * Append files all live on level 0 and carry insertion order in their
 * sequence numbers, so candidates are taken oldest first and only as a
 * contiguous window: a window is picked once it holds `min_file_num` files
 * totalling the target size, or `max_file_num` files whatever their size.
 */
class AppendCompactionStrategy : public CompactionStrategy {
public:
    /**
     * @throws storage::StorageError (INVALID_CONFIGURATION) if `config` is invalid.
     */
    explicit AppendCompactionStrategy(const AppendCompactionConfig& config);

    std::optional<CompactUnit> SelectCompaction(
        int32_t num_levels,
        const std::vector<LevelSortedRun>& runs
    ) const override;

    // Every small file, as long as there are at least two of them.
    std::optional<CompactUnit> SelectFullCompaction(const std::vector<LevelSortedRun>& runs) const;

    const AppendCompactionConfig& get_config() const { return config_; }

private:
    std::vector<io::DataFileMetaPtr> smallFilesOldestFirst(const std::vector<LevelSortedRun>& runs) const;

    const AppendCompactionConfig config_;
};

} // namespace lsm
} // namespace lakestore
