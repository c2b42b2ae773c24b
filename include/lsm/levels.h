// include/lsm/levels.h
#pragma once

#include "../io/data_file_meta.h"
#include "../storage_error/result.h"

#include <memory>
#include <string>
#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @class SortedRun
 * @brief Files with pairwise disjoint key ranges, ordered by min key.
 */
class SortedRun {
public:
    SortedRun() = default;

    static SortedRun empty() { return SortedRun(); }
    static SortedRun fromSingle(io::DataFileMetaPtr file);
    // Caller guarantees the files are sorted and disjoint.
    static SortedRun fromSorted(std::vector<io::DataFileMetaPtr> files);
    // Sorts by min key; overlapping files are a corruption error.
    static storage::Result<SortedRun> fromUnsorted(std::vector<io::DataFileMetaPtr> files);

    const std::vector<io::DataFileMetaPtr>& files() const { return files_; }
    bool isEmpty() const { return files_.empty(); }
    int64_t totalSize() const { return total_size_; }
    std::string toString() const;

private:
    explicit SortedRun(std::vector<io::DataFileMetaPtr> files);

    std::vector<io::DataFileMetaPtr> files_;
    int64_t total_size_ = 0;
};

struct LevelSortedRun {
    int32_t level = 0;
    SortedRun run;

    LevelSortedRun() = default;
    LevelSortedRun(int32_t l, SortedRun r) : level(l), run(std::move(r)) {}
};

/**
 * @class Levels
 * @brief Immutable per-bucket file layout.
 *
 * Level 0 holds overlapping files ordered newest first (by max sequence
 * number); every level above 0 is one SortedRun. update() returns a new value
 * and leaves this one untouched.
 */
class Levels {
public:
    Levels() = default;

    /**
     * @param num_levels Configured level count; raised to fit the highest
     * level found among `files`.
     */
    static storage::Result<Levels> create(const std::vector<io::DataFileMetaPtr>& files, int32_t num_levels);

    int32_t numberOfLevels() const { return static_cast<int32_t>(levels_.size()) + 1; }
    int32_t maxLevel() const { return numberOfLevels() - 1; }

    const std::vector<io::DataFileMetaPtr>& level0() const { return level0_; }
    const SortedRun& runOfLevel(int32_t level) const;

    int32_t numberOfSortedRuns() const;
    // -1 when the bucket is empty.
    int32_t nonEmptyHighestLevel() const;

    // Every level-0 file as its own run, newest first, then levels 1..max.
    std::vector<LevelSortedRun> levelSortedRuns() const;
    std::vector<io::DataFileMetaPtr> allFiles() const;
    int64_t totalFileSize() const;
    int64_t maxSequenceNumber() const;
    bool isEmpty() const;

    storage::Result<Levels> update(const std::vector<io::DataFileMetaPtr>& before,
                                   const std::vector<io::DataFileMetaPtr>& after) const;

    std::string toString() const;

private:
    std::vector<io::DataFileMetaPtr> level0_;
    // levels_[i] is level i + 1.
    std::vector<SortedRun> levels_;
};

// Level-0 order: newest first.
bool level0Before(const io::DataFileMetaPtr& a, const io::DataFileMetaPtr& b);

} // namespace lsm
} // namespace lakestore
