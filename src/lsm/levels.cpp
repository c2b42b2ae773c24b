// src/lsm/levels.cpp
#include "../../include/lsm/levels.h"
#include "../../include/storage_error/error_utils.h"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace lakestore {
namespace lsm {

bool level0Before(const io::DataFileMetaPtr& a, const io::DataFileMetaPtr& b) {
    if (a->max_sequence_number != b->max_sequence_number) {
        return a->max_sequence_number > b->max_sequence_number;
    }
    if (a->min_sequence_number != b->min_sequence_number) {
        return a->min_sequence_number > b->min_sequence_number;
    }
    if (a->creation_time_millis != b->creation_time_millis) {
        return a->creation_time_millis > b->creation_time_millis;
    }
    return a->file_name < b->file_name;
}

// --- SortedRun ---

SortedRun::SortedRun(std::vector<io::DataFileMetaPtr> files)
    : files_(std::move(files)), total_size_(io::totalFileSize(files_)) {}

SortedRun SortedRun::fromSingle(io::DataFileMetaPtr file) {
    return SortedRun(std::vector<io::DataFileMetaPtr>{std::move(file)});
}

SortedRun SortedRun::fromSorted(std::vector<io::DataFileMetaPtr> files) {
    return SortedRun(std::move(files));
}

storage::Result<SortedRun> SortedRun::fromUnsorted(std::vector<io::DataFileMetaPtr> files) {
    std::sort(files.begin(), files.end(), [](const io::DataFileMetaPtr& a, const io::DataFileMetaPtr& b) {
        return compareRows(a->min_key, b->min_key) < 0;
    });
    for (size_t i = 1; i < files.size(); ++i) {
        if (compareRows(files[i - 1]->max_key, files[i]->min_key) >= 0) {
            return STORAGE_ERROR(storage::ErrorCode::STORAGE_CORRUPTION, "Overlapping files in a sorted run")
                .withDetails(files[i - 1]->toString() + " overlaps " + files[i]->toString());
        }
    }
    return SortedRun(std::move(files));
}

std::string SortedRun::toString() const {
    std::ostringstream oss;
    oss << "SortedRun{files=" << files_.size() << ", size=" << total_size_ << "}";
    return oss.str();
}

// --- Levels ---

storage::Result<Levels> Levels::create(const std::vector<io::DataFileMetaPtr>& files, int32_t num_levels) {
    int32_t highest = 0;
    for (const auto& f : files) {
        if (f->level < 0) {
            return STORAGE_ERROR(storage::ErrorCode::STORAGE_CORRUPTION, "Negative file level")
                .withDetails(f->toString());
        }
        highest = std::max(highest, f->level);
    }
    int32_t levels = std::max(num_levels, highest + 1);
    levels = std::max(levels, 2);

    Levels result;
    std::vector<std::vector<io::DataFileMetaPtr>> by_level(static_cast<size_t>(levels));
    for (const auto& f : files) {
        by_level[static_cast<size_t>(f->level)].push_back(f);
    }
    result.level0_ = std::move(by_level[0]);
    std::sort(result.level0_.begin(), result.level0_.end(), level0Before);
    for (int32_t level = 1; level < levels; ++level) {
        auto run = SortedRun::fromUnsorted(std::move(by_level[static_cast<size_t>(level)]));
        if (!run.isOk()) {
            return std::move(run.error().withContext("level", std::to_string(level)));
        }
        result.levels_.push_back(std::move(run).value());
    }
    return result;
}

const SortedRun& Levels::runOfLevel(int32_t level) const {
    if (level < 1 || level > static_cast<int32_t>(levels_.size())) {
        throw std::out_of_range("Level " + std::to_string(level) + " has no sorted run");
    }
    return levels_[static_cast<size_t>(level - 1)];
}

int32_t Levels::numberOfSortedRuns() const {
    int32_t runs = static_cast<int32_t>(level0_.size());
    for (const auto& run : levels_) {
        if (!run.isEmpty()) runs++;
    }
    return runs;
}

int32_t Levels::nonEmptyHighestLevel() const {
    for (int32_t i = static_cast<int32_t>(levels_.size()) - 1; i >= 0; --i) {
        if (!levels_[static_cast<size_t>(i)].isEmpty()) return i + 1;
    }
    return level0_.empty() ? -1 : 0;
}

std::vector<LevelSortedRun> Levels::levelSortedRuns() const {
    std::vector<LevelSortedRun> runs;
    for (const auto& f : level0_) {
        runs.emplace_back(0, SortedRun::fromSingle(f));
    }
    for (size_t i = 0; i < levels_.size(); ++i) {
        if (!levels_[i].isEmpty()) {
            runs.emplace_back(static_cast<int32_t>(i + 1), levels_[i]);
        }
    }
    return runs;
}

std::vector<io::DataFileMetaPtr> Levels::allFiles() const {
    std::vector<io::DataFileMetaPtr> files;
    for (const auto& run : levelSortedRuns()) {
        files.insert(files.end(), run.run.files().begin(), run.run.files().end());
    }
    return files;
}

int64_t Levels::totalFileSize() const {
    int64_t total = io::totalFileSize(level0_);
    for (const auto& run : levels_) total += run.totalSize();
    return total;
}

int64_t Levels::maxSequenceNumber() const {
    int64_t max_seq = -1;
    for (const auto& f : allFiles()) {
        max_seq = std::max(max_seq, f->max_sequence_number);
    }
    return max_seq;
}

bool Levels::isEmpty() const {
    return nonEmptyHighestLevel() < 0;
}

storage::Result<Levels> Levels::update(const std::vector<io::DataFileMetaPtr>& before,
                                       const std::vector<io::DataFileMetaPtr>& after) const {
    std::set<std::string> removed;
    for (const auto& f : before) removed.insert(f->file_name);

    std::vector<io::DataFileMetaPtr> files;
    size_t matched = 0;
    for (const auto& f : allFiles()) {
        if (removed.count(f->file_name)) {
            matched++;
            continue;
        }
        files.push_back(f);
    }
    if (matched != removed.size()) {
        return STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, "Removing files that are not in the bucket layout")
            .withContext("expected", std::to_string(removed.size()))
            .withContext("found", std::to_string(matched));
    }
    files.insert(files.end(), after.begin(), after.end());
    return create(files, numberOfLevels());
}

std::string Levels::toString() const {
    std::ostringstream oss;
    oss << "Levels{L0=" << level0_.size();
    for (size_t i = 0; i < levels_.size(); ++i) {
        oss << ", L" << (i + 1) << "=" << levels_[i].files().size();
    }
    oss << "}";
    return oss.str();
}

} // namespace lsm
} // namespace lakestore
