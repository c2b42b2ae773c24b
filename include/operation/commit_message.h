// include/operation/commit_message.h
#pragma once

#include "../io/data_file_meta.h"

#include <optional>
#include <string>
#include <vector>

namespace lakestore {
namespace operation {

/**
 * @struct CommitMessage
 * @brief File changes of one bucket, produced by a writer or a compaction.
 *
 * `new_files` and `compact_after` become ADD entries; `compact_before`
 * becomes DELETE entries.
 */
struct CommitMessage {
    Row partition;
    int32_t bucket = 0;
    int32_t total_buckets = 1;
    std::vector<io::DataFileMetaPtr> new_files;
    std::vector<io::DataFileMetaPtr> compact_before;
    std::vector<io::DataFileMetaPtr> compact_after;

    bool isEmpty() const {
        return new_files.empty() && compact_before.empty() && compact_after.empty();
    }
    std::string toString() const;
};

/**
 * @struct ManifestCommittable
 * @brief Everything one commit identifier carries. (commit user, identifier)
 * is the idempotency key of the commit.
 */
struct ManifestCommittable {
    int64_t identifier = 0;
    std::optional<int64_t> watermark;
    std::vector<CommitMessage> messages;

    ManifestCommittable() = default;
    explicit ManifestCommittable(int64_t id, std::optional<int64_t> wm = std::nullopt)
        : identifier(id), watermark(wm) {}

    void addMessage(CommitMessage message) { messages.push_back(std::move(message)); }
};

} // namespace operation
} // namespace lakestore
