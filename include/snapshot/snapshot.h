// include/snapshot/snapshot.h
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lakestore {
namespace snapshot {

enum class CommitKind : uint8_t {
    APPEND    = 0, // New data files only.
    COMPACT   = 1, // Files replaced without changing table content.
    OVERWRITE = 2  // Partitions replaced wholesale.
};

/**
 * @struct Snapshot
 * @brief One committed table version.
 *
 * The live file set is the replay of base_manifest_list followed by
 * delta_manifest_list. (commit_user, commit_identifier) is the idempotency key
 * of the commit that produced it.
 */
struct Snapshot {
    static constexpr int32_t CURRENT_VERSION = 1;
    static constexpr int64_t FIRST_SNAPSHOT_ID = 1;

    int32_t version = CURRENT_VERSION;
    int64_t id = 0;
    int64_t schema_id = 0;
    std::string base_manifest_list;
    std::string delta_manifest_list;
    std::string commit_user;
    int64_t commit_identifier = 0;
    CommitKind commit_kind = CommitKind::APPEND;
    int64_t time_millis = 0;
    int64_t total_record_count = 0;
    int64_t delta_record_count = 0;
    std::optional<int64_t> watermark;
    std::optional<int64_t> previous_snapshot_id;

    std::string toString() const;
};

std::string commitKindToString(CommitKind kind);

} // namespace snapshot
} // namespace lakestore
