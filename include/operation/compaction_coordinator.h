// include/operation/compaction_coordinator.h
#pragma once

#include "file_store_commit.h"
#include "file_store_scan.h"
#include "../lsm/compact_manager.h"
#include "../storage_error/error_context.h"
#include "../threading/thread_pool.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace lakestore {
namespace operation {

/**
 * @struct CompactionRequest
 * @brief Compact one bucket. Without `files` the bucket's strategy picks;
 * `full` rewrites everything into the highest level.
 */
struct CompactionRequest {
    Row partition;
    int32_t bucket = 0;
    std::optional<std::set<std::string>> files;
    bool full = false;

    std::string toString() const;
};

enum class CompactionState {
    IDLE,
    PICKING,
    REWRITING,
    COMMITTING
};

struct CompactionOutcome {
    Row partition;
    int32_t bucket = 0;
    // Set when a COMPACT snapshot was committed.
    std::optional<int64_t> snapshot_id;
    int32_t attempts = 0;
    std::vector<io::DataFileMetaPtr> before;
    std::vector<io::DataFileMetaPtr> after;
    std::optional<storage::StorageError> error;

    bool ok() const { return !error.has_value(); }
    bool compacted() const { return snapshot_id.has_value(); }
    std::string toString() const;
};

struct CompactionCoordinatorConfig {
    size_t num_threads = 2;
    int32_t max_attempts = 3;
    // Every N-th notification of new files for a bucket asks for a full compaction.
    std::optional<int32_t> full_compaction_delta_commits;
    int32_t num_levels = 6;
    int32_t total_buckets = 1;

    static CompactionCoordinatorConfig fromOptions(const CoreOptions& options, size_t num_threads = 2) {
        CompactionCoordinatorConfig config;
        config.num_threads = num_threads;
        config.max_attempts = options.compaction_max_attempts;
        config.full_compaction_delta_commits = options.full_compaction_delta_commits;
        config.num_levels = options.num_levels;
        config.total_buckets = options.bucket;
        return config;
    }

    bool is_valid() const {
        return num_threads > 0 && max_attempts >= 1 && num_levels >= 2 && total_buckets >= 1 &&
               (!full_compaction_delta_commits || *full_compaction_delta_commits >= 1);
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CompactionCoordinatorConfig{threads=" << num_threads
            << ", max_attempts=" << max_attempts
            << ", full_every=" << (full_compaction_delta_commits ? std::to_string(*full_compaction_delta_commits)
                                                                 : std::string("never"))
            << ", levels=" << num_levels << "}";
        return oss.str();
    }
};

struct CompactionMetricsSnapshot {
    uint64_t submitted = 0;
    uint64_t coalesced = 0;
    uint64_t committed = 0;
    uint64_t nothing_to_do = 0;
    uint64_t failed = 0;
    uint64_t conflicts = 0;
    uint64_t files_in = 0;
    uint64_t files_out = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
};

/**
 * @brief What the coordinator needs from its table.
 */
struct CompactionEnvironment {
    std::shared_ptr<const snapshot::SnapshotManager> snapshot_manager;
    std::shared_ptr<const FileStoreScan> scan;
    std::shared_ptr<fs::FileIO> file_io;
    std::function<std::unique_ptr<lsm::CompactManager>(const Row& partition, int32_t bucket)> compact_manager_factory;
    std::function<std::unique_ptr<FileStoreCommit>(const std::string& commit_user)> commit_factory;
};

/**
 * @class CompactionCoordinator
 * @brief Runs bucket compactions in the background and commits their output
 * as COMPACT snapshots under its own commit user.
 *
 * At most one task per bucket runs at a time. A request for a busy bucket is
 * folded into a single follow-up run that starts when the current one ends;
 * all requests folded into it share its outcome. Each run plans against the
 * latest snapshot; on a commit conflict its output is deleted and it plans
 * again, up to `max_attempts` times.
 */
class CompactionCoordinator {
public:
    using BeforeCommitHook = FileStoreCommit::BeforeCommitHook;

    /**
     * @throws storage::StorageError (INVALID_CONFIGURATION) if `config` is invalid.
     */
    CompactionCoordinator(CompactionEnvironment environment, CompactionCoordinatorConfig config);
    ~CompactionCoordinator();

    CompactionCoordinator(const CompactionCoordinator&) = delete;
    CompactionCoordinator& operator=(const CompactionCoordinator&) = delete;

    std::shared_future<CompactionOutcome> submit(CompactionRequest request);

    // Submits and waits.
    CompactionOutcome runNow(CompactionRequest request);

    /**
     * @brief Tells the coordinator that a commit added files to a bucket.
     * Schedules a strategy pick, or a full compaction on the configured cadence.
     */
    void notifyNewFiles(const Row& partition, int32_t bucket);

    // Blocks until no bucket has a running or pending task.
    void waitForIdle();

    CompactionState state(const Row& partition, int32_t bucket) const;
    CompactionMetricsSnapshot metrics() const;
    const storage::ErrorContext& errors() const { return errors_; }
    const std::string& commitUser() const { return commit_user_; }

    // Applied to every commit this coordinator makes.
    void setBeforeCommitHook(BeforeCommitHook hook);

    // Drains queued tasks and joins the workers.
    void stop();

private:
    struct PendingRun {
        CompactionRequest request;
        threading::TaskPriority priority = threading::TaskPriority::NORMAL;
        std::shared_ptr<std::promise<CompactionOutcome>> promise;
        std::shared_future<CompactionOutcome> future;
    };

    struct BucketSlot {
        CompactionState state = CompactionState::IDLE;
        bool running = false;
        std::optional<PendingRun> pending;
        int32_t notifications = 0;
    };

    // Notification-driven picks queue behind explicit requests.
    std::shared_future<CompactionOutcome> enqueue(CompactionRequest request, threading::TaskPriority priority);
    void schedule(PendingRun run);
    void runTask(PendingRun run);
    CompactionOutcome runBucket(const CompactionRequest& request);
    CompactionOutcome attempt(const CompactionRequest& request, int32_t attempt_number, bool& retry);
    void setState(const BucketKey& key, CompactionState state);

    static void foldInto(CompactionRequest& target, const CompactionRequest& extra);

    CompactionEnvironment env_;
    const CompactionCoordinatorConfig config_;
    const std::string commit_user_;
    std::atomic<int64_t> next_identifier_{0};

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<BucketKey, BucketSlot, BucketKeyLess> slots_;
    size_t in_flight_ = 0;
    BeforeCommitHook before_commit_hook_;

    storage::ErrorContext errors_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> coalesced_{0};
    std::atomic<uint64_t> committed_{0};
    std::atomic<uint64_t> nothing_to_do_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> files_in_{0};
    std::atomic<uint64_t> files_out_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> bytes_out_{0};

    // Last member: workers stop before anything they use is destroyed.
    threading::ThreadPool pool_;
};

} // namespace operation
} // namespace lakestore
