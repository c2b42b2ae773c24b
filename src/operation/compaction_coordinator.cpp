// src/operation/compaction_coordinator.cpp
#include "../../include/operation/compaction_coordinator.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"
#include "../../include/uuid_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace lakestore {
namespace operation {

std::string CompactionRequest::toString() const {
    std::ostringstream oss;
    oss << "CompactionRequest{partition=" << rowToString(partition) << ", bucket=" << bucket;
    if (files) oss << ", files=" << files->size();
    if (full) oss << ", full";
    oss << "}";
    return oss.str();
}

std::string CompactionOutcome::toString() const {
    std::ostringstream oss;
    oss << "CompactionOutcome{partition=" << rowToString(partition) << ", bucket=" << bucket
        << ", attempts=" << attempts;
    if (snapshot_id) oss << ", snapshot=" << *snapshot_id;
    oss << ", before=" << before.size() << ", after=" << after.size();
    if (error) oss << ", error=" << error->toString();
    oss << "}";
    return oss.str();
}

namespace {

int64_t totalSize(const std::vector<io::DataFileMetaPtr>& files) {
    int64_t size = 0;
    for (const auto& f : files) size += f->file_size;
    return size;
}

} // namespace

CompactionCoordinator::CompactionCoordinator(CompactionEnvironment environment, CompactionCoordinatorConfig config)
    : env_(std::move(environment)),
      config_(std::move(config)),
      commit_user_("compaction-" + generateUuid()),
      pool_(config_.num_threads > 0 ? config_.num_threads : 1, "Compaction") {
    if (!config_.is_valid() || !env_.snapshot_manager || !env_.scan || !env_.file_io ||
        !env_.compact_manager_factory || !env_.commit_factory) {
        pool_.stop();
        throw storage::StorageError(storage::ErrorCode::INVALID_CONFIGURATION,
            "CompactionCoordinator: Invalid configuration - " + config_.to_string());
    }
    // Identifiers of one commit user must grow across coordinator restarts too.
    next_identifier_.store(currentTimeMillis());
    LOG_INFO("[CompactionCoordinator] Started as ", commit_user_, " with ", config_.to_string());
}

CompactionCoordinator::~CompactionCoordinator() {
    stop();
}

void CompactionCoordinator::stop() {
    pool_.stop();
}

void CompactionCoordinator::setBeforeCommitHook(BeforeCommitHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    before_commit_hook_ = std::move(hook);
}

void CompactionCoordinator::foldInto(CompactionRequest& target, const CompactionRequest& extra) {
    target.full = target.full || extra.full;
    if (target.files && extra.files) {
        target.files->insert(extra.files->begin(), extra.files->end());
    } else {
        // Either side lets the strategy pick; the strategy sees every file anyway.
        target.files.reset();
    }
}

std::shared_future<CompactionOutcome> CompactionCoordinator::submit(CompactionRequest request) {
    return enqueue(std::move(request), threading::TaskPriority::NORMAL);
}

std::shared_future<CompactionOutcome> CompactionCoordinator::enqueue(CompactionRequest request,
                                                                     threading::TaskPriority priority) {
    submitted_.fetch_add(1, std::memory_order_relaxed);
    BucketKey key(request.partition, request.bucket);

    std::unique_lock<std::mutex> lock(mutex_);
    BucketSlot& slot = slots_[key];
    if (slot.running) {
        coalesced_.fetch_add(1, std::memory_order_relaxed);
        if (slot.pending) {
            foldInto(slot.pending->request, request);
            slot.pending->priority = std::min(slot.pending->priority, priority);
            LOG_TRACE("[CompactionCoordinator] Folded ", request.toString(), " into pending run");
            return slot.pending->future;
        }
        PendingRun run;
        run.request = std::move(request);
        run.priority = priority;
        run.promise = std::make_shared<std::promise<CompactionOutcome>>();
        run.future = run.promise->get_future().share();
        slot.pending = run;
        return run.future;
    }

    PendingRun run;
    run.request = std::move(request);
    run.priority = priority;
    run.promise = std::make_shared<std::promise<CompactionOutcome>>();
    run.future = run.promise->get_future().share();
    slot.running = true;
    slot.state = CompactionState::PICKING;
    ++in_flight_;
    auto future = run.future;
    lock.unlock();

    schedule(std::move(run));
    return future;
}

void CompactionCoordinator::schedule(PendingRun run) {
    auto shared_run = std::make_shared<PendingRun>(std::move(run));
    bool accepted = pool_.schedule([this, shared_run]() { runTask(std::move(*shared_run)); }, shared_run->priority);
    if (accepted) return;

    // Pool is stopping: fail the run and every request folded behind it.
    storage::StorageError error(storage::ErrorCode::INTERNAL_ERROR, "Compaction coordinator is stopped");
    CompactionOutcome outcome;
    outcome.partition = shared_run->request.partition;
    outcome.bucket = shared_run->request.bucket;
    outcome.error = error;
    shared_run->promise->set_value(outcome);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(BucketKey(outcome.partition, outcome.bucket));
    if (it != slots_.end()) {
        if (it->second.pending) {
            it->second.pending->promise->set_value(outcome);
            it->second.pending.reset();
        }
        it->second.running = false;
        it->second.state = CompactionState::IDLE;
    }
    --in_flight_;
    idle_cv_.notify_all();
}

void CompactionCoordinator::runTask(PendingRun run) {
    CompactionOutcome outcome;
    try {
        outcome = runBucket(run.request);
    } catch (const storage::StorageError& e) {
        outcome.partition = run.request.partition;
        outcome.bucket = run.request.bucket;
        outcome.error = e;
    } catch (const std::exception& e) {
        outcome.partition = run.request.partition;
        outcome.bucket = run.request.bucket;
        outcome.error = STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (outcome.error) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        errors_.reportError(*outcome.error);
        LOG_ERROR("[CompactionCoordinator] ", run.request.toString(), " failed: ", outcome.error->toString());
    } else if (outcome.compacted()) {
        committed_.fetch_add(1, std::memory_order_relaxed);
        files_in_.fetch_add(outcome.before.size(), std::memory_order_relaxed);
        files_out_.fetch_add(outcome.after.size(), std::memory_order_relaxed);
        bytes_in_.fetch_add(static_cast<uint64_t>(totalSize(outcome.before)), std::memory_order_relaxed);
        bytes_out_.fetch_add(static_cast<uint64_t>(totalSize(outcome.after)), std::memory_order_relaxed);
    } else {
        nothing_to_do_.fetch_add(1, std::memory_order_relaxed);
    }
    run.promise->set_value(outcome);

    BucketKey key(run.request.partition, run.request.bucket);
    std::optional<PendingRun> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        BucketSlot& slot = slots_[key];
        if (slot.pending) {
            next = std::move(slot.pending);
            slot.pending.reset();
            slot.state = CompactionState::PICKING;
        } else {
            slot.running = false;
            slot.state = CompactionState::IDLE;
            --in_flight_;
            idle_cv_.notify_all();
        }
    }
    if (next) schedule(std::move(*next));
}

void CompactionCoordinator::setState(const BucketKey& key, CompactionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[key].state = state;
    LOG_TRACE("[CompactionCoordinator] Bucket ", key.second, " of partition ", rowToString(key.first), " -> ",
              magic_enum::enum_name(state));
}

CompactionOutcome CompactionCoordinator::runBucket(const CompactionRequest& request) {
    CompactionOutcome outcome;
    for (int32_t attempt_number = 1; attempt_number <= config_.max_attempts; ++attempt_number) {
        bool retry = false;
        outcome = attempt(request, attempt_number, retry);
        outcome.attempts = attempt_number;
        if (!retry) return outcome;
        conflicts_.fetch_add(1, std::memory_order_relaxed);
    }
    return outcome;
}

CompactionOutcome CompactionCoordinator::attempt(const CompactionRequest& request, int32_t attempt_number, bool& retry) {
    retry = false;
    BucketKey key(request.partition, request.bucket);
    CompactionOutcome outcome;
    outcome.partition = request.partition;
    outcome.bucket = request.bucket;

    setState(key, CompactionState::PICKING);
    ScanOptions options;
    options.partition = request.partition;
    options.bucket = request.bucket;
    auto plan = env_.scan->plan(options);
    if (!plan.isOk()) {
        outcome.error = plan.error();
        return outcome;
    }
    if (!plan.value().snapshot) {
        LOG_TRACE("[CompactionCoordinator] Table is empty, nothing to compact");
        return outcome;
    }

    auto levels = lsm::Levels::create(plan.value().files(), config_.num_levels);
    if (!levels.isOk()) {
        outcome.error = std::move(levels.error()
            .withContext("snapshot", std::to_string(plan.value().snapshot->id)));
        return outcome;
    }

    std::unique_ptr<lsm::CompactManager> manager = env_.compact_manager_factory(request.partition, request.bucket);
    std::optional<lsm::CompactUnit> unit = request.files
        ? manager->pickFiles(levels.value(), *request.files)
        : manager->pick(levels.value(), request.full);
    if (!unit || unit->files.empty()) {
        LOG_DEBUG(DEBUG, "[CompactionCoordinator] Nothing to compact for ", request.toString(),
                  " at snapshot ", plan.value().snapshot->id);
        return outcome;
    }

    setState(key, CompactionState::REWRITING);
    auto rewritten = manager->rewrite(levels.value(), *unit);
    if (!rewritten.isOk()) {
        outcome.error = std::move(rewritten.error().withContext("unit", unit->toString()));
        return outcome;
    }
    lsm::CompactResult result = std::move(rewritten).value();
    if (result.isEmpty()) return outcome;

    setState(key, CompactionState::COMMITTING);
    CommitMessage message;
    message.partition = request.partition;
    message.bucket = request.bucket;
    message.total_buckets = config_.total_buckets;
    message.compact_before = result.before;
    message.compact_after = result.after;
    ManifestCommittable committable(next_identifier_.fetch_add(1), std::nullopt);
    committable.addMessage(std::move(message));

    std::unique_ptr<FileStoreCommit> commit = env_.commit_factory(commit_user_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (before_commit_hook_) commit->setBeforeCommitHook(before_commit_hook_);
    }
    auto committed = commit->commit(committable);
    if (committed.isOk()) {
        outcome.snapshot_id = committed.value();
        outcome.before = std::move(result.before);
        outcome.after = std::move(result.after);
        LOG_INFO("[CompactionCoordinator] Committed snapshot ", committed.value(), " for bucket ", request.bucket,
                 " of partition ", rowToString(request.partition), ": ", outcome.before.size(), " -> ",
                 outcome.after.size(), " file(s)");
        return outcome;
    }

    const storage::StorageError& error = committed.error();
    if (classifyCommitFailure(error) == CommitFailureKind::CONFLICT) {
        // The output was never referenced by a snapshot.
        const auto& paths = env_.snapshot_manager->pathFactory();
        for (const auto& file : result.after) {
            auto deleted = env_.file_io->deleteFile(paths.dataFilePath(*file));
            if (!deleted.isOk()) {
                LOG_WARN("[CompactionCoordinator] Could not delete unused output ", file->file_name, ": ",
                         deleted.error().toString());
            }
        }
        LOG_WARN("[CompactionCoordinator] Attempt ", attempt_number, " of ", request.toString(),
                 " lost to a concurrent commit: ", error.message);
        retry = attempt_number < config_.max_attempts;
        outcome.error = error;
        return outcome;
    }

    // Outcome unknown: the output may be referenced, so it stays for orphan cleanup.
    outcome.error = error;
    return outcome;
}

CompactionOutcome CompactionCoordinator::runNow(CompactionRequest request) {
    return submit(std::move(request)).get();
}

void CompactionCoordinator::notifyNewFiles(const Row& partition, int32_t bucket) {
    CompactionRequest request;
    request.partition = partition;
    request.bucket = bucket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        BucketSlot& slot = slots_[BucketKey(partition, bucket)];
        slot.notifications++;
        if (config_.full_compaction_delta_commits &&
            slot.notifications >= *config_.full_compaction_delta_commits) {
            slot.notifications = 0;
            request.full = true;
        }
    }
    LOG_TRACE("[CompactionCoordinator] New files in bucket ", bucket, ", scheduling ",
              request.full ? "full" : "strategy", " compaction");
    enqueue(std::move(request), threading::TaskPriority::LOW);
}

void CompactionCoordinator::waitForIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

CompactionState CompactionCoordinator::state(const Row& partition, int32_t bucket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(BucketKey(partition, bucket));
    return it == slots_.end() ? CompactionState::IDLE : it->second.state;
}

CompactionMetricsSnapshot CompactionCoordinator::metrics() const {
    CompactionMetricsSnapshot snapshot;
    snapshot.submitted = submitted_.load(std::memory_order_relaxed);
    snapshot.coalesced = coalesced_.load(std::memory_order_relaxed);
    snapshot.committed = committed_.load(std::memory_order_relaxed);
    snapshot.nothing_to_do = nothing_to_do_.load(std::memory_order_relaxed);
    snapshot.failed = failed_.load(std::memory_order_relaxed);
    snapshot.conflicts = conflicts_.load(std::memory_order_relaxed);
    snapshot.files_in = files_in_.load(std::memory_order_relaxed);
    snapshot.files_out = files_out_.load(std::memory_order_relaxed);
    snapshot.bytes_in = bytes_in_.load(std::memory_order_relaxed);
    snapshot.bytes_out = bytes_out_.load(std::memory_order_relaxed);
    return snapshot;
}

} // namespace operation
} // namespace lakestore
