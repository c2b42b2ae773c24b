// src/tools/lakestore_admin.cpp
// lakestore-admin <table-path> <command> [options]
//
//   compact [--partition k=v,...] [--bucket N] [--full]
//   expire-snapshots [--retain-min N] [--retain-max N] [--older-than-ms T] [--max-deletes N]
//   remove-orphan-files [--older-than-ms T]
//   compact-manifests
//   snapshots
//   verify

#include "../../include/lakestore.h"
#include "../../include/uuid_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lakestore;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Orphan files younger than this may belong to a writer that has not committed yet.
constexpr int64_t DEFAULT_ORPHAN_AGE_MS = 24LL * 3600 * 1000;

int usage(const std::string& message = "") {
    if (!message.empty()) std::cerr << "Error: " << message << "\n\n";
    std::cerr << "Usage: lakestore-admin <table-path> <command> [options]\n"
              << "Commands:\n"
              << "  compact [--partition k=v,...] [--bucket N] [--full]\n"
              << "  expire-snapshots [--retain-min N] [--retain-max N] [--older-than-ms T] [--max-deletes N]\n"
              << "  remove-orphan-files [--older-than-ms T]\n"
              << "  compact-manifests\n"
              << "  snapshots\n"
              << "  verify\n";
    return EXIT_USAGE;
}

int fail(const std::string& what, const storage::StorageError& error) {
    std::cerr << what << " failed: " << error.toString() << std::endl;
    return EXIT_FAILED;
}

/**
 * @brief Flags of one command. Every flag but the boolean ones takes a value;
 * a flag the command does not know is a usage error.
 */
class CommandArgs {
public:
    CommandArgs(std::vector<std::string> known_valued, std::vector<std::string> known_switches)
        : valued_(std::move(known_valued)), switches_(std::move(known_switches)) {}

    std::optional<std::string> parse(int argc, char* argv[], int first) {
        for (int i = first; i < argc; ++i) {
            std::string flag = argv[i];
            if (contains(switches_, flag)) {
                values_[flag] = "true";
            } else if (contains(valued_, flag)) {
                if (i + 1 >= argc) return "Missing value for " + flag;
                values_[flag] = argv[++i];
            } else {
                return "Unknown option '" + flag + "'";
            }
        }
        return std::nullopt;
    }

    bool has(const std::string& flag) const { return values_.count(flag) > 0; }

    std::optional<std::string> get(const std::string& flag) const {
        auto it = values_.find(flag);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    // Throws std::invalid_argument for a value that is not an integer.
    std::optional<int64_t> getInt(const std::string& flag) const {
        auto text = get(flag);
        if (!text) return std::nullopt;
        size_t consumed = 0;
        int64_t value = std::stoll(*text, &consumed);
        if (consumed != text->size()) throw std::invalid_argument(flag + " expects an integer, got '" + *text + "'");
        return value;
    }

private:
    static bool contains(const std::vector<std::string>& list, const std::string& s) {
        for (const auto& x : list) {
            if (x == s) return true;
        }
        return false;
    }

    std::vector<std::string> valued_;
    std::vector<std::string> switches_;
    std::map<std::string, std::string> values_;
};

// "k1=v1,k2=v2"
std::optional<fs::PartitionSpec> parsePartitionSpec(const std::string& text) {
    fs::PartitionSpec spec;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(',', start);
        if (end == std::string::npos) end = text.size();
        std::string pair = text.substr(start, end - start);
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) return std::nullopt;
        spec[pair.substr(0, eq)] = pair.substr(eq + 1);
        start = end + 1;
    }
    return spec;
}

int runCompact(const std::shared_ptr<table::FileStoreTable>& table, const CommandArgs& args) {
    std::optional<fs::PartitionSpec> partition_filter;
    if (auto text = args.get("--partition")) {
        partition_filter = parsePartitionSpec(*text);
        if (!partition_filter) return usage("--partition expects k=v[,k=v...], got '" + *text + "'");
    }
    std::optional<int64_t> bucket = args.getInt("--bucket");
    const bool full = args.has("--full");

    operation::ScanOptions options;
    options.partition_filter = partition_filter;
    if (bucket) options.bucket = static_cast<int32_t>(*bucket);
    auto plan = table->newScan()->plan(options);
    if (!plan.isOk()) return fail("Planning compaction", plan.error());
    if (!plan.value().snapshot) {
        std::cout << "Table has no snapshot; nothing to compact." << std::endl;
        return EXIT_OK;
    }

    auto coordinator = table->newCompactionCoordinator();
    std::vector<std::shared_future<operation::CompactionOutcome>> pending;
    for (const auto& entry : plan.value().groupByBucket()) {
        operation::CompactionRequest request;
        request.partition = entry.first.first;
        request.bucket = entry.first.second;
        request.full = full;
        pending.push_back(coordinator->submit(std::move(request)));
    }

    int failures = 0;
    int compacted = 0;
    for (auto& future : pending) {
        const operation::CompactionOutcome& outcome = future.get();
        if (!outcome.ok()) {
            failures++;
            std::cerr << "Bucket " << outcome.bucket << " of partition " << rowToString(outcome.partition)
                      << " failed: " << outcome.error->toString() << std::endl;
        } else if (outcome.compacted()) {
            compacted++;
            std::cout << "Bucket " << outcome.bucket << " of partition " << rowToString(outcome.partition)
                      << ": " << outcome.before.size() << " -> " << outcome.after.size()
                      << " file(s), snapshot " << *outcome.snapshot_id << std::endl;
        }
    }
    coordinator->stop();
    std::cout << "Compacted " << compacted << " of " << pending.size() << " bucket(s)" << std::endl;
    return failures == 0 ? EXIT_OK : EXIT_FAILED;
}

int runExpire(const std::shared_ptr<table::FileStoreTable>& table, const CommandArgs& args) {
    snapshot::ExpireConfig config = snapshot::ExpireConfig::fromOptions(table->options());
    if (auto v = args.getInt("--retain-min")) config.retain_min = static_cast<int32_t>(*v);
    if (auto v = args.getInt("--retain-max")) config.retain_max = static_cast<int32_t>(*v);
    if (auto v = args.getInt("--older-than-ms")) config.time_retained = std::chrono::milliseconds(*v);
    if (auto v = args.getInt("--max-deletes")) config.max_deletes = static_cast<int32_t>(*v);

    auto result = table->newExpirer()->expire(config);
    if (!result.isOk()) return fail("Expiring snapshots", result.error());
    std::cout << "Expired " << result.value().expired_snapshots << " snapshot(s), deleted "
              << result.value().deleted_data_files << " data file(s) and "
              << result.value().deleted_manifests << " manifest(s)";
    if (result.value().earliest_retained) {
        std::cout << "; earliest retained snapshot is " << *result.value().earliest_retained;
    }
    std::cout << std::endl;
    return EXIT_OK;
}

int runRemoveOrphans(const std::shared_ptr<table::FileStoreTable>& table, const CommandArgs& args) {
    int64_t age = args.getInt("--older-than-ms").value_or(DEFAULT_ORPHAN_AGE_MS);
    auto result = table->newOrphanFilesCleaner()->clean(currentTimeMillis() - age);
    if (!result.isOk()) return fail("Removing orphan files", result.error());
    for (const auto& path : result.value().deleted_paths) {
        std::cout << "Deleted " << path << "\n";
    }
    std::cout << "Removed " << result.value().deleted_files << " orphan file(s), "
              << result.value().deleted_bytes << " byte(s)" << std::endl;
    return EXIT_OK;
}

int runCompactManifests(const std::shared_ptr<table::FileStoreTable>& table) {
    auto commit = table->newFileStoreCommit("admin-" + generateUuid());
    auto result = commit->compactManifests();
    if (!result.isOk()) return fail("Compacting manifests", result.error());
    if (!result.value()) {
        std::cout << "Table has no snapshot; nothing to compact." << std::endl;
    } else {
        std::cout << "Manifests compacted in snapshot " << *result.value() << std::endl;
    }
    return EXIT_OK;
}

int runSnapshots(const std::shared_ptr<table::FileStoreTable>& table) {
    auto ids = table->snapshotManager()->listSnapshotIds();
    if (!ids.isOk()) return fail("Listing snapshots", ids.error());
    std::cout << "id\tkind\tcommit_user\tidentifier\ttime_millis\ttotal_records\tdelta_records\n";
    for (int64_t id : ids.value()) {
        auto s = table->snapshotManager()->snapshot(id);
        if (!s.isOk()) return fail("Reading snapshot " + std::to_string(id), s.error());
        const snapshot::Snapshot& snap = s.value();
        std::cout << snap.id << '\t' << magic_enum::enum_name(snap.commit_kind) << '\t' << snap.commit_user << '\t'
                  << snap.commit_identifier << '\t' << snap.time_millis << '\t' << snap.total_record_count << '\t'
                  << snap.delta_record_count << '\n';
    }
    std::cout.flush();
    return EXIT_OK;
}

int runVerify(const std::shared_ptr<table::FileStoreTable>& table) {
    auto report = table->newScan()->verifyIntegrity();
    if (!report.isOk()) return fail("Verification", report.error());
    std::cout << "OK: " << report.value().snapshots_checked << " snapshot(s), "
              << report.value().live_files_checked << " live file(s)" << std::endl;
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) return usage();
    const std::string table_path = argv[1];
    const std::string command = argv[2];

    CommandArgs args({}, {});
    if (command == "compact") {
        args = CommandArgs({"--partition", "--bucket"}, {"--full"});
    } else if (command == "expire-snapshots") {
        args = CommandArgs({"--retain-min", "--retain-max", "--older-than-ms", "--max-deletes"}, {});
    } else if (command == "remove-orphan-files") {
        args = CommandArgs({"--older-than-ms"}, {});
    } else if (command != "compact-manifests" && command != "snapshots" && command != "verify") {
        return usage("Unknown command '" + command + "'");
    }
    if (auto error = args.parse(argc, argv, 3)) return usage(*error);

    try {
        auto file_io = std::make_shared<fs::LocalFileIO>();
        auto table = table::FileStoreTable::open(file_io, table_path);
        if (!table.isOk()) return fail("Opening table '" + table_path + "'", table.error());

        if (command == "compact") return runCompact(table.value(), args);
        if (command == "expire-snapshots") return runExpire(table.value(), args);
        if (command == "remove-orphan-files") return runRemoveOrphans(table.value(), args);
        if (command == "compact-manifests") return runCompactManifests(table.value());
        if (command == "snapshots") return runSnapshots(table.value());
        return runVerify(table.value());
    } catch (const storage::StorageError& e) {
        return fail(command, e);
    } catch (const std::invalid_argument& e) {
        return usage(e.what());
    } catch (const std::out_of_range& e) {
        return usage(std::string("Number out of range: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << command << " failed: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}
