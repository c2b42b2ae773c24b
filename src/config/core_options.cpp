// src/config/core_options.cpp
#include "../../include/config/core_options.h"
#include "../../include/compression_utils.h"
#include "../../include/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lakestore {

namespace {
    const char* const FIELDS_PREFIX = "fields.";
    const char* const AGG_FUNCTION_SUFFIX = ".aggregate-function";
    const char* const LIST_AGG_DELIMITER_SUFFIX = ".list-agg-delimiter";

    std::string trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Splits "64 mb" / "64mb" into number and unit.
    bool splitNumberUnit(const std::string& text, int64_t* number, std::string* unit) {
        std::string t = trim(text);
        size_t i = 0;
        while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
        if (i == 0) return false;
        try {
            *number = std::stoll(t.substr(0, i));
        } catch (const std::exception&) {
            return false;
        }
        *unit = lower(trim(t.substr(i)));
        return true;
    }

    storage::StorageError badOption(const std::string& key, const std::string& value, const std::string& expected) {
        return storage::StorageError::invalidConfiguration("Option '" + key + "' has invalid value '" + value + "'")
            .withContext("option", key)
            .withContext("expected", expected);
    }

    class OptionReader {
    public:
        explicit OptionReader(const std::map<std::string, std::string>& options) : options_(options) {}

        std::optional<std::string> raw(const std::string& key) const {
            auto it = options_.find(key);
            if (it == options_.end()) return std::nullopt;
            return it->second;
        }

        void readInt(const std::string& key, int32_t* out, int64_t min_value) const {
            auto v = raw(key);
            if (!v) return;
            int64_t parsed;
            try {
                size_t pos = 0;
                parsed = std::stoll(trim(*v), &pos);
                if (pos != trim(*v).size()) throw std::invalid_argument("trailing characters");
            } catch (const std::exception&) {
                throw badOption(key, *v, "an integer");
            }
            if (parsed < min_value || parsed > 2147483647LL) {
                throw badOption(key, *v, "an integer >= " + std::to_string(min_value));
            }
            *out = static_cast<int32_t>(parsed);
        }

        void readMemory(const std::string& key, int64_t* out) const {
            auto v = raw(key);
            if (!v) return;
            auto parsed = parseMemorySize(*v);
            if (!parsed || *parsed <= 0) {
                throw badOption(key, *v, "a positive memory size such as '64 mb'");
            }
            *out = *parsed;
        }

        void readDuration(const std::string& key, std::chrono::milliseconds* out) const {
            auto v = raw(key);
            if (!v) return;
            auto parsed = parseDuration(*v);
            if (!parsed) {
                throw badOption(key, *v, "a duration such as '10 s'");
            }
            *out = *parsed;
        }

        void readBool(const std::string& key, bool* out) const {
            auto v = raw(key);
            if (!v) return;
            std::string l = lower(trim(*v));
            if (l == "true") {
                *out = true;
            } else if (l == "false") {
                *out = false;
            } else {
                throw badOption(key, *v, "true or false");
            }
        }

        void readCompression(const std::string& key, CompressionType* out) const {
            auto v = raw(key);
            if (!v) return;
            auto parsed = compressionTypeFromString(trim(*v));
            if (!parsed) {
                throw badOption(key, *v, "one of none, zstd, lz4");
            }
            *out = *parsed;
        }

    private:
        const std::map<std::string, std::string>& options_;
    };
}

std::string mergeEngineToString(MergeEngine engine) {
    switch (engine) {
        case MergeEngine::DEDUPLICATE:    return "deduplicate";
        case MergeEngine::PARTIAL_UPDATE: return "partial-update";
        case MergeEngine::AGGREGATE:      return "aggregation";
        case MergeEngine::FIRST_ROW:      return "first-row";
    }
    return "unknown";
}

std::optional<MergeEngine> mergeEngineFromString(const std::string& name) {
    std::string l = lower(trim(name));
    if (l == "deduplicate") return MergeEngine::DEDUPLICATE;
    if (l == "partial-update") return MergeEngine::PARTIAL_UPDATE;
    if (l == "aggregation") return MergeEngine::AGGREGATE;
    if (l == "first-row") return MergeEngine::FIRST_ROW;
    return std::nullopt;
}

std::optional<int64_t> parseMemorySize(const std::string& text) {
    int64_t number;
    std::string unit;
    if (!splitNumberUnit(text, &number, &unit)) return std::nullopt;
    int64_t multiplier;
    if (unit.empty() || unit == "b" || unit == "bytes") {
        multiplier = 1;
    } else if (unit == "k" || unit == "kb") {
        multiplier = 1024LL;
    } else if (unit == "m" || unit == "mb") {
        multiplier = 1024LL * 1024;
    } else if (unit == "g" || unit == "gb") {
        multiplier = 1024LL * 1024 * 1024;
    } else {
        return std::nullopt;
    }
    return number * multiplier;
}

std::optional<std::chrono::milliseconds> parseDuration(const std::string& text) {
    int64_t number;
    std::string unit;
    if (!splitNumberUnit(text, &number, &unit)) return std::nullopt;
    if (unit.empty() || unit == "ms") return std::chrono::milliseconds(number);
    if (unit == "s" || unit == "sec") return std::chrono::milliseconds(number * 1000);
    if (unit == "min") return std::chrono::milliseconds(number * 60 * 1000);
    if (unit == "h") return std::chrono::milliseconds(number * 3600 * 1000);
    if (unit == "d") return std::chrono::milliseconds(number * 24 * 3600 * 1000);
    return std::nullopt;
}

CoreOptions CoreOptions::fromMap(const std::map<std::string, std::string>& options) {
    CoreOptions o;
    OptionReader r(options);

    r.readInt("bucket", &o.bucket, 1);
    if (auto keys = r.raw("bucket-key")) {
        std::stringstream ss(*keys);
        std::string part;
        while (std::getline(ss, part, ',')) {
            std::string name = trim(part);
            if (!name.empty()) o.bucket_key.push_back(name);
        }
        if (o.bucket_key.empty()) {
            throw badOption("bucket-key", *keys, "a comma separated list of field names");
        }
    }

    if (auto engine = r.raw("merge-engine")) {
        auto parsed = mergeEngineFromString(*engine);
        if (!parsed) {
            throw badOption("merge-engine", *engine, "one of deduplicate, partial-update, aggregation, first-row");
        }
        o.merge_engine = *parsed;
    }
    r.readBool("partial-update.remove-record-on-delete", &o.partial_update_remove_record_on_delete);
    r.readBool("aggregation.remove-record-on-delete", &o.aggregation_remove_record_on_delete);

    for (const auto& [key, value] : options) {
        if (key.rfind(FIELDS_PREFIX, 0) != 0) continue;
        std::string rest = key.substr(std::string(FIELDS_PREFIX).size());
        if (endsWith(rest, AGG_FUNCTION_SUFFIX)) {
            o.field_aggregate_functions[rest.substr(0, rest.size() - std::string(AGG_FUNCTION_SUFFIX).size())] = lower(trim(value));
        } else if (endsWith(rest, LIST_AGG_DELIMITER_SUFFIX)) {
            o.field_list_agg_delimiters[rest.substr(0, rest.size() - std::string(LIST_AGG_DELIMITER_SUFFIX).size())] = value;
        }
    }

    r.readMemory("write-buffer-size", &o.write_buffer_size);
    r.readMemory("target-file-size", &o.target_file_size);
    r.readCompression("file.compression", &o.file_compression);
    r.readMemory("file.block-size", &o.file_block_size);

    r.readInt("num-sorted-run.compaction-trigger", &o.num_sorted_run_compaction_trigger, 1);
    o.num_levels = o.num_sorted_run_compaction_trigger + 1;
    r.readInt("num-levels", &o.num_levels, 2);
    r.readInt("compaction.max-size-amplification-percent", &o.max_size_amplification_percent, 0);
    r.readInt("compaction.size-ratio", &o.size_ratio, 0);
    r.readInt("compaction.min.file-num", &o.compaction_min_file_num, 1);
    r.readInt("compaction.max.file-num", &o.compaction_max_file_num, 1);
    r.readInt("compaction.max-attempts", &o.compaction_max_attempts, 1);
    if (r.raw("full-compaction.delta-commits")) {
        int32_t n = 1;
        r.readInt("full-compaction.delta-commits", &n, 1);
        o.full_compaction_delta_commits = n;
    }

    r.readMemory("manifest.target-file-size", &o.manifest_target_file_size);
    r.readInt("manifest.merge-min-count", &o.manifest_merge_min_count, 1);
    r.readMemory("manifest.full-compaction-threshold-size", &o.manifest_full_compaction_threshold_size);
    r.readCompression("manifest.compression", &o.manifest_compression);

    r.readInt("commit.max-retries", &o.commit_max_retries, 0);
    if (r.raw("commit.timeout")) {
        std::chrono::milliseconds t{0};
        r.readDuration("commit.timeout", &t);
        o.commit_timeout = t;
    }
    r.readDuration("commit.min-retry-wait", &o.commit_min_retry_wait);
    r.readDuration("commit.max-retry-wait", &o.commit_max_retry_wait);

    r.readInt("snapshot.num-retained.min", &o.snapshot_num_retained_min, 1);
    r.readInt("snapshot.num-retained.max", &o.snapshot_num_retained_max, 1);
    r.readDuration("snapshot.time-retained", &o.snapshot_time_retained);
    r.readInt("snapshot.expire.limit", &o.snapshot_expire_limit, 1);
    if (r.raw("consumer.expiration-time")) {
        std::chrono::milliseconds t{0};
        r.readDuration("consumer.expiration-time", &t);
        o.consumer_expiration_time = t;
    }

    int32_t io_retries = o.io_retry.max_retries;
    r.readInt("io.max-retries", &io_retries, 0);
    o.io_retry.max_retries = io_retries;
    r.readDuration("io.retry-wait", &o.io_retry.retry_wait);
    r.readBool("write-only", &o.write_only);

    if (!o.is_valid()) {
        throw storage::StorageError::invalidConfiguration("Conflicting table options")
            .withDetails(o.to_string());
    }
    return o;
}

bool CoreOptions::is_valid() const {
    return bucket >= 1
        && write_buffer_size > 0
        && target_file_size > 0
        && file_block_size > 0
        && num_sorted_run_compaction_trigger >= 1
        && num_levels >= 2
        && compaction_min_file_num >= 1
        && compaction_max_file_num >= compaction_min_file_num
        && compaction_max_attempts >= 1
        && manifest_target_file_size > 0
        && manifest_merge_min_count >= 1
        && commit_max_retries >= 0
        && commit_min_retry_wait.count() >= 0
        && commit_max_retry_wait >= commit_min_retry_wait
        && snapshot_num_retained_min >= 1
        && snapshot_num_retained_max >= snapshot_num_retained_min
        && snapshot_expire_limit >= 1
        && io_retry.max_retries >= 0;
}

std::string CoreOptions::to_string() const {
    std::ostringstream oss;
    oss << "CoreOptions{bucket=" << bucket
        << ", merge-engine=" << mergeEngineToString(merge_engine)
        << ", write-buffer-size=" << write_buffer_size
        << ", target-file-size=" << target_file_size
        << ", file.compression=" << magic_enum::enum_name(file_compression)
        << ", num-sorted-run.compaction-trigger=" << num_sorted_run_compaction_trigger
        << ", num-levels=" << num_levels
        << ", compaction.max-size-amplification-percent=" << max_size_amplification_percent
        << ", compaction.size-ratio=" << size_ratio
        << ", compaction.min.file-num=" << compaction_min_file_num
        << ", compaction.max.file-num=" << compaction_max_file_num
        << ", full-compaction.delta-commits="
        << (full_compaction_delta_commits ? std::to_string(*full_compaction_delta_commits) : "none")
        << ", manifest.target-file-size=" << manifest_target_file_size
        << ", manifest.merge-min-count=" << manifest_merge_min_count
        << ", manifest.compression=" << magic_enum::enum_name(manifest_compression)
        << ", commit.max-retries=" << commit_max_retries
        << ", commit.min-retry-wait=" << commit_min_retry_wait.count() << "ms"
        << ", commit.max-retry-wait=" << commit_max_retry_wait.count() << "ms"
        << ", snapshot.num-retained.min=" << snapshot_num_retained_min
        << ", snapshot.num-retained.max=" << snapshot_num_retained_max
        << ", snapshot.time-retained=" << snapshot_time_retained.count() << "ms"
        << ", io.max-retries=" << io_retry.max_retries
        << ", write-only=" << (write_only ? "true" : "false")
        << "}";
    return oss.str();
}

} // namespace lakestore
