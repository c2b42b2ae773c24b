// src/manifest/json_metadata_codec.cpp
#include "../../include/manifest/metadata_codec.h"
#include "../../include/storage_error/error_utils.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>

using json = nlohmann::json;

namespace lakestore {
namespace {
    constexpr int CODEC_VERSION = 1;

    // Strings that are not UTF-8 cannot be JSON strings; they travel as hex.
    std::string toHex(const std::string& bytes) {
        static const char DIGITS[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (unsigned char c : bytes) {
            out.push_back(DIGITS[c >> 4]);
            out.push_back(DIGITS[c & 0x0F]);
        }
        return out;
    }

    int hexDigit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument(std::string("invalid hex digit '") + c + "'");
    }

    std::string fromHex(const std::string& hex) {
        if (hex.size() % 2 != 0) throw std::invalid_argument("odd-length hex string");
        std::string out;
        out.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            out.push_back(static_cast<char>((hexDigit(hex[i]) << 4) | hexDigit(hex[i + 1])));
        }
        return out;
    }

    json valueToJson(const Value& v) {
        switch (v.index()) {
            case 0: return nullptr;
            case 1: return std::get<bool>(v);
            case 2: return std::get<int64_t>(v);
            case 3: {
                double d = std::get<double>(v);
                std::string repr;
                if (std::isnan(d)) {
                    repr = "nan";
                } else if (std::isinf(d)) {
                    repr = d > 0 ? "inf" : "-inf";
                } else {
                    char buf[32];
                    std::snprintf(buf, sizeof(buf), "%.17g", d);
                    repr = buf;
                }
                return json{{"double", repr}};
            }
            default: {
                const auto& str = std::get<std::string>(v);
                if (isValidUtf8(str)) return str;
                return json{{"bytes", toHex(str)}};
            }
        }
    }

    Value valueFromJson(const json& j) {
        if (j.is_null()) return Value{};
        if (j.is_boolean()) return Value{j.get<bool>()};
        if (j.is_number_integer()) return Value{j.get<int64_t>()};
        if (j.is_string()) return Value{j.get<std::string>()};
        if (j.is_object() && j.contains("double")) {
            std::string repr = j.at("double").get<std::string>();
            return Value{std::strtod(repr.c_str(), nullptr)};
        }
        if (j.is_object() && j.contains("bytes")) {
            return Value{fromHex(j.at("bytes").get<std::string>())};
        }
        throw std::invalid_argument("unsupported value encoding: " + j.dump());
    }

    json rowToJson(const Row& row) {
        json arr = json::array();
        for (const auto& v : row) arr.push_back(valueToJson(v));
        return arr;
    }

    Row rowFromJson(const json& j) {
        Row row;
        row.reserve(j.size());
        for (const auto& v : j) row.push_back(valueFromJson(v));
        return row;
    }

    // Only non-value text (commit user, file names) can still fail to dump.
    template<typename Fn>
    storage::Result<std::string> encodeOrError(const std::string& what, Fn&& dump) {
        try {
            return dump();
        } catch (const json::exception& e) {
            return STORAGE_ERROR(storage::ErrorCode::ENCODING_ERROR, "Failed to encode " + what)
                .withDetails(e.what());
        }
    }

    storage::StorageError decodeError(const std::string& what, const std::exception& e) {
        return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Failed to decode " + what)
            .withDetails(e.what());
    }

    void checkVersion(const json& j) {
        int version = j.at("version").get<int>();
        if (version > CODEC_VERSION) {
            throw std::invalid_argument("unsupported codec version " + std::to_string(version));
        }
    }
}

namespace io {

NLOHMANN_JSON_SERIALIZE_ENUM(FileSource, {
    {FileSource::APPEND, "APPEND"},
    {FileSource::COMPACT, "COMPACT"},
})

void to_json(json& j, const SimpleStats& s) {
    j = json{{"min", rowToJson(s.min_values)}, {"max", rowToJson(s.max_values)}, {"nullCounts", s.null_counts}};
}

void from_json(const json& j, SimpleStats& s) {
    s.min_values = rowFromJson(j.at("min"));
    s.max_values = rowFromJson(j.at("max"));
    j.at("nullCounts").get_to(s.null_counts);
}

void to_json(json& j, const DataFileMeta& f) {
    j = json{
        {"fileName", f.file_name},
        {"partition", rowToJson(f.partition)},
        {"bucket", f.bucket},
        {"level", f.level},
        {"minKey", rowToJson(f.min_key)},
        {"maxKey", rowToJson(f.max_key)},
        {"minSequenceNumber", f.min_sequence_number},
        {"maxSequenceNumber", f.max_sequence_number},
        {"rowCount", f.row_count},
        {"deleteRowCount", f.delete_row_count},
        {"fileSize", f.file_size},
        {"schemaId", f.schema_id},
        {"creationTime", f.creation_time_millis},
        {"fileSource", f.file_source}
    };
    if (f.value_stats) j["valueStats"] = *f.value_stats;
    if (f.deletion_vector) j["deletionVector"] = *f.deletion_vector;
}

void from_json(const json& j, DataFileMeta& f) {
    j.at("fileName").get_to(f.file_name);
    f.partition = rowFromJson(j.at("partition"));
    j.at("bucket").get_to(f.bucket);
    j.at("level").get_to(f.level);
    f.min_key = rowFromJson(j.at("minKey"));
    f.max_key = rowFromJson(j.at("maxKey"));
    j.at("minSequenceNumber").get_to(f.min_sequence_number);
    j.at("maxSequenceNumber").get_to(f.max_sequence_number);
    j.at("rowCount").get_to(f.row_count);
    j.at("deleteRowCount").get_to(f.delete_row_count);
    j.at("fileSize").get_to(f.file_size);
    j.at("schemaId").get_to(f.schema_id);
    j.at("creationTime").get_to(f.creation_time_millis);
    j.at("fileSource").get_to(f.file_source);
    if (j.contains("valueStats")) f.value_stats = j.at("valueStats").get<SimpleStats>();
    if (j.contains("deletionVector")) f.deletion_vector = j.at("deletionVector").get<std::string>();
}

} // namespace io

namespace manifest {

NLOHMANN_JSON_SERIALIZE_ENUM(FileKind, {
    {FileKind::ADD, "ADD"},
    {FileKind::DELETE, "DELETE"},
})

void to_json(json& j, const ManifestEntry& e) {
    j = json{{"kind", e.kind}, {"totalBuckets", e.total_buckets}, {"file", *e.file}};
}

void from_json(const json& j, ManifestEntry& e) {
    j.at("kind").get_to(e.kind);
    j.at("totalBuckets").get_to(e.total_buckets);
    e.file = std::make_shared<io::DataFileMeta>(j.at("file").get<io::DataFileMeta>());
}

void to_json(json& j, const ManifestFileMeta& m) {
    j = json{
        {"fileName", m.file_name},
        {"fileSize", m.file_size},
        {"numAddedFiles", m.num_added_files},
        {"numDeletedFiles", m.num_deleted_files},
        {"partitionMin", rowToJson(m.partition_min)},
        {"partitionMax", rowToJson(m.partition_max)},
        {"schemaId", m.schema_id}
    };
}

void from_json(const json& j, ManifestFileMeta& m) {
    j.at("fileName").get_to(m.file_name);
    j.at("fileSize").get_to(m.file_size);
    j.at("numAddedFiles").get_to(m.num_added_files);
    j.at("numDeletedFiles").get_to(m.num_deleted_files);
    m.partition_min = rowFromJson(j.at("partitionMin"));
    m.partition_max = rowFromJson(j.at("partitionMax"));
    j.at("schemaId").get_to(m.schema_id);
}

} // namespace manifest

namespace snapshot {

NLOHMANN_JSON_SERIALIZE_ENUM(CommitKind, {
    {CommitKind::APPEND, "APPEND"},
    {CommitKind::COMPACT, "COMPACT"},
    {CommitKind::OVERWRITE, "OVERWRITE"},
})

void to_json(json& j, const Snapshot& s) {
    j = json{
        {"version", s.version},
        {"id", s.id},
        {"schemaId", s.schema_id},
        {"baseManifestList", s.base_manifest_list},
        {"deltaManifestList", s.delta_manifest_list},
        {"commitUser", s.commit_user},
        {"commitIdentifier", s.commit_identifier},
        {"commitKind", s.commit_kind},
        {"timeMillis", s.time_millis},
        {"totalRecordCount", s.total_record_count},
        {"deltaRecordCount", s.delta_record_count}
    };
    if (s.watermark) j["watermark"] = *s.watermark;
    if (s.previous_snapshot_id) j["previousSnapshotId"] = *s.previous_snapshot_id;
}

void from_json(const json& j, Snapshot& s) {
    j.at("version").get_to(s.version);
    j.at("id").get_to(s.id);
    j.at("schemaId").get_to(s.schema_id);
    j.at("baseManifestList").get_to(s.base_manifest_list);
    j.at("deltaManifestList").get_to(s.delta_manifest_list);
    j.at("commitUser").get_to(s.commit_user);
    j.at("commitIdentifier").get_to(s.commit_identifier);
    j.at("commitKind").get_to(s.commit_kind);
    j.at("timeMillis").get_to(s.time_millis);
    j.at("totalRecordCount").get_to(s.total_record_count);
    j.at("deltaRecordCount").get_to(s.delta_record_count);
    if (j.contains("watermark")) s.watermark = j.at("watermark").get<int64_t>();
    if (j.contains("previousSnapshotId")) s.previous_snapshot_id = j.at("previousSnapshotId").get<int64_t>();
}

} // namespace snapshot

namespace manifest {

storage::Result<std::string> JsonMetadataCodec::encodeEntries(const std::vector<ManifestEntry>& entries) const {
    return encodeOrError("manifest entries", [&]() {
        json j = {{"version", CODEC_VERSION}, {"entries", entries}};
        return j.dump();
    });
}

storage::Result<std::vector<ManifestEntry>> JsonMetadataCodec::decodeEntries(const std::string& payload) const {
    try {
        json j = json::parse(payload);
        checkVersion(j);
        return j.at("entries").get<std::vector<ManifestEntry>>();
    } catch (const std::exception& e) {
        return decodeError("manifest entries", e);
    }
}

size_t JsonMetadataCodec::estimateEntrySize(const ManifestEntry& entry) const {
    // An estimate only; encodeEntries reports text it cannot encode.
    return json(entry).dump(-1, ' ', false, json::error_handler_t::replace).size() + 1;
}

storage::Result<std::string> JsonMetadataCodec::encodeManifestList(const std::vector<ManifestFileMeta>& metas) const {
    return encodeOrError("manifest list", [&]() {
        json j = {{"version", CODEC_VERSION}, {"manifests", metas}};
        return j.dump();
    });
}

storage::Result<std::vector<ManifestFileMeta>> JsonMetadataCodec::decodeManifestList(const std::string& payload) const {
    try {
        json j = json::parse(payload);
        checkVersion(j);
        return j.at("manifests").get<std::vector<ManifestFileMeta>>();
    } catch (const std::exception& e) {
        return decodeError("manifest list", e);
    }
}

storage::Result<std::string> JsonMetadataCodec::encodeSnapshot(const snapshot::Snapshot& snapshot) const {
    return encodeOrError("snapshot " + std::to_string(snapshot.id), [&]() {
        return json(snapshot).dump(2);
    });
}

storage::Result<snapshot::Snapshot> JsonMetadataCodec::decodeSnapshot(const std::string& payload) const {
    try {
        json j = json::parse(payload);
        auto s = j.get<snapshot::Snapshot>();
        if (s.version > snapshot::Snapshot::CURRENT_VERSION) {
            return STORAGE_ERROR(storage::ErrorCode::FORMAT_VERSION_MISMATCH, "Unsupported snapshot version")
                .withContext("version", std::to_string(s.version));
        }
        return s;
    } catch (const std::exception& e) {
        return decodeError("snapshot", e);
    }
}

} // namespace manifest
} // namespace lakestore
