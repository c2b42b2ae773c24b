// src/manifest/manifest_entry.cpp
#include "../../include/manifest/manifest_entry.h"
#include "../../include/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace lakestore {
namespace manifest {

std::string fileKindToString(FileKind kind) {
    return std::string(magic_enum::enum_name(kind));
}

std::string ManifestEntry::toString() const {
    return fileKindToString(kind) + " " + (file ? file->toString() : std::string("<null>"));
}

bool ManifestFileMeta::operator==(const ManifestFileMeta& other) const {
    return file_name == other.file_name
        && file_size == other.file_size
        && num_added_files == other.num_added_files
        && num_deleted_files == other.num_deleted_files
        && compareRows(partition_min, other.partition_min) == 0
        && compareRows(partition_max, other.partition_max) == 0
        && schema_id == other.schema_id;
}

storage::Status FileEntry::mergeEntry(const ManifestEntry& entry, MergedEntries& merged) {
    std::string id = entry.identifier();
    auto it = merged.find(id);

    if (entry.kind == FileKind::ADD) {
        if (it != merged.end()) {
            return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Trying to add a file which is already added")
                .withDetails(entry.file->toString());
        }
        merged.emplace(std::move(id), entry);
        return storage::Status();
    }

    if (it == merged.end()) {
        merged.emplace(std::move(id), entry);
        return storage::Status();
    }
    if (it->second.kind == FileKind::DELETE) {
        return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Trying to delete a file which is already deleted")
            .withDetails(entry.file->toString());
    }
    merged.erase(it);
    return storage::Status();
}

storage::Status FileEntry::mergeEntries(const std::vector<ManifestEntry>& entries, MergedEntries& merged) {
    for (const auto& entry : entries) {
        RETURN_IF_ERROR(mergeEntry(entry, merged));
    }
    return storage::Status();
}

storage::Result<std::vector<ManifestEntry>> FileEntry::mergeEntries(const std::vector<ManifestEntry>& entries) {
    MergedEntries merged;
    RETURN_IF_ERROR(mergeEntries(entries, merged));
    return toVector(merged);
}

storage::Status FileEntry::requireNoDeletes(const MergedEntries& merged) {
    for (const auto& [id, entry] : merged) {
        if (entry.kind == FileKind::DELETE) {
            return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Deleted file was never added")
                .withDetails(entry.file->toString());
        }
    }
    return storage::Status();
}

std::vector<ManifestEntry> FileEntry::toVector(const MergedEntries& merged) {
    std::vector<ManifestEntry> result;
    result.reserve(merged.size());
    for (const auto& [id, entry] : merged) {
        result.push_back(entry);
    }
    return result;
}

} // namespace manifest
} // namespace lakestore
