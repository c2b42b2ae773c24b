// src/manifest/manifest_file.cpp
#include "../../include/manifest/manifest_file.h"
#include "../../include/compression_utils.h"
#include "../../include/storage_error/error_utils.h"
#include "../../include/debug_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <cstring>

namespace lakestore {
namespace manifest {

namespace {
    constexpr char OBJECT_MAGIC[4] = {'L', 'S', 'M', 'F'};
    constexpr uint8_t OBJECT_VERSION = 1;
    constexpr size_t OBJECT_HEADER_SIZE = 14;

    // Header integers are little-endian regardless of the host.
    void appendFixed32(std::string& out, uint32_t v) {
        for (int shift = 0; shift < 32; shift += 8) {
            out.push_back(static_cast<char>((v >> shift) & 0xFF));
        }
    }

    uint32_t readFixed32(const char* p) {
        const auto* b = reinterpret_cast<const unsigned char*>(p);
        return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
    }

    void widenPartitionRange(const Row& partition, bool& first, Row& min, Row& max) {
        if (first) {
            min = partition;
            max = partition;
            first = false;
            return;
        }
        if (compareRows(partition, min) < 0) min = partition;
        if (compareRows(partition, max) > 0) max = partition;
    }
}

std::string encodeMetadataObject(const std::string& payload, CompressionType compression) {
    std::vector<uint8_t> body = CompressionManager::compress(
        reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), compression);
    std::string out;
    out.reserve(OBJECT_HEADER_SIZE + body.size());
    out.append(OBJECT_MAGIC, 4);
    out.push_back(static_cast<char>(OBJECT_VERSION));
    out.push_back(static_cast<char>(compression));
    appendFixed32(out, static_cast<uint32_t>(payload.size()));
    appendFixed32(out, computeChecksum(payload.data(), payload.size()));
    out.append(reinterpret_cast<const char*>(body.data()), body.size());
    return out;
}

storage::Result<std::string> decodeMetadataObject(const std::string& bytes, const std::string& path) {
    if (bytes.size() < OBJECT_HEADER_SIZE || std::memcmp(bytes.data(), OBJECT_MAGIC, 4) != 0) {
        return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Not a metadata object").withFilePath(path);
    }
    if (static_cast<uint8_t>(bytes[4]) != OBJECT_VERSION) {
        return STORAGE_ERROR(storage::ErrorCode::FORMAT_VERSION_MISMATCH, "Unsupported metadata object version")
            .withFilePath(path);
    }
    auto compression = magic_enum::enum_cast<CompressionType>(static_cast<uint8_t>(bytes[5]));
    if (!compression) {
        return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Unknown metadata object compression")
            .withContext("compression", std::to_string(static_cast<uint8_t>(bytes[5])))
            .withFilePath(path);
    }
    uint32_t size = readFixed32(bytes.data() + 6);
    uint32_t crc = readFixed32(bytes.data() + 10);

    std::vector<uint8_t> payload;
    try {
        payload = CompressionManager::decompress(
            reinterpret_cast<const uint8_t*>(bytes.data() + OBJECT_HEADER_SIZE),
            bytes.size() - OBJECT_HEADER_SIZE, size, *compression);
    } catch (const std::exception& e) {
        return STORAGE_ERROR(storage::ErrorCode::MANIFEST_ERROR, "Metadata object decompression failed")
            .withDetails(e.what())
            .withFilePath(path);
    }
    if (computeChecksum(payload.data(), payload.size()) != crc) {
        return STORAGE_ERROR(storage::ErrorCode::CHECKSUM_MISMATCH, "Metadata object checksum mismatch")
            .withFilePath(path);
    }
    return std::string(reinterpret_cast<const char*>(payload.data()), payload.size());
}

// --- ManifestEntrySequence ---

ManifestEntrySequence::ManifestEntrySequence(ManifestContext context, std::string file_name)
    : context_(std::move(context)), file_name_(std::move(file_name)) {}

storage::Result<std::vector<ManifestEntry>> ManifestEntrySequence::toVector() const {
    std::string path = context_.path_factory->manifestPath(file_name_);
    auto bytes = fs::retryIo(context_.io_retry, "read manifest " + file_name_, [&]() {
        return context_.file_io->readFile(path);
    });
    if (!bytes.isOk()) return bytes.error();
    auto payload = decodeMetadataObject(bytes.value(), path);
    if (!payload.isOk()) return payload.error();
    auto entries = context_.codec->decodeEntries(payload.value());
    if (!entries.isOk()) {
        return std::move(entries.error().withFilePath(path));
    }
    return entries;
}

storage::Status ManifestEntrySequence::forEach(const std::function<storage::Status(const ManifestEntry&)>& fn) const {
    auto entries = toVector();
    if (!entries.isOk()) return entries.error();
    for (const auto& entry : entries.value()) {
        RETURN_IF_ERROR(fn(entry));
    }
    return storage::Status();
}

// --- ManifestFile ---

ManifestFile::ManifestFile(ManifestContext context)
    : context_(std::move(context)) {}

storage::Result<ManifestFileMeta> ManifestFile::writeOne(const std::vector<ManifestEntry>& entries) const {
    ManifestFileMeta meta;
    meta.file_name = context_.path_factory->newManifestFileName();
    meta.schema_id = context_.schema_id;
    bool first = true;
    for (const auto& entry : entries) {
        if (entry.kind == FileKind::ADD) {
            meta.num_added_files++;
        } else {
            meta.num_deleted_files++;
        }
        widenPartitionRange(entry.partition(), first, meta.partition_min, meta.partition_max);
    }

    auto payload = context_.codec->encodeEntries(entries);
    if (!payload.isOk()) return payload.error();
    std::string object;
    try {
        object = encodeMetadataObject(payload.value(), context_.compression);
    } catch (const std::exception& e) {
        return STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Failed to compress manifest").withDetails(e.what());
    }
    std::string path = context_.path_factory->manifestPath(meta.file_name);
    auto status = fs::retryIo(context_.io_retry, "write manifest " + meta.file_name, [&]() {
        return context_.file_io->writeFile(path, object, false);
    });
    if (!status.isOk()) return status.error();
    meta.file_size = static_cast<int64_t>(object.size());
    LOG_TRACE("[ManifestFile] Wrote ", meta.file_name, " adds=", meta.num_added_files,
              " deletes=", meta.num_deleted_files, " bytes=", meta.file_size);
    return meta;
}

storage::Result<std::vector<ManifestFileMeta>> ManifestFile::write(const std::vector<ManifestEntry>& entries) const {
    std::vector<ManifestFileMeta> written;
    std::vector<ManifestEntry> pending;
    int64_t pending_size = 0;

    auto flush = [&]() -> storage::Status {
        if (pending.empty()) return storage::Status();
        auto meta = writeOne(pending);
        if (!meta.isOk()) return meta.error();
        written.push_back(std::move(meta).value());
        pending.clear();
        pending_size = 0;
        return storage::Status();
    };

    for (const auto& entry : entries) {
        pending.push_back(entry);
        pending_size += static_cast<int64_t>(context_.codec->estimateEntrySize(entry));
        if (pending_size >= context_.target_file_size) {
            auto status = flush();
            if (!status.isOk()) {
                for (const auto& m : written) deleteQuietly(m.file_name);
                return status.error();
            }
        }
    }
    auto status = flush();
    if (!status.isOk()) {
        for (const auto& m : written) deleteQuietly(m.file_name);
        return status.error();
    }
    return written;
}

ManifestEntrySequence ManifestFile::read(const std::string& file_name) const {
    return ManifestEntrySequence(context_, file_name);
}

void ManifestFile::deleteQuietly(const std::string& file_name) const {
    context_.file_io->deleteQuietly(context_.path_factory->manifestPath(file_name));
}

// --- ManifestList ---

ManifestList::ManifestList(ManifestContext context)
    : context_(std::move(context)) {}

storage::Result<std::string> ManifestList::write(const std::vector<ManifestFileMeta>& metas) const {
    std::string name = context_.path_factory->newManifestListName();
    std::string path = context_.path_factory->manifestPath(name);
    auto payload = context_.codec->encodeManifestList(metas);
    if (!payload.isOk()) return payload.error();
    std::string object;
    try {
        object = encodeMetadataObject(payload.value(), context_.compression);
    } catch (const std::exception& e) {
        return STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Failed to compress manifest list").withDetails(e.what());
    }
    auto status = fs::retryIo(context_.io_retry, "write manifest list " + name, [&]() {
        return context_.file_io->writeFile(path, object, false);
    });
    if (!status.isOk()) return status.error();
    return name;
}

storage::Result<std::vector<ManifestFileMeta>> ManifestList::read(const std::string& file_name) const {
    std::string path = context_.path_factory->manifestPath(file_name);
    auto bytes = fs::retryIo(context_.io_retry, "read manifest list " + file_name, [&]() {
        return context_.file_io->readFile(path);
    });
    if (!bytes.isOk()) return bytes.error();
    auto payload = decodeMetadataObject(bytes.value(), path);
    if (!payload.isOk()) return payload.error();
    auto metas = context_.codec->decodeManifestList(payload.value());
    if (!metas.isOk()) {
        return std::move(metas.error().withFilePath(path));
    }
    return metas;
}

void ManifestList::deleteQuietly(const std::string& file_name) const {
    context_.file_io->deleteQuietly(context_.path_factory->manifestPath(file_name));
}

// --- ManifestFileMerger ---

storage::Status ManifestFileMerger::mergeCandidates(const std::vector<ManifestFileMeta>& candidates,
                                                   const ManifestFile& manifest_file,
                                                   std::vector<ManifestFileMeta>& result,
                                                   std::vector<ManifestFileMeta>* newly_created) {
    if (candidates.size() == 1) {
        result.push_back(candidates[0]);
        return storage::Status();
    }
    FileEntry::MergedEntries merged;
    for (const auto& meta : candidates) {
        auto entries = manifest_file.read(meta.file_name).toVector();
        if (!entries.isOk()) return entries.error();
        RETURN_IF_ERROR(FileEntry::mergeEntries(entries.value(), merged));
    }
    auto written = manifest_file.write(FileEntry::toVector(merged));
    if (!written.isOk()) return written.error();
    for (const auto& meta : written.value()) {
        result.push_back(meta);
        if (newly_created) newly_created->push_back(meta);
    }
    return storage::Status();
}

storage::Result<std::optional<std::vector<ManifestFileMeta>>> ManifestFileMerger::tryFullCompaction(
        const std::vector<ManifestFileMeta>& input, const ManifestFile& manifest_file,
        const Options& options, std::vector<ManifestFileMeta>* newly_created) {
    int64_t delta_size = 0;
    for (const auto& meta : input) {
        if (meta.file_size < options.target_file_size || meta.num_deleted_files > 0) {
            delta_size += meta.file_size;
        }
    }
    if (delta_size < options.full_compaction_threshold) {
        return std::optional<std::vector<ManifestFileMeta>>();
    }

    FileEntry::MergedEntries merged;
    for (const auto& meta : input) {
        auto entries = manifest_file.read(meta.file_name).toVector();
        if (!entries.isOk()) return entries.error();
        RETURN_IF_ERROR(FileEntry::mergeEntries(entries.value(), merged));
    }
    RETURN_IF_ERROR(FileEntry::requireNoDeletes(merged));

    auto written = manifest_file.write(FileEntry::toVector(merged));
    if (!written.isOk()) return written.error();
    if (newly_created) {
        newly_created->insert(newly_created->end(), written.value().begin(), written.value().end());
    }
    LOG_INFO("[ManifestFileMerger] Full compaction rewrote ", input.size(), " manifests into ",
             written.value().size(), " (", merged.size(), " live files)");
    return std::optional<std::vector<ManifestFileMeta>>(std::move(written).value());
}

storage::Result<std::vector<ManifestFileMeta>> ManifestFileMerger::merge(const std::vector<ManifestFileMeta>& input,
                                                                        const ManifestFile& manifest_file,
                                                                        const Options& options,
                                                                        std::vector<ManifestFileMeta>* newly_created) {
    auto full = tryFullCompaction(input, manifest_file, options, newly_created);
    if (!full.isOk()) return full.error();
    if (full.value()) {
        return std::move(*full.value());
    }

    std::vector<ManifestFileMeta> result;
    std::vector<ManifestFileMeta> candidates;
    int64_t total_size = 0;
    for (const auto& meta : input) {
        total_size += meta.file_size;
        candidates.push_back(meta);
        if (total_size >= options.target_file_size) {
            RETURN_IF_ERROR(mergeCandidates(candidates, manifest_file, result, newly_created));
            candidates.clear();
            total_size = 0;
        }
    }
    if (static_cast<int32_t>(candidates.size()) >= options.merge_min_count) {
        RETURN_IF_ERROR(mergeCandidates(candidates, manifest_file, result, newly_created));
    } else {
        result.insert(result.end(), candidates.begin(), candidates.end());
    }
    return result;
}

} // namespace manifest
} // namespace lakestore
