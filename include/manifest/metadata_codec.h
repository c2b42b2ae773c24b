// include/manifest/metadata_codec.h
#pragma once

#include "manifest_entry.h"
#include "../snapshot/snapshot.h"
#include "../storage_error/result.h"

#include <string>
#include <vector>

namespace lakestore {
namespace manifest {

/**
 * @class MetadataCodec
 * @brief Serializer for the small metadata objects: manifest entries,
 * manifest lists and snapshots. Encoding failures are ENCODING_ERROR;
 * decoding failures are corruption errors.
 */
class MetadataCodec {
public:
    virtual ~MetadataCodec() = default;

    virtual std::string identifier() const = 0;

    virtual storage::Result<std::string> encodeEntries(const std::vector<ManifestEntry>& entries) const = 0;
    virtual storage::Result<std::vector<ManifestEntry>> decodeEntries(const std::string& payload) const = 0;
    // Approximate encoded size of one entry, used to roll manifest files.
    virtual size_t estimateEntrySize(const ManifestEntry& entry) const = 0;

    virtual storage::Result<std::string> encodeManifestList(const std::vector<ManifestFileMeta>& metas) const = 0;
    virtual storage::Result<std::vector<ManifestFileMeta>> decodeManifestList(const std::string& payload) const = 0;

    virtual storage::Result<std::string> encodeSnapshot(const snapshot::Snapshot& snapshot) const = 0;
    virtual storage::Result<snapshot::Snapshot> decodeSnapshot(const std::string& payload) const = 0;
};

/**
 * @class JsonMetadataCodec
 * @brief nlohmann::json encoding with stable camelCase field names.
 *
 * Values are encoded by type: null, bool, integer and string map to the JSON
 * equivalents; doubles are wrapped as {"double": "<repr>"} so that NaN,
 * infinities and integral doubles survive a round trip with their type.
 * Strings that are not valid UTF-8 are wrapped as {"bytes": "<hex>"}.
 */
class JsonMetadataCodec : public MetadataCodec {
public:
    std::string identifier() const override { return "json"; }

    storage::Result<std::string> encodeEntries(const std::vector<ManifestEntry>& entries) const override;
    storage::Result<std::vector<ManifestEntry>> decodeEntries(const std::string& payload) const override;
    size_t estimateEntrySize(const ManifestEntry& entry) const override;

    storage::Result<std::string> encodeManifestList(const std::vector<ManifestFileMeta>& metas) const override;
    storage::Result<std::vector<ManifestFileMeta>> decodeManifestList(const std::string& payload) const override;

    storage::Result<std::string> encodeSnapshot(const snapshot::Snapshot& snapshot) const override;
    storage::Result<snapshot::Snapshot> decodeSnapshot(const std::string& payload) const override;
};

} // namespace manifest
} // namespace lakestore
