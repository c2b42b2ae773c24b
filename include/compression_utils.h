// include/compression_utils.h
#pragma once
#include "types.h"

#include <vector>
#include <string>
#include <optional>

namespace lakestore {

class CompressionManager {
public:
    // Compresses data. Throws std::runtime_error on failure.
    // level: 0 for default, Zstd offers levels 1-22.
    static std::vector<uint8_t> compress(const uint8_t* uncompressed_data, size_t uncompressed_size,
                                         CompressionType type, int level = 0);

    // Decompresses data. Throws std::runtime_error on failure.
    // uncompressed_size_hint is the exact size recorded by the writer.
    static std::vector<uint8_t> decompress(const uint8_t* compressed_data, size_t compressed_size,
                                           size_t uncompressed_size_hint, CompressionType type);

    // Returns an estimated upper bound for compressed size. Useful for buffer allocation.
    static size_t get_max_compressed_size(size_t uncompressed_size, CompressionType type);
};

// Option values: "none", "zstd", "lz4" (case-insensitive).
std::optional<CompressionType> compressionTypeFromString(const std::string& name);
std::string compressionTypeToString(CompressionType type);

} // namespace lakestore
