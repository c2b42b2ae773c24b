// src/compression_utils.cpp
#include "../include/compression_utils.h"
#include "../include/debug_utils.h"
#include <zstd.h>
#include <lz4.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <cstring>

namespace lakestore {

std::vector<uint8_t> CompressionManager::compress(const uint8_t* uncompressed_data, size_t uncompressed_size,
                                                  CompressionType type, int level) {
    if (type == CompressionType::NONE || uncompressed_size == 0) {
        return std::vector<uint8_t>(uncompressed_data, uncompressed_data + uncompressed_size);
    }

    if (type == CompressionType::ZSTD) {
        size_t const cBuffSize = ZSTD_compressBound(uncompressed_size);
        std::vector<uint8_t> compressed_buffer(cBuffSize);
        int effective_level = (level == 0) ? ZSTD_CLEVEL_DEFAULT : level;

        size_t const cSize = ZSTD_compress(compressed_buffer.data(), cBuffSize,
                                           uncompressed_data, uncompressed_size,
                                           effective_level);
        if (ZSTD_isError(cSize)) {
            LOG_ERROR("[CompressionManager::compress] ZSTD_compress failed: ", ZSTD_getErrorName(cSize));
            throw std::runtime_error(std::string("ZSTD_compress error: ") + ZSTD_getErrorName(cSize));
        }
        LOG_TRACE("[CompressionManager::compress] ZSTD ", uncompressed_size, " -> ", cSize, " bytes");
        compressed_buffer.resize(cSize);
        return compressed_buffer;
    } else if (type == CompressionType::LZ4) {
        int const max_dst_size = LZ4_compressBound(static_cast<int>(uncompressed_size));
        if (max_dst_size <= 0) {
            LOG_ERROR("[CompressionManager::compress] LZ4_compressBound failed for size ", uncompressed_size);
            throw std::runtime_error("LZ4_compressBound failed");
        }
        std::vector<uint8_t> compressed_buffer(max_dst_size);
        int const compressed_data_size = LZ4_compress_default(
            reinterpret_cast<const char*>(uncompressed_data),
            reinterpret_cast<char*>(compressed_buffer.data()),
            static_cast<int>(uncompressed_size),
            max_dst_size
        );
        if (compressed_data_size <= 0) {
            LOG_ERROR("[CompressionManager::compress] LZ4_compress_default failed.");
            throw std::runtime_error("LZ4_compress_default failed");
        }
        LOG_TRACE("[CompressionManager::compress] LZ4 ", uncompressed_size, " -> ", compressed_data_size, " bytes");
        compressed_buffer.resize(compressed_data_size);
        return compressed_buffer;
    }
    throw std::runtime_error("Unsupported compression type: " + std::to_string(static_cast<int>(type)));
}

std::vector<uint8_t> CompressionManager::decompress(const uint8_t* compressed_data, size_t compressed_size,
                                                    size_t uncompressed_size_hint, CompressionType type) {
    if (type == CompressionType::NONE || compressed_size == 0) {
        return std::vector<uint8_t>(compressed_data, compressed_data + compressed_size);
    }

    if (type == CompressionType::ZSTD) {
        if (uncompressed_size_hint == 0) {
            throw std::runtime_error("ZSTD decompress requires a non-zero uncompressed_size_hint.");
        }
        std::vector<uint8_t> decompressed_buffer(uncompressed_size_hint);
        size_t const dSize = ZSTD_decompress(decompressed_buffer.data(), uncompressed_size_hint,
                                             compressed_data, compressed_size);
        if (ZSTD_isError(dSize)) {
            LOG_ERROR("[CompressionManager::decompress] ZSTD_decompress failed: ", ZSTD_getErrorName(dSize));
            throw std::runtime_error(std::string("ZSTD_decompress error: ") + ZSTD_getErrorName(dSize));
        }
        if (dSize != uncompressed_size_hint) {
            throw std::runtime_error("ZSTD_decompress: size mismatch, got " + std::to_string(dSize) +
                                     " expected " + std::to_string(uncompressed_size_hint));
        }
        return decompressed_buffer;
    } else if (type == CompressionType::LZ4) {
        if (uncompressed_size_hint == 0) {
            throw std::runtime_error("LZ4 decompress requires a non-zero uncompressed_size_hint.");
        }
        std::vector<uint8_t> decompressed_buffer(uncompressed_size_hint);
        int const decompressed_size = LZ4_decompress_safe(
            reinterpret_cast<const char*>(compressed_data),
            reinterpret_cast<char*>(decompressed_buffer.data()),
            static_cast<int>(compressed_size),
            static_cast<int>(uncompressed_size_hint)
        );
        if (decompressed_size < 0) {
            LOG_ERROR("[CompressionManager::decompress] LZ4_decompress_safe failed with error code: ", decompressed_size);
            throw std::runtime_error("LZ4_decompress_safe failed");
        }
        if (static_cast<size_t>(decompressed_size) != uncompressed_size_hint) {
            throw std::runtime_error("LZ4_decompress_safe: size mismatch, got " + std::to_string(decompressed_size) +
                                     " expected " + std::to_string(uncompressed_size_hint));
        }
        return decompressed_buffer;
    }
    throw std::runtime_error("Unsupported compression type: " + std::to_string(static_cast<int>(type)));
}

size_t CompressionManager::get_max_compressed_size(size_t uncompressed_size, CompressionType type) {
    if (type == CompressionType::NONE) {
        return uncompressed_size;
    }
    if (type == CompressionType::ZSTD) {
        return ZSTD_compressBound(uncompressed_size);
    }
    return static_cast<size_t>(LZ4_compressBound(static_cast<int>(uncompressed_size)));
}

std::optional<CompressionType> compressionTypeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "none") return CompressionType::NONE;
    if (lower == "zstd") return CompressionType::ZSTD;
    if (lower == "lz4") return CompressionType::LZ4;
    return std::nullopt;
}

std::string compressionTypeToString(CompressionType type) {
    switch (type) {
        case CompressionType::NONE: return "none";
        case CompressionType::ZSTD: return "zstd";
        case CompressionType::LZ4:  return "lz4";
    }
    return "unknown";
}

} // namespace lakestore
