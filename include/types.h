// include/types.h

#pragma once

#include <string>
#include <vector>
#include <variant>    // For std::variant, std::monostate
#include <optional>
#include <cstdint>
#include <functional>

namespace lakestore {

// --- Compression Enum ---
enum class CompressionType : uint8_t {
    NONE = 0,
    ZSTD = 1,
    LZ4  = 2,
};

// --- Field Types ---
enum class DataType : uint8_t {
    BOOLEAN = 0,
    BIGINT  = 1,
    DOUBLE  = 2,
    STRING  = 3,
};

/**
 * @brief A single typed field value. std::monostate is SQL NULL.
 * The alternative index doubles as the cross-type sort order (NULL first).
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * @brief An ordered tuple of values. Used for full rows, primary keys and partitions.
 */
using Row = std::vector<Value>;

/**
 * @brief Change kind carried by every record.
 * UPDATE_BEFORE and DELETE retract a key; INSERT and UPDATE_AFTER add one.
 */
enum class RowKind : uint8_t {
    INSERT        = 0,
    UPDATE_BEFORE = 1,
    UPDATE_AFTER  = 2,
    DELETE        = 3,
};

inline bool isAdd(RowKind kind) {
    return kind == RowKind::INSERT || kind == RowKind::UPDATE_AFTER;
}

/**
 * @brief One version of one primary key.
 * `value` is the full row; `key` is its projection on the bucket's key fields.
 */
struct KeyValue {
    Row key;
    int64_t sequence_number = 0;
    RowKind kind = RowKind::INSERT;
    Row value;

    KeyValue() = default;
    KeyValue(Row k, int64_t seq, RowKind rk, Row v)
        : key(std::move(k)), sequence_number(seq), kind(rk), value(std::move(v)) {}

    bool isAdd() const { return lakestore::isAdd(kind); }
};

// --- Comparison ---
int compareValues(const Value& a, const Value& b);
int compareRows(const Row& a, const Row& b);

struct RowLess {
    bool operator()(const Row& a, const Row& b) const { return compareRows(a, b) < 0; }
};

/**
 * @brief Orders records by key ascending, then by sequence number ascending.
 */
struct KeyValueOrder {
    bool operator()(const KeyValue& a, const KeyValue& b) const {
        int c = compareRows(a.key, b.key);
        if (c != 0) return c < 0;
        return a.sequence_number < b.sequence_number;
    }
};

// --- Helpers ---
bool isNull(const Value& v);
bool valueMatchesType(const Value& v, DataType type);
std::string valueToString(const Value& v);
std::string rowToString(const Row& row);
std::string dataTypeToString(DataType type);
std::optional<DataType> dataTypeFromString(const std::string& s);
std::string rowKindToShortString(RowKind kind);

// Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF.
bool isValidUtf8(const std::string& s);

// Rough in-memory footprint, used for write-buffer accounting.
size_t estimateRowSize(const Row& row);

Row projectRow(const Row& row, const std::vector<size_t>& indices);

// zlib CRC32 over a byte range.
uint32_t computeChecksum(const void* data, size_t size);

int64_t currentTimeMillis();

} // namespace lakestore
