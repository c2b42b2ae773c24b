// src/types.cpp
#include "../include/types.h"

#include <zlib.h> // For crc32

#include <chrono>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace lakestore {

namespace {
    template<typename T>
    int threeWay(const T& a, const T& b) {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }
}

int compareValues(const Value& a, const Value& b) {
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }
    switch (a.index()) {
        case 0: return 0; // NULL == NULL for ordering
        case 1: return threeWay(std::get<bool>(a), std::get<bool>(b));
        case 2: return threeWay(std::get<int64_t>(a), std::get<int64_t>(b));
        case 3: {
            double x = std::get<double>(a);
            double y = std::get<double>(b);
            // NaN sorts after every number so the order stays total.
            if (std::isnan(x) || std::isnan(y)) {
                return threeWay(std::isnan(x), std::isnan(y));
            }
            return threeWay(x, y);
        }
        case 4: return threeWay(std::get<std::string>(a), std::get<std::string>(b));
        default: return 0;
    }
}

int compareRows(const Row& a, const Row& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compareValues(a[i], b[i]);
        if (c != 0) return c;
    }
    return threeWay(a.size(), b.size());
}

bool isNull(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

bool valueMatchesType(const Value& v, DataType type) {
    if (isNull(v)) return true;
    switch (type) {
        case DataType::BOOLEAN: return std::holds_alternative<bool>(v);
        case DataType::BIGINT:  return std::holds_alternative<int64_t>(v);
        case DataType::DOUBLE:  return std::holds_alternative<double>(v);
        case DataType::STRING:  return std::holds_alternative<std::string>(v);
    }
    return false;
}

std::string valueToString(const Value& v) {
    switch (v.index()) {
        case 0: return "null";
        case 1: return std::get<bool>(v) ? "true" : "false";
        case 2: return std::to_string(std::get<int64_t>(v));
        case 3: {
            std::ostringstream oss;
            oss << std::setprecision(17) << std::get<double>(v);
            return oss.str();
        }
        case 4: return std::get<std::string>(v);
        default: return "?";
    }
}

std::string rowToString(const Row& row) {
    std::string out = "(";
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out += ", ";
        out += valueToString(row[i]);
    }
    out += ")";
    return out;
}

std::string dataTypeToString(DataType type) {
    switch (type) {
        case DataType::BOOLEAN: return "BOOLEAN";
        case DataType::BIGINT:  return "BIGINT";
        case DataType::DOUBLE:  return "DOUBLE";
        case DataType::STRING:  return "STRING";
    }
    return "UNKNOWN";
}

std::optional<DataType> dataTypeFromString(const std::string& s) {
    if (s == "BOOLEAN") return DataType::BOOLEAN;
    if (s == "BIGINT")  return DataType::BIGINT;
    if (s == "DOUBLE")  return DataType::DOUBLE;
    if (s == "STRING")  return DataType::STRING;
    return std::nullopt;
}

std::string rowKindToShortString(RowKind kind) {
    switch (kind) {
        case RowKind::INSERT:        return "+I";
        case RowKind::UPDATE_BEFORE: return "-U";
        case RowKind::UPDATE_AFTER:  return "+U";
        case RowKind::DELETE:        return "-D";
    }
    return "??";
}

bool isValidUtf8(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = p[i];
        if (c < 0x80) {
            i++;
            continue;
        }
        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        static const uint32_t MIN_FOR_LENGTH[5] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < MIN_FOR_LENGTH[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

size_t estimateRowSize(const Row& row) {
    size_t size = sizeof(Row);
    for (const auto& v : row) {
        size += sizeof(Value);
        if (const auto* s = std::get_if<std::string>(&v)) {
            size += s->size();
        }
    }
    return size;
}

Row projectRow(const Row& row, const std::vector<size_t>& indices) {
    Row out;
    out.reserve(indices.size());
    for (size_t idx : indices) {
        out.push_back(idx < row.size() ? row[idx] : Value{});
    }
    return out;
}

uint32_t computeChecksum(const void* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (size > 0) {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    }
    return static_cast<uint32_t>(crc);
}

int64_t currentTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace lakestore
