//src/serialization_utils.cpp
#include "../include/serialization_utils.h"

#include <cstring>
#include <limits>
#include <sstream>

namespace lakestore {

namespace {
    enum ValueTag : uint8_t {
        TAG_NULL   = 0,
        TAG_BOOL   = 1,
        TAG_INT64  = 2,
        TAG_DOUBLE = 3,
        TAG_STRING = 4,
    };

    void readExact(std::istream& in, char* dst, size_t n, const char* what) {
        in.read(dst, static_cast<std::streamsize>(n));
        if (static_cast<size_t>(in.gcount()) != n) {
            throw std::runtime_error(std::string("Deserialize: truncated input while reading ") + what);
        }
    }
}

void SerializeString(std::ostream& out, const std::string& str) {
    if (str.length() > std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("SerializeString: String length exceeds uint32_t max.");
    }
    uint32_t len = static_cast<uint32_t>(str.length());
    out.write(reinterpret_cast<const char*>(&len), sizeof(len));
    if (!out) {
        throw std::runtime_error("SerializeString: Failed to write string length.");
    }
    if (len > 0) {
        out.write(str.data(), len);
        if (!out) {
            throw std::runtime_error("SerializeString: Failed to write string data.");
        }
    }
}

std::string DeserializeString(std::istream& in) {
    uint32_t len;
    readExact(in, reinterpret_cast<char*>(&len), sizeof(len), "string length");

    // Guards against allocating from a corrupt length.
    constexpr uint32_t MAX_SANE_STRING_LEN = 100 * 1024 * 1024; // 100MB
    if (len > MAX_SANE_STRING_LEN) {
        throw std::length_error("DeserializeString: String length in stream (" + std::to_string(len) + ") exceeds sanity limit.");
    }

    if (len == 0) return "";

    std::string str(len, '\0');
    readExact(in, &str[0], len, "string data");
    return str;
}

void SerializeInt64(std::ostream& out, int64_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
    if (!out) throw std::runtime_error("SerializeInt64: write failed.");
}

int64_t DeserializeInt64(std::istream& in) {
    int64_t v;
    readExact(in, reinterpret_cast<char*>(&v), sizeof(v), "int64");
    return v;
}

void SerializeUInt32(std::ostream& out, uint32_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
    if (!out) throw std::runtime_error("SerializeUInt32: write failed.");
}

uint32_t DeserializeUInt32(std::istream& in) {
    uint32_t v;
    readExact(in, reinterpret_cast<char*>(&v), sizeof(v), "uint32");
    return v;
}

void SerializeValue(std::ostream& out, const Value& v) {
    switch (v.index()) {
        case 0:
            out.put(static_cast<char>(TAG_NULL));
            break;
        case 1:
            out.put(static_cast<char>(TAG_BOOL));
            out.put(std::get<bool>(v) ? 1 : 0);
            break;
        case 2:
            out.put(static_cast<char>(TAG_INT64));
            SerializeInt64(out, std::get<int64_t>(v));
            break;
        case 3: {
            out.put(static_cast<char>(TAG_DOUBLE));
            double d = std::get<double>(v);
            out.write(reinterpret_cast<const char*>(&d), sizeof(d));
            break;
        }
        case 4:
            out.put(static_cast<char>(TAG_STRING));
            SerializeString(out, std::get<std::string>(v));
            break;
    }
    if (!out) throw std::runtime_error("SerializeValue: write failed.");
}

Value DeserializeValue(std::istream& in) {
    char tag;
    readExact(in, &tag, 1, "value tag");
    switch (static_cast<uint8_t>(tag)) {
        case TAG_NULL:
            return Value{};
        case TAG_BOOL: {
            char b;
            readExact(in, &b, 1, "bool");
            return Value{b != 0};
        }
        case TAG_INT64:
            return Value{DeserializeInt64(in)};
        case TAG_DOUBLE: {
            double d;
            readExact(in, reinterpret_cast<char*>(&d), sizeof(d), "double");
            return Value{d};
        }
        case TAG_STRING:
            return Value{DeserializeString(in)};
        default:
            throw std::runtime_error("DeserializeValue: unknown type tag " + std::to_string(static_cast<int>(tag)));
    }
}

void SerializeRow(std::ostream& out, const Row& row) {
    SerializeUInt32(out, static_cast<uint32_t>(row.size()));
    for (const auto& v : row) {
        SerializeValue(out, v);
    }
}

Row DeserializeRow(std::istream& in) {
    uint32_t arity = DeserializeUInt32(in);
    constexpr uint32_t MAX_SANE_ARITY = 1u << 16;
    if (arity > MAX_SANE_ARITY) {
        throw std::length_error("DeserializeRow: arity " + std::to_string(arity) + " exceeds sanity limit.");
    }
    Row row;
    row.reserve(arity);
    for (uint32_t i = 0; i < arity; ++i) {
        row.push_back(DeserializeValue(in));
    }
    return row;
}

std::string EncodeRowBinary(const Row& row) {
    std::ostringstream oss(std::ios::binary);
    SerializeRow(oss, row);
    return oss.str();
}

} // namespace lakestore
