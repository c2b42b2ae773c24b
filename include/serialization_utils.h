// include/serialization_utils.h
#pragma once

#include "types.h"

#include <string>
#include <ostream>
#include <istream>
#include <stdexcept> // For std::runtime_error, std::overflow_error

namespace lakestore {

/**
 * @brief Serializes a string to an output stream with a 32-bit length prefix.
 * @throws std::overflow_error if the string is too long.
 * @throws std::runtime_error on stream write failure.
 */
void SerializeString(std::ostream& out, const std::string& str);

/**
 * @brief Deserializes a length-prefixed string from an input stream.
 * @throws std::runtime_error on stream read failure or data corruption.
 * @throws std::length_error if the serialized length is unreasonably large.
 */
std::string DeserializeString(std::istream& in);

void SerializeInt64(std::ostream& out, int64_t v);
int64_t DeserializeInt64(std::istream& in);

void SerializeUInt32(std::ostream& out, uint32_t v);
uint32_t DeserializeUInt32(std::istream& in);

/**
 * @brief Writes a value as a one-byte type tag followed by its payload.
 */
void SerializeValue(std::ostream& out, const Value& v);
Value DeserializeValue(std::istream& in);

// u32 arity followed by each value.
void SerializeRow(std::ostream& out, const Row& row);
Row DeserializeRow(std::istream& in);

/**
 * @brief Stable binary encoding of a row. Bucket assignment hashes this,
 * so the encoding must never change.
 */
std::string EncodeRowBinary(const Row& row);

} // namespace lakestore
