// include/uuid_utils.h
#pragma once

#include <string>
#include <vector>

namespace lakestore {

/**
 * @brief Cryptographically random bytes from OpenSSL.
 * @throws std::runtime_error if the RNG fails.
 */
std::vector<unsigned char> generateRandomBytes(int size);

/**
 * @brief Random RFC 4122 version-4 UUID in canonical 8-4-4-4-12 form.
 * Unique names for data files, manifests and consumers come from here.
 */
std::string generateUuid();

} // namespace lakestore
