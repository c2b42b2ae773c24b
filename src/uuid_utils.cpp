// src/uuid_utils.cpp
#include "../include/uuid_utils.h"

#include <openssl/rand.h>
#include <openssl/err.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lakestore {

namespace {
    std::string getOpenSSLError() {
        unsigned long err_code = ERR_get_error();
        if (err_code == 0) return "No error";
        char buffer[256];
        ERR_error_string_n(err_code, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}

std::vector<unsigned char> generateRandomBytes(int size) {
    if (size <= 0) {
        throw std::runtime_error("Invalid size for random bytes generation");
    }
    std::vector<unsigned char> bytes(size);
    if (RAND_bytes(bytes.data(), size) != 1) {
        throw std::runtime_error("RAND_bytes failed: " + getOpenSSLError());
    }
    return bytes;
}

std::string generateUuid() {
    std::vector<unsigned char> b = generateRandomBytes(16);
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40); // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80); // variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < b.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<int>(b[i]);
    }
    return oss.str();
}

} // namespace lakestore
