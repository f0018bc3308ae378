#pragma once
#include <cstdint>
#include <string>
#include <openssl/sha.h>

class HashUtils {
public:

    static std::string toHex(const unsigned char* data, size_t len) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            result += hex[(data[i] >> 4) & 0xF];
            result += hex[data[i] & 0xF];
        }
        return result;
    }

    static std::string sha256Hex(const std::string& data) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
        return toHex(hash, SHA256_DIGEST_LENGTH);
    }

};
