#pragma once

#include "core/result.hpp"
#include <vector>
#include <array>
#include <string>
#include <string_view>
#include <cstdint>

#include <sodium.h>

namespace waypool::crypto {

constexpr size_t SYMMETRIC_KEY_SIZE = crypto_secretbox_KEYBYTES;

using SymmetricKey = std::array<uint8_t, SYMMETRIC_KEY_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * Uniform random integer in [0, upper_bound) from the system CSPRNG.
 */
[[nodiscard]] inline uint32_t random_uniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

/**
 * Derive a symmetric key from a server-held secret (BLAKE2b-256 over a
 * context label and the secret). Deterministic: the same secret always
 * yields the same key.
 */
[[nodiscard]] inline SymmetricKey derive_key(std::string_view secret, std::string_view context) {
    SymmetricKey key{};
    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, key.size());
    crypto_generichash_update(&state,
        reinterpret_cast<const unsigned char*>(context.data()), context.size());
    crypto_generichash_update(&state,
        reinterpret_cast<const unsigned char*>(secret.data()), secret.size());
    crypto_generichash_final(&state, key.data(), key.size());
    return key;
}

/**
 * Encode bytes as Base64.
 */
[[nodiscard]] inline std::string to_base64(const std::vector<uint8_t>& data) {
    static const char* chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        result += chars[(n >> 18) & 0x3F];
        result += chars[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? chars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? chars[n & 0x3F] : '=';
    }

    return result;
}

/**
 * Decode Base64 to bytes.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_base64(std::string_view b64) {
    auto decode = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::vector<uint8_t> result;
    result.reserve(b64.size() * 3 / 4);

    uint32_t accum = 0;
    int bits = 0;

    for (char c : b64) {
        if (c == '=') break;
        int val = decode(c);
        if (val < 0) {
            return Result<std::vector<uint8_t>, Error>::err(Error{"Invalid Base64"});
        }
        accum = (accum << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }

    return Result<std::vector<uint8_t>, Error>::ok(std::move(result));
}

/**
 * Securely zero memory.
 */
inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

inline void secure_zero(std::string& s) {
    if (!s.empty()) {
        sodium_memzero(s.data(), s.size());
    }
    s.clear();
}

} // namespace waypool::crypto
