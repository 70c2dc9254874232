#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>
#include <optional>

#include <sodium.h>

namespace waypool::crypto {

/**
 * HashParams - Argon2id cost parameters for crypto_pwhash_str.
 */
struct HashParams {
    unsigned long long opslimit;
    size_t memlimit;

    [[nodiscard]] static HashParams interactive() {
        return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    }

    [[nodiscard]] static HashParams moderate() {
        return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
    }

    [[nodiscard]] static HashParams sensitive() {
        return {crypto_pwhash_OPSLIMIT_SENSITIVE, crypto_pwhash_MEMLIMIT_SENSITIVE};
    }

    // Library minimum; only for tests.
    [[nodiscard]] static HashParams minimal() {
        return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
    }

    [[nodiscard]] static std::optional<HashParams> from_name(std::string_view name) {
        if (name == "interactive") return interactive();
        if (name == "moderate") return moderate();
        if (name == "sensitive") return sensitive();
        if (name == "minimal") return minimal();
        return std::nullopt;
    }
};

/**
 * Hash a secret into a self-describing Argon2id string (salt and cost
 * parameters embedded).
 */
[[nodiscard]] inline Result<std::string, Error> hash_secret(
    std::string_view secret,
    const HashParams& params
) {
    char out[crypto_pwhash_STRBYTES];
    if (crypto_pwhash_str(out, secret.data(), secret.size(),
                          params.opslimit, params.memlimit) != 0) {
        return Result<std::string, Error>::err(Error{"Argon2 hashing failed (out of memory)"});
    }
    return Result<std::string, Error>::ok(std::string(out));
}

/**
 * Check a secret against a hash produced by hash_secret.
 */
[[nodiscard]] inline bool verify_secret(std::string_view secret, const std::string& encoded_hash) {
    if (encoded_hash.empty() || encoded_hash.size() >= crypto_pwhash_STRBYTES) {
        return false;
    }
    return crypto_pwhash_str_verify(encoded_hash.c_str(), secret.data(), secret.size()) == 0;
}

} // namespace waypool::crypto
