#include "pickup/credential_service.hpp"
#include "crypto/encryption.hpp"
#include "core/logging.hpp"

#include <vector>

namespace waypool::pickup {
namespace {

constexpr std::string_view PIN_KEY_CONTEXT = "waypool.pickup-pin.v1";

} // namespace

Result<CredentialService, Error> CredentialService::create(
    std::string_view secret,
    const crypto::HashParams& hash_params,
    const PinPolicy& policy
) {
    if (secret.empty()) {
        return Result<CredentialService, Error>::err(
            Error{"Pickup PIN secret must not be empty", ErrorCode::InvalidArgument});
    }
    if (policy.max_attempts < 1) {
        return Result<CredentialService, Error>::err(
            Error{"Pickup PIN max attempts must be at least 1", ErrorCode::InvalidArgument});
    }

    auto init_result = crypto::init();
    if (init_result.is_err()) {
        return Result<CredentialService, Error>::err(init_result.unwrap_err());
    }

    return Result<CredentialService, Error>::ok(
        CredentialService(crypto::derive_key(secret, PIN_KEY_CONTEXT), hash_params, policy));
}

Result<PickupCredential, Error> CredentialService::issue(Timestamp now) const {
    return seal(generate_pin(), now);
}

Result<PickupCredential, Error> CredentialService::seal(std::string pin, Timestamp now) const {
    if (!is_valid_pin_format(pin)) {
        crypto::secure_zero(pin);
        return Result<PickupCredential, Error>::err(
            Error{"PIN must be exactly 4 digits", ErrorCode::InvalidCredentialFormat});
    }

    auto hash_result = crypto::hash_secret(pin, hash_params_);

    std::vector<uint8_t> plaintext(pin.begin(), pin.end());
    auto encrypted = crypto::encrypt_symmetric(plaintext, key_);
    crypto::secure_zero(plaintext.data(), plaintext.size());
    crypto::secure_zero(pin);

    if (hash_result.is_err()) {
        return Result<PickupCredential, Error>::err(hash_result.unwrap_err());
    }
    if (encrypted.is_err()) {
        return Result<PickupCredential, Error>::err(encrypted.unwrap_err());
    }

    return Result<PickupCredential, Error>::ok(PickupCredential{
        .pin_hash = std::move(hash_result).unwrap(),
        .pin_encrypted = crypto::to_base64(encrypted.unwrap()),
        .expires_at = now + policy_.validity
    });
}

Result<std::string, Error> CredentialService::reveal(
    const PickupCredential& credential,
    Timestamp now
) const {
    if (credential.expires_at <= now) {
        return Result<std::string, Error>::err(
            Error{"Pickup PIN has expired", ErrorCode::CredentialExpired});
    }

    auto decoded = crypto::from_base64(credential.pin_encrypted);
    if (decoded.is_err()) {
        return Result<std::string, Error>::err(decoded.unwrap_err());
    }

    auto decrypted = crypto::decrypt_symmetric(decoded.unwrap(), key_);
    if (decrypted.is_err()) {
        qCCritical(waypoolPickup) << "stored pickup PIN does not decrypt; was the secret rotated?";
        return Result<std::string, Error>::err(decrypted.unwrap_err());
    }

    auto& bytes = decrypted.unwrap();
    std::string pin(bytes.begin(), bytes.end());
    crypto::secure_zero(bytes.data(), bytes.size());

    if (!is_valid_pin_format(pin)) {
        crypto::secure_zero(pin);
        return Result<std::string, Error>::err(Error{"Stored pickup PIN is malformed"});
    }
    return Result<std::string, Error>::ok(std::move(pin));
}

bool CredentialService::matches(const PickupCredential& credential, std::string_view pin) const {
    return crypto::verify_secret(pin, credential.pin_hash);
}

} // namespace waypool::pickup
