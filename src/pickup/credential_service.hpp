#pragma once

#include "pickup/pickup_pin.hpp"
#include "core/booking.hpp"
#include "core/result.hpp"
#include "crypto/keys.hpp"
#include "crypto/password_hash.hpp"
#include <string>
#include <string_view>

namespace waypool::pickup {

/**
 * CredentialService - Issues pickup PINs and stores them twice: an
 * Argon2id hash that verification compares against, and a secretbox
 * ciphertext the rider's screen decrypts for display.
 *
 * The secretbox key is derived from the server secret, so any process
 * configured with the same secret can reveal PINs issued by another.
 */
class CredentialService {
public:
    /**
     * Build a service from the server secret. An empty secret is
     * InvalidArgument; a libsodium that cannot initialize is Internal.
     */
    [[nodiscard]] static Result<CredentialService, Error> create(
        std::string_view secret,
        const crypto::HashParams& hash_params,
        const PinPolicy& policy);

    /**
     * Draw a new PIN and derive both stored forms. The credential
     * expires `policy().validity` after `now`.
     */
    [[nodiscard]] Result<PickupCredential, Error> issue(Timestamp now) const;

    /**
     * Derive both stored forms from a known PIN.
     */
    [[nodiscard]] Result<PickupCredential, Error> seal(std::string pin, Timestamp now) const;

    /**
     * Decrypt the PIN for display. Fails with CredentialExpired once the
     * validity window has passed.
     */
    [[nodiscard]] Result<std::string, Error> reveal(const PickupCredential& credential,
                                                    Timestamp now) const;

    /**
     * Compare a submitted PIN against the stored hash only.
     */
    [[nodiscard]] bool matches(const PickupCredential& credential, std::string_view pin) const;

    [[nodiscard]] const PinPolicy& policy() const { return policy_; }

private:
    CredentialService(crypto::SymmetricKey key, crypto::HashParams hash_params, PinPolicy policy)
        : key_(key), hash_params_(hash_params), policy_(policy) {}

    crypto::SymmetricKey key_;
    crypto::HashParams hash_params_;
    PinPolicy policy_;
};

} // namespace waypool::pickup
