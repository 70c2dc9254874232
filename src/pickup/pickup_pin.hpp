#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace waypool::pickup {

constexpr size_t PIN_LENGTH = 4;
constexpr uint32_t PIN_SPACE = 10000;  // 0000..9999

/**
 * Exactly four ASCII digits.
 */
[[nodiscard]] bool is_valid_pin_format(std::string_view pin);

/**
 * Deny-listed PINs: one repeated digit (0000, 1111, ...), ascending runs
 * (0123 .. 6789) and descending runs (9876 .. 3210).
 */
[[nodiscard]] bool is_weak_pin(std::string_view pin);

// Source of uniform integers in [0, upper_bound).
using UniformDraw = std::function<uint32_t(uint32_t upper_bound)>;

/**
 * Draw a PIN uniformly from 0000..9999, redrawing until it is not weak.
 * The default draw is libsodium's randombytes_uniform.
 */
[[nodiscard]] std::string generate_pin();
[[nodiscard]] std::string generate_pin(const UniformDraw& draw);

/**
 * PinPolicy - Lifetime and brute-force limits of a pickup PIN.
 */
struct PinPolicy {
    std::chrono::hours validity{24};
    int max_attempts{5};
    std::chrono::minutes lockout{10};
};

/**
 * AttemptState - Failed-attempt counter and lockout marker of a booking.
 *
 * The functions below are the whole lockout policy; they never touch the
 * store and take "now" explicitly.
 */
struct AttemptState {
    int attempts{0};
    std::optional<Timestamp> locked_until;

    bool operator==(const AttemptState&) const = default;
};

[[nodiscard]] bool is_locked(const AttemptState& state, Timestamp now);

// A lockout that has run out starts the count again from zero.
[[nodiscard]] AttemptState expire_lockout(const AttemptState& state, Timestamp now);

[[nodiscard]] AttemptState after_failure(const AttemptState& state,
                                         const PinPolicy& policy,
                                         Timestamp now);

[[nodiscard]] AttemptState after_success();

[[nodiscard]] int attempts_remaining(const AttemptState& state, const PinPolicy& policy);

} // namespace waypool::pickup
