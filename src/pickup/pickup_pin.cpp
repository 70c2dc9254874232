#include "pickup/pickup_pin.hpp"
#include "crypto/keys.hpp"

#include <algorithm>

namespace waypool::pickup {

bool is_valid_pin_format(std::string_view pin) {
    return pin.size() == PIN_LENGTH &&
           std::all_of(pin.begin(), pin.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool is_weak_pin(std::string_view pin) {
    if (!is_valid_pin_format(pin)) {
        return false;
    }

    bool same = true;
    bool ascending = true;
    bool descending = true;
    for (size_t i = 1; i < pin.size(); ++i) {
        const int step = pin[i] - pin[i - 1];
        same = same && step == 0;
        ascending = ascending && step == 1;
        descending = descending && step == -1;
    }
    return same || ascending || descending;
}

std::string generate_pin() {
    return generate_pin([](uint32_t upper_bound) { return crypto::random_uniform(upper_bound); });
}

std::string generate_pin(const UniformDraw& draw) {
    std::string pin(PIN_LENGTH, '0');
    do {
        uint32_t value = draw(PIN_SPACE) % PIN_SPACE;
        for (size_t i = PIN_LENGTH; i-- > 0;) {
            pin[i] = static_cast<char>('0' + value % 10);
            value /= 10;
        }
    } while (is_weak_pin(pin));
    return pin;
}

bool is_locked(const AttemptState& state, Timestamp now) {
    return state.locked_until && *state.locked_until > now;
}

AttemptState expire_lockout(const AttemptState& state, Timestamp now) {
    if (state.locked_until && *state.locked_until <= now) {
        return AttemptState{};
    }
    return state;
}

AttemptState after_failure(const AttemptState& state, const PinPolicy& policy, Timestamp now) {
    AttemptState next = expire_lockout(state, now);
    if (is_locked(next, now)) {
        return next;  // Counter frozen while locked
    }
    next.attempts += 1;
    if (next.attempts >= policy.max_attempts) {
        next.locked_until = now + policy.lockout;
    }
    return next;
}

AttemptState after_success() {
    return AttemptState{};
}

int attempts_remaining(const AttemptState& state, const PinPolicy& policy) {
    return std::max(0, policy.max_attempts - state.attempts);
}

} // namespace waypool::pickup
