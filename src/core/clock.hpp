#pragma once

#include "core/types.hpp"

namespace waypool {

/**
 * Clock - Source of "now" for expiry and lockout checks.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }
};

} // namespace waypool
