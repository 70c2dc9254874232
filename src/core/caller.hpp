#pragma once

#include "core/types.hpp"
#include <optional>
#include <string_view>

namespace waypool {

enum class Role {
    Driver,
    Rider
};

[[nodiscard]] constexpr std::string_view to_string(Role role) {
    switch (role) {
        case Role::Driver: return "driver";
        case Role::Rider: return "rider";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Role> parse_role(std::string_view name) {
    if (name == "driver") return Role::Driver;
    if (name == "rider") return Role::Rider;
    return std::nullopt;
}

/**
 * Caller - The resolved identity an operation runs on behalf of.
 */
struct Caller {
    UserId user_id;
    Role role{Role::Rider};

    [[nodiscard]] static Caller driver(UserId id) { return Caller{id, Role::Driver}; }
    [[nodiscard]] static Caller rider(UserId id) { return Caller{id, Role::Rider}; }

    bool operator==(const Caller&) const = default;
};

} // namespace waypool
