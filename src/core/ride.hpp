#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace waypool {

/**
 * Location - A street address with coordinates.
 */
struct Location {
    std::string address;
    std::string city;
    std::string state;
    std::string zip_code;
    double latitude{0.0};
    double longitude{0.0};

    bool operator==(const Location&) const = default;
};

enum class RideStatus {
    Scheduled,
    InProgress,
    Completed,
    Cancelled
};

enum class RideEvent {
    Start,
    Complete,
    Cancel
};

[[nodiscard]] constexpr std::string_view to_string(RideStatus status) {
    switch (status) {
        case RideStatus::Scheduled: return "scheduled";
        case RideStatus::InProgress: return "in-progress";
        case RideStatus::Completed: return "completed";
        case RideStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(RideEvent event) {
    switch (event) {
        case RideEvent::Start: return "start";
        case RideEvent::Complete: return "complete";
        case RideEvent::Cancel: return "cancel";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<RideStatus> parse_ride_status(std::string_view name) {
    if (name == "scheduled") return RideStatus::Scheduled;
    if (name == "in-progress") return RideStatus::InProgress;
    if (name == "completed") return RideStatus::Completed;
    if (name == "cancelled") return RideStatus::Cancelled;
    return std::nullopt;
}

[[nodiscard]] constexpr bool is_terminal(RideStatus status) {
    return status == RideStatus::Completed || status == RideStatus::Cancelled;
}

/**
 * Apply a lifecycle event to a ride status.
 *
 * scheduled -> in-progress (Start), in-progress -> completed (Complete),
 * {scheduled, in-progress} -> cancelled (Cancel). Anything else is InvalidState.
 */
[[nodiscard]] Result<RideStatus> transition(RideStatus from, RideEvent event);

// Published seat counts are bounded per ride.
constexpr int MIN_PUBLISHED_SEATS = 1;
constexpr int MAX_PUBLISHED_SEATS = 8;

/**
 * Ride - One published trip with a finite seat inventory.
 *
 * available_seats is written only by the seat ledger.
 */
struct Ride {
    RideId id;
    UserId driver_id;
    Location origin;
    Location destination;
    Timestamp departure;
    int total_seats{0};
    int available_seats{0};
    int64_t price_per_seat_cents{0};
    RideStatus status{RideStatus::Scheduled};
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] int reserved_seats() const noexcept {
        return total_seats - available_seats;
    }

    bool operator==(const Ride&) const = default;
};

} // namespace waypool
