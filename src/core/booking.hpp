#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "core/ride.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace waypool {

enum class BookingStatus {
    Pending,
    Confirmed,
    Rejected,
    Cancelled,
    Completed
};

enum class PickupStatus {
    Pending,
    PickedUp
};

/**
 * BookingEvent - The declared edges of the booking lifecycle.
 *
 *   pending   --Accept-->   confirmed
 *   pending   --Reject-->   rejected
 *   pending   --Cancel-->   cancelled
 *   confirmed --Cancel-->   cancelled
 *   confirmed --Complete--> completed
 */
enum class BookingEvent {
    Accept,
    Reject,
    Cancel,
    Complete
};

[[nodiscard]] constexpr std::string_view to_string(BookingStatus status) {
    switch (status) {
        case BookingStatus::Pending: return "pending";
        case BookingStatus::Confirmed: return "confirmed";
        case BookingStatus::Rejected: return "rejected";
        case BookingStatus::Cancelled: return "cancelled";
        case BookingStatus::Completed: return "completed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(PickupStatus status) {
    switch (status) {
        case PickupStatus::Pending: return "pending";
        case PickupStatus::PickedUp: return "picked_up";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(BookingEvent event) {
    switch (event) {
        case BookingEvent::Accept: return "accept";
        case BookingEvent::Reject: return "reject";
        case BookingEvent::Cancel: return "cancel";
        case BookingEvent::Complete: return "complete";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BookingStatus> parse_booking_status(std::string_view name);
[[nodiscard]] std::optional<PickupStatus> parse_pickup_status(std::string_view name);

/**
 * Apply a lifecycle event to a booking status. Only the edges listed on
 * BookingEvent are legal; everything else is InvalidState.
 */
[[nodiscard]] Result<BookingStatus> transition(BookingStatus from, BookingEvent event);

/**
 * Seats count against the ride's inventory iff the booking is confirmed.
 */
[[nodiscard]] constexpr bool holds_seats(BookingStatus status) {
    return status == BookingStatus::Confirmed;
}

/**
 * A rider may edit seats or pickup location until the ride starts.
 */
[[nodiscard]] Result<void> check_editable(BookingStatus booking, RideStatus ride);

/**
 * PickupCredential - Stored forms of an issued pickup PIN. The plaintext
 * is never part of a booking.
 */
struct PickupCredential {
    std::string pin_hash;       // Argon2id encoded string
    std::string pin_encrypted;  // base64(nonce || secretbox)
    Timestamp expires_at;

    bool operator==(const PickupCredential&) const = default;
};

enum class CredentialState {
    None,
    Active,
    Expired
};

/**
 * Booking - One rider's request for seats on one ride.
 */
struct Booking {
    BookingId id;
    RideId ride_id;
    UserId rider_id;
    std::string confirmation_number;
    Location pickup;
    int number_of_seats{1};
    int64_t price_per_seat_cents{0};
    BookingStatus status{BookingStatus::Pending};
    PickupStatus pickup_status{PickupStatus::Pending};
    std::optional<PickupCredential> credential;
    int pickup_pin_attempts{0};
    std::optional<Timestamp> pickup_pin_locked_until;
    std::optional<Timestamp> picked_up_at;
    std::optional<std::string> payment_authorization;
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] CredentialState credential_state(Timestamp now) const {
        if (!credential) return CredentialState::None;
        return credential->expires_at <= now ? CredentialState::Expired : CredentialState::Active;
    }

    bool operator==(const Booking&) const = default;
};

} // namespace waypool
