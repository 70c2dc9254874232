#pragma once

#include "core/booking.hpp"
#include "core/caller.hpp"
#include "core/clock.hpp"
#include "core/result.hpp"
#include "pickup/credential_service.hpp"
#include "service/collaborators.hpp"
#include "storage/booking_repository.hpp"
#include "storage/database.hpp"
#include "storage/ride_repository.hpp"
#include <string_view>

namespace waypool::service {

/**
 * PickupVerifier - Checks a driver-submitted PIN and records the pickup.
 *
 * Checks, in order: PIN format, ride ownership, ride in progress, booking
 * confirmed, already picked up (success, nothing written), credential
 * present and unexpired, lockout, hash comparison.
 *
 * The whole check runs in one immediate transaction so concurrent
 * attempts on a booking serialize. A wrong PIN still commits: the
 * incremented counter is stored before CredentialMismatch is returned.
 */
class PickupVerifier {
public:
    PickupVerifier(storage::Database& db,
                   const Clock& clock,
                   const pickup::CredentialService& credentials,
                   Notifier* notifier = nullptr);

    [[nodiscard]] Result<Booking, Error> verify(const Caller& caller,
                                                BookingId booking_id,
                                                std::string_view pin);

private:
    // What the transaction decided; a rejection is reported only after commit.
    struct Outcome {
        Booking booking;
        std::optional<Error> rejection;
        bool newly_picked_up = false;
    };

    storage::Database& db_;
    const Clock& clock_;
    const pickup::CredentialService& credentials_;
    Notifier* notifier_;

    storage::RideRepository rides_;
    storage::BookingRepository bookings_;

    [[nodiscard]] Result<Outcome, Error> evaluate(const Caller& caller,
                                                  BookingId booking_id,
                                                  std::string_view pin,
                                                  Timestamp now);
};

} // namespace waypool::service
