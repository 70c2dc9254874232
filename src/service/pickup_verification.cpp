#include "service/pickup_verification.hpp"
#include "service/audit.hpp"
#include "service/snapshots.hpp"
#include "core/logging.hpp"

namespace waypool::service {

PickupVerifier::PickupVerifier(storage::Database& db,
                               const Clock& clock,
                               const pickup::CredentialService& credentials,
                               Notifier* notifier)
    : db_(db)
    , clock_(clock)
    , credentials_(credentials)
    , notifier_(notifier)
    , rides_(db)
    , bookings_(db) {}

Result<Booking, Error> PickupVerifier::verify(const Caller& caller,
                                              BookingId booking_id,
                                              std::string_view pin) {
    if (!pickup::is_valid_pin_format(pin)) {
        return Result<Booking, Error>::err(
            Error{"PIN must be exactly 4 digits", ErrorCode::InvalidCredentialFormat});
    }
    if (caller.role != Role::Driver) {
        return Result<Booking, Error>::err(
            Error{"Only drivers can verify pickups", ErrorCode::Forbidden});
    }

    const auto now = clock_.now();
    auto outcome = log_internal(waypoolPickup, "verify pickup",
        db_.transaction([&]() { return evaluate(caller, booking_id, pin, now); }));
    if (outcome.is_err()) {
        return Result<Booking, Error>::err(outcome.unwrap_err());
    }

    auto& decided = outcome.unwrap();
    if (decided.rejection) {
        return Result<Booking, Error>::err(*decided.rejection);
    }

    if (decided.newly_picked_up) {
        qCInfo(waypoolPickup) << "booking" << decided.booking.id.value << "picked up";
        QJsonObject payload;
        payload.insert(QStringLiteral("booking"), booking_to_json(decided.booking));
        notify_best_effort(notifier_, decided.booking.rider_id, "booking.picked_up", payload);
    }
    return Result<Booking, Error>::ok(std::move(decided.booking));
}

Result<PickupVerifier::Outcome, Error> PickupVerifier::evaluate(const Caller& caller,
                                                                BookingId booking_id,
                                                                std::string_view pin,
                                                                Timestamp now) {
    auto booking_result = bookings_.get(booking_id);
    if (booking_result.is_err()) {
        return Result<Outcome, Error>::err(booking_result.unwrap_err());
    }
    if (!booking_result.unwrap()) {
        return Result<Outcome, Error>::err(
            Error{"Booking " + booking_id.to_string() + " not found", ErrorCode::NotFound});
    }
    Booking booking = std::move(*booking_result.unwrap());

    auto ride_result = rides_.get(booking.ride_id);
    if (ride_result.is_err()) {
        return Result<Outcome, Error>::err(ride_result.unwrap_err());
    }
    if (!ride_result.unwrap()) {
        return Result<Outcome, Error>::err(
            Error{"Ride " + booking.ride_id.to_string() + " not found", ErrorCode::NotFound});
    }
    const Ride& ride = *ride_result.unwrap();

    if (ride.driver_id != caller.user_id) {
        return Result<Outcome, Error>::err(Error{"You do not own this ride", ErrorCode::Forbidden});
    }
    if (ride.status != RideStatus::InProgress) {
        return Result<Outcome, Error>::err(
            Error{"Ride must be in progress to verify pickup", ErrorCode::InvalidState});
    }
    if (booking.status != BookingStatus::Confirmed) {
        return Result<Outcome, Error>::err(
            Error{"Only confirmed bookings can be picked up", ErrorCode::InvalidState});
    }
    if (booking.pickup_status == PickupStatus::PickedUp) {
        return Result<Outcome, Error>::ok(Outcome{std::move(booking), std::nullopt, false});
    }
    if (!booking.credential) {
        return Result<Outcome, Error>::err(
            Error{"No pickup PIN has been issued for this booking", ErrorCode::InvalidState});
    }
    if (booking.credential_state(now) == CredentialState::Expired) {
        return Result<Outcome, Error>::err(
            Error{"Pickup PIN has expired", ErrorCode::CredentialExpired});
    }

    const auto& policy = credentials_.policy();
    const pickup::AttemptState attempts{booking.pickup_pin_attempts, booking.pickup_pin_locked_until};
    if (pickup::is_locked(attempts, now)) {
        return Result<Outcome, Error>::err(Error::credential_locked(*attempts.locked_until));
    }

    if (credentials_.matches(*booking.credential, pin)) {
        const auto cleared = pickup::after_success();
        auto marked = bookings_.mark_picked_up(booking.id, cleared.attempts, cleared.locked_until, now);
        if (marked.is_err()) {
            return Result<Outcome, Error>::err(marked.unwrap_err());
        }
        booking.pickup_status = PickupStatus::PickedUp;
        booking.picked_up_at = now;
        booking.pickup_pin_attempts = cleared.attempts;
        booking.pickup_pin_locked_until = cleared.locked_until;
        booking.updated_at = now;
        return Result<Outcome, Error>::ok(Outcome{std::move(booking), std::nullopt, true});
    }

    const auto next = pickup::after_failure(attempts, policy, now);
    auto stored = bookings_.update_pin_attempts(booking.id, next.attempts, next.locked_until, now);
    if (stored.is_err()) {
        return Result<Outcome, Error>::err(stored.unwrap_err());
    }

    const int remaining = pickup::attempts_remaining(next, policy);
    if (next.locked_until) {
        qCWarning(waypoolPickup) << "booking" << booking.id.value << "locked after"
                                 << next.attempts << "failed PIN attempts";
    } else {
        qCInfo(waypoolPickup) << "wrong PIN for booking" << booking.id.value
                              << "attempts remaining" << remaining;
    }

    booking.pickup_pin_attempts = next.attempts;
    booking.pickup_pin_locked_until = next.locked_until;
    booking.updated_at = now;
    return Result<Outcome, Error>::ok(
        Outcome{std::move(booking), Error::credential_mismatch(remaining), false});
}

} // namespace waypool::service
