#include "service/ride_service.hpp"
#include "service/audit.hpp"
#include "service/booking_service.hpp"
#include "service/snapshots.hpp"
#include "core/logging.hpp"

namespace waypool::service {

RideService::RideService(storage::Database& db, const Clock& clock, Notifier* notifier)
    : db_(db)
    , clock_(clock)
    , notifier_(notifier)
    , rides_(db)
    , bookings_(db)
    , ledger_(db) {}

Result<Ride, Error> RideService::publish(const Caller& caller, const RideListing& listing) {
    if (caller.role != Role::Driver) {
        return Result<Ride, Error>::err(Error{"Only drivers can publish rides", ErrorCode::Forbidden});
    }
    if (listing.seats < MIN_PUBLISHED_SEATS || listing.seats > MAX_PUBLISHED_SEATS) {
        return Result<Ride, Error>::err(Error{
            "Available seats must be between " + std::to_string(MIN_PUBLISHED_SEATS) +
                " and " + std::to_string(MAX_PUBLISHED_SEATS),
            ErrorCode::InvalidArgument});
    }
    if (listing.price_per_seat_cents < 0) {
        return Result<Ride, Error>::err(Error{"Price per seat cannot be negative", ErrorCode::InvalidArgument});
    }
    if (listing.departure.millis() <= 0) {
        return Result<Ride, Error>::err(Error{"Departure time is required", ErrorCode::InvalidArgument});
    }
    for (const auto& [location, what] : {std::pair{&listing.origin, "Origin"},
                                         std::pair{&listing.destination, "Destination"}}) {
        auto valid = validate_location(*location, what);
        if (valid.is_err()) {
            return Result<Ride, Error>::err(valid.unwrap_err());
        }
    }

    const auto now = clock_.now();
    auto result = log_internal(waypoolRide, "publish ride", rides_.insert(Ride{
        .driver_id = caller.user_id,
        .origin = listing.origin,
        .destination = listing.destination,
        .departure = listing.departure,
        .total_seats = listing.seats,
        .available_seats = listing.seats,
        .price_per_seat_cents = listing.price_per_seat_cents,
        .status = RideStatus::Scheduled,
        .created_at = now,
        .updated_at = now
    }));
    if (result.is_ok()) {
        qCInfo(waypoolRide) << "ride" << result.unwrap().id.value << "published with"
                            << listing.seats << "seats";
    }
    return result;
}

Result<Ride, Error> RideService::start(const Caller& caller, RideId ride_id) {
    return apply(caller, ride_id, RideEvent::Start);
}

Result<Ride, Error> RideService::complete(const Caller& caller, RideId ride_id) {
    return apply(caller, ride_id, RideEvent::Complete);
}

Result<Ride, Error> RideService::cancel(const Caller& caller, RideId ride_id) {
    return apply(caller, ride_id, RideEvent::Cancel);
}

Result<Ride, Error> RideService::apply(const Caller& caller, RideId ride_id, RideEvent event) {
    if (caller.role != Role::Driver) {
        return Result<Ride, Error>::err(Error{"Only drivers can change rides", ErrorCode::Forbidden});
    }

    const auto now = clock_.now();
    std::vector<Booking> touched;
    auto result = log_internal(waypoolRide, "update ride",
        db_.transaction([&]() -> Result<Ride, Error> {
            auto ride_result = get(ride_id);
            if (ride_result.is_err()) {
                return ride_result;
            }
            const Ride ride = std::move(ride_result).unwrap();
            if (ride.driver_id != caller.user_id) {
                return Result<Ride, Error>::err(Error{"You do not own this ride", ErrorCode::Forbidden});
            }

            auto next = transition(ride.status, event);
            if (next.is_err()) {
                return Result<Ride, Error>::err(next.unwrap_err());
            }

            auto updated = rides_.update_status(ride.id, ride.status, next.unwrap(), now);
            if (updated.is_err()) {
                return Result<Ride, Error>::err(updated.unwrap_err());
            }
            if (!updated.unwrap()) {
                return Result<Ride, Error>::err(
                    Error{"Ride changed while being updated", ErrorCode::InvalidState});
            }

            auto settled = settle_bookings(ride, event, now);
            if (settled.is_err()) {
                return Result<Ride, Error>::err(settled.unwrap_err());
            }
            touched = std::move(settled).unwrap();
            return get(ride.id);
        }));

    if (result.is_err()) {
        return result;
    }

    const auto& ride = result.unwrap();
    qCInfo(waypoolRide) << "ride" << ride.id.value << "is now"
                        << QString::fromUtf8(to_string(ride.status).data())
                        << "," << touched.size() << "bookings settled";

    if (event == RideEvent::Cancel) {
        for (const auto& booking : touched) {
            QJsonObject payload;
            payload.insert(QStringLiteral("ride"), ride_to_json(ride));
            payload.insert(QStringLiteral("booking"), booking_to_json(booking));
            notify_best_effort(notifier_, booking.rider_id, "ride.cancelled", payload);
        }
    }
    return result;
}

Result<std::vector<Booking>, Error> RideService::settle_bookings(const Ride& ride, RideEvent event, Timestamp now) {
    if (event == RideEvent::Start) {
        return Result<std::vector<Booking>, Error>::ok({});
    }

    auto bookings = bookings_.get_by_ride(ride.id);
    if (bookings.is_err()) {
        return Result<std::vector<Booking>, Error>::err(bookings.unwrap_err());
    }

    std::vector<Booking> touched;
    int seats_to_release = 0;
    for (auto& booking : bookings.unwrap()) {
        BookingEvent booking_event = BookingEvent::Cancel;
        if (booking.status == BookingStatus::Confirmed && event == RideEvent::Complete) {
            booking_event = BookingEvent::Complete;
        } else if (booking.status != BookingStatus::Pending &&
                   booking.status != BookingStatus::Confirmed) {
            continue;
        }

        auto next = transition(booking.status, booking_event);
        if (next.is_err()) {
            return Result<std::vector<Booking>, Error>::err(next.unwrap_err());
        }
        auto updated = bookings_.update_status(booking.id, booking.status, next.unwrap(), now);
        if (updated.is_err()) {
            return Result<std::vector<Booking>, Error>::err(updated.unwrap_err());
        }
        if (!updated.unwrap()) {
            return Result<std::vector<Booking>, Error>::err(Error{
                "Booking " + booking.id.to_string() + " changed while settling its ride"});
        }

        if (booking_event == BookingEvent::Cancel && holds_seats(booking.status)) {
            seats_to_release += booking.number_of_seats;
        }
        booking.status = next.unwrap();
        booking.updated_at = now;
        touched.push_back(booking);
    }

    if (seats_to_release > 0) {
        auto released = ledger_.release(ride.id, seats_to_release);
        if (released.is_err()) {
            return Result<std::vector<Booking>, Error>::err(released.unwrap_err());
        }
    }
    return Result<std::vector<Booking>, Error>::ok(std::move(touched));
}

Result<Ride, Error> RideService::get(RideId ride_id) {
    auto result = rides_.get(ride_id);
    if (result.is_err()) {
        return log_internal(waypoolRide, "get ride", Result<Ride, Error>::err(result.unwrap_err()));
    }
    auto ride = std::move(result).unwrap();
    if (!ride) {
        return Result<Ride, Error>::err(
            Error{"Ride " + ride_id.to_string() + " not found", ErrorCode::NotFound});
    }
    return Result<Ride, Error>::ok(std::move(*ride));
}

Result<std::vector<Ride>, Error> RideService::list_for_driver(const Caller& caller) {
    if (caller.role != Role::Driver) {
        return Result<std::vector<Ride>, Error>::err(
            Error{"Only drivers have published rides", ErrorCode::Forbidden});
    }
    return log_internal(waypoolRide, "list rides", rides_.get_by_driver(caller.user_id));
}

} // namespace waypool::service
