#include "service/booking_service.hpp"
#include "service/audit.hpp"
#include "service/snapshots.hpp"
#include "core/logging.hpp"
#include "crypto/keys.hpp"

namespace waypool::service {
namespace {

constexpr std::string_view CONFIRMATION_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr size_t CONFIRMATION_SUFFIX_LENGTH = 6;

Error forbidden(const std::string& message) {
    return Error{message, ErrorCode::Forbidden};
}

Error invalid_state(const std::string& message) {
    return Error{message, ErrorCode::InvalidState};
}

Error seats_must_be_positive() {
    return Error{"Number of seats must be at least 1", ErrorCode::InvalidArgument};
}

QJsonObject event_payload(const Booking& booking) {
    QJsonObject payload;
    payload.insert(QStringLiteral("booking"), booking_to_json(booking));
    return payload;
}

} // namespace

Result<void, Error> validate_location(const Location& location, const char* what) {
    if (location.address.empty()) {
        return Result<void, Error>::err(Error{
            std::string(what) + " address is required", ErrorCode::InvalidArgument});
    }
    if (location.latitude < -90.0 || location.latitude > 90.0 ||
        location.longitude < -180.0 || location.longitude > 180.0) {
        return Result<void, Error>::err(Error{
            std::string(what) + " coordinates are out of range", ErrorCode::InvalidArgument});
    }
    return Result<void, Error>::ok();
}

BookingService::BookingService(storage::Database& db,
                               const Clock& clock,
                               const pickup::CredentialService& credentials,
                               PaymentAuthorizer* payments,
                               Notifier* notifier)
    : db_(db)
    , clock_(clock)
    , credentials_(credentials)
    , payments_(payments)
    , notifier_(notifier)
    , rides_(db)
    , bookings_(db)
    , ledger_(db) {}

std::string BookingService::make_confirmation_number(Timestamp now) {
    std::string suffix;
    suffix.reserve(CONFIRMATION_SUFFIX_LENGTH);
    for (size_t i = 0; i < CONFIRMATION_SUFFIX_LENGTH; ++i) {
        suffix += CONFIRMATION_ALPHABET[crypto::random_uniform(
            static_cast<uint32_t>(CONFIRMATION_ALPHABET.size()))];
    }
    return "WP-" + now.to_compact_date() + "-" + suffix;
}

Result<Booking, Error> BookingService::load_booking(BookingId id) {
    auto result = bookings_.get(id);
    if (result.is_err()) {
        return Result<Booking, Error>::err(result.unwrap_err());
    }
    auto booking = std::move(result).unwrap();
    if (!booking) {
        return Result<Booking, Error>::err(
            Error{"Booking " + id.to_string() + " not found", ErrorCode::NotFound});
    }
    return Result<Booking, Error>::ok(std::move(*booking));
}

Result<Ride, Error> BookingService::load_ride(RideId id) {
    auto result = rides_.get(id);
    if (result.is_err()) {
        return Result<Ride, Error>::err(result.unwrap_err());
    }
    auto ride = std::move(result).unwrap();
    if (!ride) {
        return Result<Ride, Error>::err(
            Error{"Ride " + id.to_string() + " not found", ErrorCode::NotFound});
    }
    return Result<Ride, Error>::ok(std::move(*ride));
}

// ============================================================================
// Create
// ============================================================================

Result<Booking, Error> BookingService::create(const Caller& caller, const BookingRequest& request) {
    auto result = log_internal(waypoolBooking, "create booking", do_create(caller, request));
    if (result.is_ok()) {
        const auto& booking = result.unwrap();
        qCInfo(waypoolBooking) << "booking" << booking.id.value << "requested on ride"
                               << booking.ride_id.value << "seats" << booking.number_of_seats;
    }
    return result;
}

Result<Booking, Error> BookingService::do_create(const Caller& caller, const BookingRequest& request) {
    if (caller.role != Role::Rider) {
        return Result<Booking, Error>::err(forbidden("Only riders can request bookings"));
    }
    if (request.number_of_seats < 1) {
        return Result<Booking, Error>::err(seats_must_be_positive());
    }
    auto location_ok = validate_location(request.pickup, "Pickup");
    if (location_ok.is_err()) {
        return Result<Booking, Error>::err(location_ok.unwrap_err());
    }

    // Cheap rejections before payment; repeated below under the write lock.
    auto ride_result = load_ride(request.ride_id);
    if (ride_result.is_err()) {
        return Result<Booking, Error>::err(ride_result.unwrap_err());
    }
    const Ride ride = std::move(ride_result).unwrap();

    if (ride.driver_id == caller.user_id) {
        return Result<Booking, Error>::err(forbidden("Drivers cannot book their own ride"));
    }
    if (ride.status != RideStatus::Scheduled) {
        return Result<Booking, Error>::err(invalid_state("Ride is not available for booking"));
    }
    if (ride.available_seats <= 0 || request.number_of_seats > ride.available_seats) {
        return Result<Booking, Error>::err(Error::insufficient_seats(ride.available_seats));
    }

    auto existing = bookings_.find_open(request.ride_id, caller.user_id);
    if (existing.is_err()) {
        return Result<Booking, Error>::err(existing.unwrap_err());
    }
    if (existing.unwrap()) {
        return Result<Booking, Error>::err(
            invalid_state("You already have an active booking for this ride"));
    }

    std::optional<std::string> authorization;
    if (payments_) {
        const int64_t amount = ride.price_per_seat_cents * request.number_of_seats;
        auto auth = payments_->authorize(amount, "rider:" + caller.user_id.to_string());
        if (auth.is_err()) {
            qCWarning(waypoolBooking) << "payment authorization declined for rider"
                                      << caller.user_id.value << ":" << auth.unwrap_err().message.c_str();
            return Result<Booking, Error>::err(Error{
                "Payment authorization failed: " + auth.unwrap_err().message,
                ErrorCode::PaymentFailed});
        }
        authorization = std::move(auth).unwrap();
    }

    const auto now = clock_.now();
    auto inserted = db_.transaction([&]() -> Result<Booking, Error> {
        auto current = load_ride(request.ride_id);
        if (current.is_err()) {
            return Result<Booking, Error>::err(current.unwrap_err());
        }
        if (current.unwrap().status != RideStatus::Scheduled) {
            return Result<Booking, Error>::err(invalid_state("Ride is not available for booking"));
        }

        auto duplicate = bookings_.find_open(request.ride_id, caller.user_id);
        if (duplicate.is_err()) {
            return Result<Booking, Error>::err(duplicate.unwrap_err());
        }
        if (duplicate.unwrap()) {
            return Result<Booking, Error>::err(
                invalid_state("You already have an active booking for this ride"));
        }

        return bookings_.insert(Booking{
            .ride_id = request.ride_id,
            .rider_id = caller.user_id,
            .confirmation_number = make_confirmation_number(now),
            .pickup = request.pickup,
            .number_of_seats = request.number_of_seats,
            .price_per_seat_cents = current.unwrap().price_per_seat_cents,
            .status = BookingStatus::Pending,
            .pickup_status = PickupStatus::Pending,
            .payment_authorization = authorization,
            .created_at = now,
            .updated_at = now
        });
    });

    if (inserted.is_err()) {
        if (authorization) {
            qCWarning(waypoolBooking) << "booking not stored; authorization"
                                      << authorization->c_str() << "left unused";
        }
        return inserted;
    }

    notify_best_effort(notifier_, ride.driver_id, "booking.requested", event_payload(inserted.unwrap()));
    return inserted;
}

// ============================================================================
// Accept / reject
// ============================================================================

Result<Booking, Error> BookingService::accept(const Caller& caller, BookingId booking_id) {
    auto result = log_internal(waypoolBooking, "accept booking", do_accept(caller, booking_id));
    if (result.is_ok()) {
        const auto& booking = result.unwrap();
        qCInfo(waypoolBooking) << "booking" << booking.id.value << "confirmed,"
                               << booking.number_of_seats << "seats reserved on ride"
                               << booking.ride_id.value;
        notify_best_effort(notifier_, booking.rider_id, "booking.accepted", event_payload(booking));
    } else if (result.unwrap_err().code == ErrorCode::InsufficientSeats) {
        qCInfo(waypoolBooking) << "booking" << booking_id.value << "not accepted:"
                               << result.unwrap_err().message.c_str();
    }
    return result;
}

Result<Booking, Error> BookingService::do_accept(const Caller& caller, BookingId booking_id) {
    if (caller.role != Role::Driver) {
        return Result<Booking, Error>::err(forbidden("Only drivers can accept bookings"));
    }

    // Validate before paying for an Argon2 hash; everything is re-read
    // under the write lock.
    auto preview = load_booking(booking_id);
    if (preview.is_err()) {
        return preview;
    }
    auto preview_ride = load_ride(preview.unwrap().ride_id);
    if (preview_ride.is_err()) {
        return Result<Booking, Error>::err(preview_ride.unwrap_err());
    }
    if (preview_ride.unwrap().driver_id != caller.user_id) {
        return Result<Booking, Error>::err(forbidden("You do not own this ride"));
    }
    auto preview_next = transition(preview.unwrap().status, BookingEvent::Accept);
    if (preview_next.is_err()) {
        return Result<Booking, Error>::err(preview_next.unwrap_err());
    }

    const auto now = clock_.now();
    auto credential = credentials_.issue(now);
    if (credential.is_err()) {
        return Result<Booking, Error>::err(credential.unwrap_err());
    }

    return db_.transaction([&]() -> Result<Booking, Error> {
        auto booking_result = load_booking(booking_id);
        if (booking_result.is_err()) {
            return booking_result;
        }
        const Booking booking = std::move(booking_result).unwrap();

        auto ride_result = load_ride(booking.ride_id);
        if (ride_result.is_err()) {
            return Result<Booking, Error>::err(ride_result.unwrap_err());
        }
        const Ride& ride = ride_result.unwrap();
        if (ride.driver_id != caller.user_id) {
            return Result<Booking, Error>::err(forbidden("You do not own this ride"));
        }

        auto next = transition(booking.status, BookingEvent::Accept);
        if (next.is_err()) {
            return Result<Booking, Error>::err(next.unwrap_err());
        }
        if (ride.status != RideStatus::Scheduled) {
            return Result<Booking, Error>::err(invalid_state(
                "Cannot accept bookings on a " + std::string(to_string(ride.status)) + " ride"));
        }

        auto reserved = ledger_.reserve(ride.id, booking.number_of_seats);
        if (reserved.is_err()) {
            return Result<Booking, Error>::err(reserved.unwrap_err());
        }

        auto confirmed = bookings_.confirm(booking.id, credential.unwrap(), now);
        if (confirmed.is_err()) {
            return Result<Booking, Error>::err(confirmed.unwrap_err());
        }
        if (!confirmed.unwrap()) {
            return Result<Booking, Error>::err(invalid_state("Booking changed while being accepted"));
        }

        return load_booking(booking.id);
    });
}

Result<Booking, Error> BookingService::reject(const Caller& caller, BookingId booking_id) {
    if (caller.role != Role::Driver) {
        return Result<Booking, Error>::err(forbidden("Only drivers can reject bookings"));
    }

    const auto now = clock_.now();
    auto result = log_internal(waypoolBooking, "reject booking",
        db_.transaction([&]() -> Result<Booking, Error> {
            auto booking_result = load_booking(booking_id);
            if (booking_result.is_err()) {
                return booking_result;
            }
            const Booking booking = std::move(booking_result).unwrap();

            auto ride_result = load_ride(booking.ride_id);
            if (ride_result.is_err()) {
                return Result<Booking, Error>::err(ride_result.unwrap_err());
            }
            if (ride_result.unwrap().driver_id != caller.user_id) {
                return Result<Booking, Error>::err(forbidden("You do not own this ride"));
            }

            auto next = transition(booking.status, BookingEvent::Reject);
            if (next.is_err()) {
                return Result<Booking, Error>::err(next.unwrap_err());
            }

            auto updated = bookings_.update_status(booking.id, booking.status, next.unwrap(), now);
            if (updated.is_err()) {
                return Result<Booking, Error>::err(updated.unwrap_err());
            }
            if (!updated.unwrap()) {
                return Result<Booking, Error>::err(invalid_state("Booking changed while being rejected"));
            }
            return load_booking(booking.id);
        }));

    if (result.is_ok()) {
        const auto& booking = result.unwrap();
        qCInfo(waypoolBooking) << "booking" << booking.id.value << "rejected";
        notify_best_effort(notifier_, booking.rider_id, "booking.rejected", event_payload(booking));
    }
    return result;
}

// ============================================================================
// Cancel / edit
// ============================================================================

Result<Booking, Error> BookingService::cancel(const Caller& caller, BookingId booking_id) {
    if (caller.role != Role::Rider) {
        return Result<Booking, Error>::err(forbidden("Only riders can cancel their bookings"));
    }

    const auto now = clock_.now();
    UserId driver_id;
    auto result = log_internal(waypoolBooking, "cancel booking",
        db_.transaction([&]() -> Result<Booking, Error> {
            auto booking_result = load_booking(booking_id);
            if (booking_result.is_err()) {
                return booking_result;
            }
            const Booking booking = std::move(booking_result).unwrap();
            if (booking.rider_id != caller.user_id) {
                return Result<Booking, Error>::err(forbidden("You do not own this booking"));
            }

            auto next = transition(booking.status, BookingEvent::Cancel);
            if (next.is_err()) {
                return Result<Booking, Error>::err(next.unwrap_err());
            }

            auto ride_result = load_ride(booking.ride_id);
            if (ride_result.is_err()) {
                return Result<Booking, Error>::err(ride_result.unwrap_err());
            }
            const Ride& ride = ride_result.unwrap();
            if (is_terminal(ride.status)) {
                return Result<Booking, Error>::err(invalid_state(
                    "Cannot cancel booking for a " + std::string(to_string(ride.status)) + " ride"));
            }
            driver_id = ride.driver_id;

            auto updated = bookings_.update_status(booking.id, booking.status, next.unwrap(), now);
            if (updated.is_err()) {
                return Result<Booking, Error>::err(updated.unwrap_err());
            }
            if (!updated.unwrap()) {
                return Result<Booking, Error>::err(invalid_state("Booking changed while being cancelled"));
            }

            if (holds_seats(booking.status)) {
                auto released = ledger_.release(ride.id, booking.number_of_seats);
                if (released.is_err()) {
                    return Result<Booking, Error>::err(released.unwrap_err());
                }
            }
            return load_booking(booking.id);
        }));

    if (result.is_ok()) {
        const auto& booking = result.unwrap();
        qCInfo(waypoolBooking) << "booking" << booking.id.value << "cancelled by rider";
        notify_best_effort(notifier_, driver_id, "booking.cancelled", event_payload(booking));
    }
    return result;
}

Result<Booking, Error> BookingService::edit(const Caller& caller,
                                            BookingId booking_id,
                                            const BookingEdit& changes) {
    bool changed = false;
    auto result = log_internal(waypoolBooking, "edit booking",
                               do_edit(caller, booking_id, changes, changed));
    if (result.is_ok() && changed) {
        const auto& booking = result.unwrap();
        qCInfo(waypoolBooking) << "booking" << booking.id.value << "updated, seats"
                               << booking.number_of_seats;
        auto ride = rides_.get(booking.ride_id);
        if (ride.is_ok() && ride.unwrap()) {
            notify_best_effort(notifier_, ride.unwrap()->driver_id, "booking.updated",
                               event_payload(booking));
        } else if (ride.is_err()) {
            qCWarning(waypoolNotify) << "cannot address booking.updated:"
                                     << ride.unwrap_err().message.c_str();
        }
    }
    return result;
}

Result<Booking, Error> BookingService::do_edit(const Caller& caller,
                                               BookingId booking_id,
                                               const BookingEdit& changes,
                                               bool& changed) {
    if (caller.role != Role::Rider) {
        return Result<Booking, Error>::err(forbidden("Only riders can edit their bookings"));
    }
    if (changes.number_of_seats && *changes.number_of_seats < 1) {
        return Result<Booking, Error>::err(seats_must_be_positive());
    }
    if (changes.pickup) {
        auto location_ok = validate_location(*changes.pickup, "Pickup");
        if (location_ok.is_err()) {
            return Result<Booking, Error>::err(location_ok.unwrap_err());
        }
    }

    const auto now = clock_.now();
    return db_.transaction([&]() -> Result<Booking, Error> {
        auto booking_result = load_booking(booking_id);
        if (booking_result.is_err()) {
            return booking_result;
        }
        Booking booking = std::move(booking_result).unwrap();
        if (booking.rider_id != caller.user_id) {
            return Result<Booking, Error>::err(forbidden("You do not own this booking"));
        }

        auto ride_result = load_ride(booking.ride_id);
        if (ride_result.is_err()) {
            return Result<Booking, Error>::err(ride_result.unwrap_err());
        }
        const Ride& ride = ride_result.unwrap();

        auto editable = check_editable(booking.status, ride.status);
        if (editable.is_err()) {
            return Result<Booking, Error>::err(editable.unwrap_err());
        }

        const int seats = changes.number_of_seats.value_or(booking.number_of_seats);
        const Location pickup = changes.pickup.value_or(booking.pickup);
        const int delta = seats - booking.number_of_seats;

        if (delta == 0 && pickup == booking.pickup) {
            return Result<Booking, Error>::ok(std::move(booking));
        }

        if (delta != 0) {
            if (holds_seats(booking.status)) {
                auto adjusted = ledger_.adjust(ride.id, delta);
                if (adjusted.is_err()) {
                    return Result<Booking, Error>::err(adjusted.unwrap_err());
                }
            } else if (delta > 0 && seats > ride.available_seats) {
                // Pending bookings hold nothing; the check is advisory.
                return Result<Booking, Error>::err(Error::insufficient_seats(ride.available_seats));
            }
        }

        auto updated = bookings_.update_details(booking.id, seats, pickup, now);
        if (updated.is_err()) {
            return Result<Booking, Error>::err(updated.unwrap_err());
        }
        changed = true;
        return load_booking(booking.id);
    });
}

// ============================================================================
// Reads
// ============================================================================

Result<RevealedPin, Error> BookingService::reveal_pin(const Caller& caller, BookingId booking_id) {
    if (caller.role != Role::Rider) {
        return Result<RevealedPin, Error>::err(forbidden("Only riders can view their pickup PIN"));
    }

    auto booking_result = load_booking(booking_id);
    if (booking_result.is_err()) {
        return Result<RevealedPin, Error>::err(booking_result.unwrap_err());
    }
    const auto& booking = booking_result.unwrap();
    if (booking.rider_id != caller.user_id) {
        return Result<RevealedPin, Error>::err(forbidden("You do not own this booking"));
    }
    if (booking.status != BookingStatus::Confirmed) {
        return Result<RevealedPin, Error>::err(
            invalid_state("Pickup PIN is only available for confirmed bookings"));
    }
    if (!booking.credential) {
        return Result<RevealedPin, Error>::err(
            Error{"No pickup PIN has been issued for this booking", ErrorCode::NotFound});
    }

    auto pin = credentials_.reveal(*booking.credential, clock_.now());
    if (pin.is_err()) {
        return log_internal(waypoolPickup, "reveal pickup PIN",
                            Result<RevealedPin, Error>::err(pin.unwrap_err()));
    }

    return Result<RevealedPin, Error>::ok(RevealedPin{
        .pin = std::move(pin).unwrap(),
        .expires_at = booking.credential->expires_at,
        .pickup_status = booking.pickup_status
    });
}

Result<Booking, Error> BookingService::get(const Caller& caller, BookingId booking_id) {
    auto booking_result = load_booking(booking_id);
    if (booking_result.is_err()) {
        return log_internal(waypoolBooking, "get booking", std::move(booking_result));
    }
    if (booking_result.unwrap().rider_id == caller.user_id) {
        return booking_result;
    }

    auto ride_result = load_ride(booking_result.unwrap().ride_id);
    if (ride_result.is_err()) {
        return log_internal(waypoolBooking, "get booking",
                            Result<Booking, Error>::err(ride_result.unwrap_err()));
    }
    if (ride_result.unwrap().driver_id != caller.user_id) {
        return Result<Booking, Error>::err(forbidden("You cannot view this booking"));
    }
    return booking_result;
}

Result<std::vector<Booking>, Error> BookingService::list_for_ride(const Caller& caller, RideId ride_id) {
    auto ride_result = load_ride(ride_id);
    if (ride_result.is_err()) {
        return log_internal(waypoolBooking, "list bookings",
                            Result<std::vector<Booking>, Error>::err(ride_result.unwrap_err()));
    }
    if (caller.role != Role::Driver || ride_result.unwrap().driver_id != caller.user_id) {
        return Result<std::vector<Booking>, Error>::err(forbidden("You do not own this ride"));
    }
    return log_internal(waypoolBooking, "list bookings", bookings_.get_by_ride(ride_id));
}

} // namespace waypool::service
