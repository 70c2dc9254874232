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
#include "storage/seat_ledger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace waypool::service {

struct BookingRequest {
    RideId ride_id;
    int number_of_seats{1};
    Location pickup;
};

/**
 * Fields a rider may change before the ride starts. Unset fields keep
 * their current value.
 */
struct BookingEdit {
    std::optional<int> number_of_seats;
    std::optional<Location> pickup;
};

struct RevealedPin {
    std::string pin;
    Timestamp expires_at;
    PickupStatus pickup_status{PickupStatus::Pending};
};

/**
 * BookingService - Drives bookings through their lifecycle.
 *
 * Every status change goes through transition(); every seat change goes
 * through SeatLedger inside the same immediate transaction as the status
 * write, so a refused reservation leaves the booking untouched.
 * Payment and notification calls happen outside store transactions.
 *
 * One instance per connection; the Database is not shared across threads.
 */
class BookingService {
public:
    BookingService(storage::Database& db,
                   const Clock& clock,
                   const pickup::CredentialService& credentials,
                   PaymentAuthorizer* payments = nullptr,
                   Notifier* notifier = nullptr);

    /**
     * Rider requests seats. No seats are reserved; the seat check here is
     * advisory and accept() is authoritative.
     */
    [[nodiscard]] Result<Booking, Error> create(const Caller& caller, const BookingRequest& request);

    /**
     * Driver accepts: reserves seats and issues the pickup PIN atomically.
     */
    [[nodiscard]] Result<Booking, Error> accept(const Caller& caller, BookingId booking_id);

    [[nodiscard]] Result<Booking, Error> reject(const Caller& caller, BookingId booking_id);

    /**
     * Rider cancels; seats come back only if the booking held them.
     */
    [[nodiscard]] Result<Booking, Error> cancel(const Caller& caller, BookingId booking_id);

    [[nodiscard]] Result<Booking, Error> edit(const Caller& caller,
                                              BookingId booking_id,
                                              const BookingEdit& changes);

    /**
     * Decrypt the pickup PIN for the rider's own confirmed booking.
     */
    [[nodiscard]] Result<RevealedPin, Error> reveal_pin(const Caller& caller, BookingId booking_id);

    /**
     * A booking is visible to its rider and to the ride's driver.
     */
    [[nodiscard]] Result<Booking, Error> get(const Caller& caller, BookingId booking_id);

    /**
     * All bookings on a ride, for the ride's driver.
     */
    [[nodiscard]] Result<std::vector<Booking>, Error> list_for_ride(const Caller& caller, RideId ride_id);

    /**
     * WP-YYYYMMDD-XXXXXX: UTC creation date and six random base-36 characters.
     */
    [[nodiscard]] static std::string make_confirmation_number(Timestamp now);

private:
    storage::Database& db_;
    const Clock& clock_;
    const pickup::CredentialService& credentials_;
    PaymentAuthorizer* payments_;
    Notifier* notifier_;

    storage::RideRepository rides_;
    storage::BookingRepository bookings_;
    storage::SeatLedger ledger_;

    [[nodiscard]] Result<Booking, Error> load_booking(BookingId id);
    [[nodiscard]] Result<Ride, Error> load_ride(RideId id);

    [[nodiscard]] Result<Booking, Error> do_create(const Caller& caller, const BookingRequest& request);
    [[nodiscard]] Result<Booking, Error> do_accept(const Caller& caller, BookingId booking_id);
    [[nodiscard]] Result<Booking, Error> do_edit(const Caller& caller,
                                                 BookingId booking_id,
                                                 const BookingEdit& changes,
                                                 bool& changed);
};

/**
 * Pickup locations need an address and coordinates on the globe.
 */
[[nodiscard]] Result<void, Error> validate_location(const Location& location, const char* what);

} // namespace waypool::service
