#pragma once

#include "storage/database.hpp"
#include "core/booking.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>

namespace waypool::storage {

/**
 * BookingRepository - Data access layer for bookings and their pickup
 * credential columns.
 *
 * Status writers take the status they expect to replace and report
 * whether the row matched, so a stale read never overwrites a newer state.
 */
class BookingRepository {
public:
    explicit BookingRepository(Database& db) : db_(db) {}

    /**
     * Insert a new pending booking and return it with its assigned id.
     */
    [[nodiscard]] Result<Booking, Error> insert(const Booking& booking);

    [[nodiscard]] Result<std::optional<Booking>, Error> get(BookingId id);

    /**
     * The rider's pending or confirmed booking on a ride, if any.
     */
    [[nodiscard]] Result<std::optional<Booking>, Error> find_open(RideId ride_id, UserId rider_id);

    /**
     * All bookings on a ride in creation order.
     */
    [[nodiscard]] Result<std::vector<Booking>, Error> get_by_ride(RideId ride_id);

    [[nodiscard]] Result<bool, Error> update_status(
        BookingId id, BookingStatus from, BookingStatus to, Timestamp now);

    /**
     * pending -> confirmed, storing a freshly issued credential and
     * clearing any attempt state.
     */
    [[nodiscard]] Result<bool, Error> confirm(
        BookingId id, const PickupCredential& credential, Timestamp now);

    [[nodiscard]] Result<void, Error> update_details(
        BookingId id, int number_of_seats, const Location& pickup, Timestamp now);

    /**
     * Store the failed-attempt counter and lockout marker.
     */
    [[nodiscard]] Result<void, Error> update_pin_attempts(
        BookingId id, int attempts, std::optional<Timestamp> locked_until, Timestamp now);

    /**
     * Record a verified pickup together with the attempt state it leaves.
     */
    [[nodiscard]] Result<void, Error> mark_picked_up(
        BookingId id, int attempts, std::optional<Timestamp> locked_until, Timestamp now);

private:
    Database& db_;

    [[nodiscard]] Result<Booking, Error> row_to_booking(Statement& stmt);
    [[nodiscard]] Result<std::vector<Booking>, Error> collect(Statement& stmt);
};

} // namespace waypool::storage
