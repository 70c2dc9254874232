#pragma once

#include "core/caller.hpp"
#include "core/clock.hpp"
#include "core/result.hpp"
#include "core/ride.hpp"
#include "service/collaborators.hpp"
#include "storage/booking_repository.hpp"
#include "storage/database.hpp"
#include "storage/ride_repository.hpp"
#include "storage/seat_ledger.hpp"
#include <vector>

namespace waypool::service {

struct RideListing {
    Location origin;
    Location destination;
    Timestamp departure;
    int seats{0};
    int64_t price_per_seat_cents{0};
};

/**
 * RideService - Publishes rides and moves them through
 * scheduled -> in-progress -> completed, or to cancelled, carrying the
 * ride's bookings along.
 */
class RideService {
public:
    RideService(storage::Database& db, const Clock& clock, Notifier* notifier = nullptr);

    [[nodiscard]] Result<Ride, Error> publish(const Caller& caller, const RideListing& listing);

    [[nodiscard]] Result<Ride, Error> start(const Caller& caller, RideId ride_id);

    /**
     * Confirmed bookings complete; pending requests are cancelled. Seats
     * stay consumed.
     */
    [[nodiscard]] Result<Ride, Error> complete(const Caller& caller, RideId ride_id);

    /**
     * Pending and confirmed bookings are cancelled and the confirmed
     * seats go back to the ledger in the same transaction.
     */
    [[nodiscard]] Result<Ride, Error> cancel(const Caller& caller, RideId ride_id);

    [[nodiscard]] Result<Ride, Error> get(RideId ride_id);

    [[nodiscard]] Result<std::vector<Ride>, Error> list_for_driver(const Caller& caller);

private:
    storage::Database& db_;
    const Clock& clock_;
    Notifier* notifier_;

    storage::RideRepository rides_;
    storage::BookingRepository bookings_;
    storage::SeatLedger ledger_;

    [[nodiscard]] Result<Ride, Error> apply(const Caller& caller, RideId ride_id, RideEvent event);
    // Returns the bookings it moved.
    [[nodiscard]] Result<std::vector<Booking>, Error> settle_bookings(
        const Ride& ride, RideEvent event, Timestamp now);
};

} // namespace waypool::service
