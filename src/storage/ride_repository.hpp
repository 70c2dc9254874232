#pragma once

#include "storage/database.hpp"
#include "core/ride.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>

namespace waypool::storage {

/**
 * RideRepository - Data access layer for rides.
 *
 * Never writes available_seats after insert; that column belongs to
 * SeatLedger.
 */
class RideRepository {
public:
    explicit RideRepository(Database& db) : db_(db) {}

    /**
     * Insert a new ride. The id in `ride` is ignored; the stored ride
     * (with its assigned id) is returned.
     */
    [[nodiscard]] Result<Ride, Error> insert(const Ride& ride);

    /**
     * Get a ride by ID.
     */
    [[nodiscard]] Result<std::optional<Ride>, Error> get(RideId id);

    /**
     * Get all rides published by a driver, soonest departure first.
     */
    [[nodiscard]] Result<std::vector<Ride>, Error> get_by_driver(UserId driver_id);

    /**
     * Move a ride from `from` to `to`. Returns false when the ride was no
     * longer in `from`.
     */
    [[nodiscard]] Result<bool, Error> update_status(
        RideId id, RideStatus from, RideStatus to, Timestamp now);

private:
    Database& db_;

    [[nodiscard]] Result<Ride, Error> row_to_ride(Statement& stmt);
};

} // namespace waypool::storage
