#pragma once

#include "storage/database.hpp"
#include "core/types.hpp"
#include "core/result.hpp"

namespace waypool::storage {

/**
 * SeatLedger - The only writer of rides.available_seats.
 *
 * Each operation is one conditional UPDATE, so the precondition check and
 * the write are a single statement that SQLite serializes. Every call
 * returns the ride's available seats afterwards. When the caller already
 * holds a transaction the operation joins it, so a failing ledger call
 * leaves the caller free to roll back everything it did before.
 *
 * Failures:
 *   InvalidArgument   - n <= 0 for reserve/release
 *   NotFound          - no such ride
 *   InsufficientSeats - fewer than n seats available (seats_available set)
 *   Internal          - release would exceed the published seat count
 */
class SeatLedger {
public:
    explicit SeatLedger(Database& db) : db_(db) {}

    [[nodiscard]] Result<int, Error> reserve(RideId ride_id, int seats);

    [[nodiscard]] Result<int, Error> release(RideId ride_id, int seats);

    /**
     * Positive delta reserves, negative delta releases, zero only reads.
     */
    [[nodiscard]] Result<int, Error> adjust(RideId ride_id, int delta);

    [[nodiscard]] Result<int, Error> available(RideId ride_id);

private:
    Database& db_;

    [[nodiscard]] Result<int, Error> take(RideId ride_id, int seats);
    [[nodiscard]] Result<int, Error> give_back(RideId ride_id, int seats);
};

} // namespace waypool::storage
