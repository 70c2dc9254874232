#include "storage/seat_ledger.hpp"
#include "core/logging.hpp"

namespace waypool::storage {
namespace {

Error seats_must_be_positive(int seats) {
    return Error{"Seat count must be positive (got " + std::to_string(seats) + ")",
                 ErrorCode::InvalidArgument};
}

Error ride_not_found(RideId ride_id) {
    return Error{"Ride " + ride_id.to_string() + " not found", ErrorCode::NotFound};
}

} // namespace

Result<int, Error> SeatLedger::available(RideId ride_id) {
    auto stmt_result = db_.prepare("SELECT available_seats FROM rides WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, ride_id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<int, Error>::err(ride_not_found(ride_id));
    }

    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<int, Error> SeatLedger::take(RideId ride_id, int seats) {
    return db_.transaction([&]() -> Result<int, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            UPDATE rides SET available_seats = available_seats - ?1
            WHERE id = ?2 AND available_seats >= ?1
            RETURNING available_seats;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<int, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_int(1, seats);
        stmt.bind_int64(2, ride_id.value);

        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<int, Error>::err(step_result.unwrap_err());
        }
        if (step_result.unwrap()) {
            int remaining = stmt.column_int(0);
            qCDebug(waypoolLedger) << "reserved" << seats << "on ride" << ride_id.value
                                   << "remaining" << remaining;
            return Result<int, Error>::ok(remaining);
        }

        // No row changed: either the ride is missing or it is short of seats.
        auto current = available(ride_id);
        if (current.is_err()) {
            return current;
        }
        qCInfo(waypoolLedger) << "reserve of" << seats << "on ride" << ride_id.value
                              << "refused, available" << current.unwrap();
        return Result<int, Error>::err(Error::insufficient_seats(current.unwrap()));
    });
}

Result<int, Error> SeatLedger::give_back(RideId ride_id, int seats) {
    return db_.transaction([&]() -> Result<int, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            UPDATE rides SET available_seats = available_seats + ?1
            WHERE id = ?2 AND available_seats + ?1 <= total_seats
            RETURNING available_seats;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<int, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_int(1, seats);
        stmt.bind_int64(2, ride_id.value);

        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<int, Error>::err(step_result.unwrap_err());
        }
        if (step_result.unwrap()) {
            int remaining = stmt.column_int(0);
            qCDebug(waypoolLedger) << "released" << seats << "on ride" << ride_id.value
                                   << "remaining" << remaining;
            return Result<int, Error>::ok(remaining);
        }

        auto current = available(ride_id);
        if (current.is_err()) {
            return current;
        }
        qCCritical(waypoolLedger) << "release of" << seats << "on ride" << ride_id.value
                                  << "would exceed published seats, available" << current.unwrap();
        return Result<int, Error>::err(Error{
            "Release of " + std::to_string(seats) + " seats exceeds the published seat count of ride " +
            ride_id.to_string()});
    });
}

Result<int, Error> SeatLedger::reserve(RideId ride_id, int seats) {
    if (seats <= 0) {
        return Result<int, Error>::err(seats_must_be_positive(seats));
    }
    return take(ride_id, seats);
}

Result<int, Error> SeatLedger::release(RideId ride_id, int seats) {
    if (seats <= 0) {
        return Result<int, Error>::err(seats_must_be_positive(seats));
    }
    return give_back(ride_id, seats);
}

Result<int, Error> SeatLedger::adjust(RideId ride_id, int delta) {
    if (delta > 0) {
        return take(ride_id, delta);
    }
    if (delta < 0) {
        return give_back(ride_id, -delta);
    }
    return available(ride_id);
}

} // namespace waypool::storage
