#include "storage/ride_repository.hpp"
#include "storage/location_columns.hpp"

namespace waypool::storage {
namespace {

constexpr const char* RIDE_COLUMNS = R"SQL(
    id, driver_id,
    origin_address, origin_city, origin_state, origin_zip_code,
    origin_latitude, origin_longitude,
    destination_address, destination_city, destination_state, destination_zip_code,
    destination_latitude, destination_longitude,
    departure_at, total_seats, available_seats, price_per_seat_cents,
    status, created_at, updated_at
)SQL";

} // namespace

Result<Ride, Error> RideRepository::row_to_ride(Statement& stmt) {
    const auto id = RideId(stmt.column_int64(0));
    const auto status = parse_ride_status(stmt.column_text(18));
    if (!status) {
        return Result<Ride, Error>::err(Error{
            "Ride " + id.to_string() + " has an unknown status '" + stmt.column_text(18) + "'"});
    }

    return Result<Ride, Error>::ok(Ride{
        .id = id,
        .driver_id = UserId(stmt.column_int64(1)),
        .origin = column_location(stmt, 2),
        .destination = column_location(stmt, 2 + LOCATION_COLUMN_COUNT),
        .departure = Timestamp(stmt.column_int64(14)),
        .total_seats = stmt.column_int(15),
        .available_seats = stmt.column_int(16),
        .price_per_seat_cents = stmt.column_int64(17),
        .status = *status,
        .created_at = Timestamp(stmt.column_int64(19)),
        .updated_at = Timestamp(stmt.column_int64(20))
    });
}

Result<Ride, Error> RideRepository::insert(const Ride& ride) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO rides (
            driver_id,
            origin_address, origin_city, origin_state, origin_zip_code,
            origin_latitude, origin_longitude,
            destination_address, destination_city, destination_state, destination_zip_code,
            destination_latitude, destination_longitude,
            departure_at, total_seats, available_seats, price_per_seat_cents,
            status, created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");

    if (stmt_result.is_err()) {
        return Result<Ride, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, ride.driver_id.value);
    bind_location(stmt, 2, ride.origin);
    bind_location(stmt, 8, ride.destination);
    stmt.bind_int64(14, ride.departure.millis());
    stmt.bind_int(15, ride.total_seats);
    stmt.bind_int(16, ride.available_seats);
    stmt.bind_int64(17, ride.price_per_seat_cents);
    stmt.bind_text(18, to_string(ride.status));
    stmt.bind_int64(19, ride.created_at.millis());
    stmt.bind_int64(20, ride.updated_at.millis());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Ride, Error>::err(step_result.unwrap_err());
    }

    Ride stored = ride;
    stored.id = RideId(db_.last_insert_rowid());
    return Result<Ride, Error>::ok(std::move(stored));
}

Result<std::optional<Ride>, Error> RideRepository::get(RideId id) {
    auto stmt_result = db_.prepare(
        std::string("SELECT ") + RIDE_COLUMNS + " FROM rides WHERE id = ?;");

    if (stmt_result.is_err()) {
        return Result<std::optional<Ride>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Ride>, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap()) {
        return Result<std::optional<Ride>, Error>::ok(std::nullopt);
    }

    auto ride = row_to_ride(stmt);
    if (ride.is_err()) {
        return Result<std::optional<Ride>, Error>::err(ride.unwrap_err());
    }
    return Result<std::optional<Ride>, Error>::ok(std::move(ride).unwrap());
}

Result<std::vector<Ride>, Error> RideRepository::get_by_driver(UserId driver_id) {
    std::vector<Ride> rides;

    auto stmt_result = db_.prepare(
        std::string("SELECT ") + RIDE_COLUMNS +
        " FROM rides WHERE driver_id = ? ORDER BY departure_at, id;");

    if (stmt_result.is_err()) {
        return Result<std::vector<Ride>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, driver_id.value);

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Ride>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        auto ride = row_to_ride(stmt);
        if (ride.is_err()) {
            return Result<std::vector<Ride>, Error>::err(ride.unwrap_err());
        }
        rides.push_back(std::move(ride).unwrap());
    }

    return Result<std::vector<Ride>, Error>::ok(std::move(rides));
}

Result<bool, Error> RideRepository::update_status(
    RideId id, RideStatus from, RideStatus to, Timestamp now
) {
    auto stmt_result = db_.prepare(
        "UPDATE rides SET status = ?, updated_at = ? WHERE id = ? AND status = ?;");

    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(to));
    stmt.bind_int64(2, now.millis());
    stmt.bind_int64(3, id.value);
    stmt.bind_text(4, to_string(from));

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }

    return Result<bool, Error>::ok(db_.changes() == 1);
}

} // namespace waypool::storage
