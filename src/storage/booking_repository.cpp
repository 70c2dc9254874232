#include "storage/booking_repository.hpp"
#include "storage/location_columns.hpp"

namespace waypool::storage {
namespace {

constexpr const char* BOOKING_COLUMNS = R"SQL(
    id, ride_id, rider_id, confirmation_number,
    pickup_address, pickup_city, pickup_state, pickup_zip_code,
    pickup_latitude, pickup_longitude,
    number_of_seats, price_per_seat_cents, status, payment_authorization,
    created_at, updated_at,
    pickup_status, pickup_pin_hash, pickup_pin_encrypted, pickup_pin_expires_at,
    pickup_pin_attempts, pickup_pin_locked_until, picked_up_at
)SQL";

std::string select_bookings(const char* where) {
    return std::string("SELECT ") + BOOKING_COLUMNS + " FROM bookings WHERE " + where;
}

} // namespace

Result<Booking, Error> BookingRepository::row_to_booking(Statement& stmt) {
    const auto id = BookingId(stmt.column_int64(0));
    const auto status = parse_booking_status(stmt.column_text(12));
    const auto pickup_status = parse_pickup_status(stmt.column_text(16));
    if (!status || !pickup_status) {
        return Result<Booking, Error>::err(Error{
            "Booking " + id.to_string() + " has an unknown status '" + stmt.column_text(12) +
            "' / '" + stmt.column_text(16) + "'"});
    }

    std::optional<PickupCredential> credential;
    if (!stmt.column_is_null(17) && !stmt.column_is_null(18) && !stmt.column_is_null(19)) {
        credential = PickupCredential{
            .pin_hash = stmt.column_text(17),
            .pin_encrypted = stmt.column_text(18),
            .expires_at = Timestamp(stmt.column_int64(19))
        };
    }

    return Result<Booking, Error>::ok(Booking{
        .id = id,
        .ride_id = RideId(stmt.column_int64(1)),
        .rider_id = UserId(stmt.column_int64(2)),
        .confirmation_number = stmt.column_text(3),
        .pickup = column_location(stmt, 4),
        .number_of_seats = stmt.column_int(10),
        .price_per_seat_cents = stmt.column_int64(11),
        .status = *status,
        .pickup_status = *pickup_status,
        .credential = std::move(credential),
        .pickup_pin_attempts = stmt.column_int(20),
        .pickup_pin_locked_until = stmt.column_optional_timestamp(21),
        .picked_up_at = stmt.column_optional_timestamp(22),
        .payment_authorization = stmt.column_optional_text(13),
        .created_at = Timestamp(stmt.column_int64(14)),
        .updated_at = Timestamp(stmt.column_int64(15))
    });
}

Result<std::vector<Booking>, Error> BookingRepository::collect(Statement& stmt) {
    std::vector<Booking> bookings;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Booking>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        auto booking = row_to_booking(stmt);
        if (booking.is_err()) {
            return Result<std::vector<Booking>, Error>::err(booking.unwrap_err());
        }
        bookings.push_back(std::move(booking).unwrap());
    }
    return Result<std::vector<Booking>, Error>::ok(std::move(bookings));
}

Result<Booking, Error> BookingRepository::insert(const Booking& booking) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO bookings (
            ride_id, rider_id, confirmation_number,
            pickup_address, pickup_city, pickup_state, pickup_zip_code,
            pickup_latitude, pickup_longitude,
            number_of_seats, price_per_seat_cents, status, payment_authorization,
            created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");

    if (stmt_result.is_err()) {
        return Result<Booking, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, booking.ride_id.value);
    stmt.bind_int64(2, booking.rider_id.value);
    stmt.bind_text(3, booking.confirmation_number);
    bind_location(stmt, 4, booking.pickup);
    stmt.bind_int(10, booking.number_of_seats);
    stmt.bind_int64(11, booking.price_per_seat_cents);
    stmt.bind_text(12, to_string(booking.status));
    stmt.bind_optional_text(13, booking.payment_authorization);
    stmt.bind_int64(14, booking.created_at.millis());
    stmt.bind_int64(15, booking.updated_at.millis());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Booking, Error>::err(step_result.unwrap_err());
    }

    Booking stored = booking;
    stored.id = BookingId(db_.last_insert_rowid());
    return Result<Booking, Error>::ok(std::move(stored));
}

Result<std::optional<Booking>, Error> BookingRepository::get(BookingId id) {
    auto stmt_result = db_.prepare(select_bookings("id = ?;"));
    if (stmt_result.is_err()) {
        return Result<std::optional<Booking>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Booking>, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap()) {
        return Result<std::optional<Booking>, Error>::ok(std::nullopt);
    }

    auto booking = row_to_booking(stmt);
    if (booking.is_err()) {
        return Result<std::optional<Booking>, Error>::err(booking.unwrap_err());
    }
    return Result<std::optional<Booking>, Error>::ok(std::move(booking).unwrap());
}

Result<std::optional<Booking>, Error> BookingRepository::find_open(RideId ride_id, UserId rider_id) {
    auto stmt_result = db_.prepare(select_bookings(
        "ride_id = ? AND rider_id = ? AND status IN ('pending', 'confirmed') LIMIT 1;"));
    if (stmt_result.is_err()) {
        return Result<std::optional<Booking>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, ride_id.value);
    stmt.bind_int64(2, rider_id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Booking>, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap()) {
        return Result<std::optional<Booking>, Error>::ok(std::nullopt);
    }

    auto booking = row_to_booking(stmt);
    if (booking.is_err()) {
        return Result<std::optional<Booking>, Error>::err(booking.unwrap_err());
    }
    return Result<std::optional<Booking>, Error>::ok(std::move(booking).unwrap());
}

Result<std::vector<Booking>, Error> BookingRepository::get_by_ride(RideId ride_id) {
    auto stmt_result = db_.prepare(select_bookings("ride_id = ? ORDER BY id;"));
    if (stmt_result.is_err()) {
        return Result<std::vector<Booking>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, ride_id.value);
    return collect(stmt);
}

Result<bool, Error> BookingRepository::update_status(
    BookingId id, BookingStatus from, BookingStatus to, Timestamp now
) {
    auto stmt_result = db_.prepare(
        "UPDATE bookings SET status = ?, updated_at = ? WHERE id = ? AND status = ?;");
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

Result<bool, Error> BookingRepository::confirm(
    BookingId id, const PickupCredential& credential, Timestamp now
) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE bookings SET
            status = 'confirmed',
            pickup_status = 'pending',
            pickup_pin_hash = ?,
            pickup_pin_encrypted = ?,
            pickup_pin_expires_at = ?,
            pickup_pin_attempts = 0,
            pickup_pin_locked_until = NULL,
            picked_up_at = NULL,
            updated_at = ?
        WHERE id = ? AND status = 'pending';
    )SQL");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, credential.pin_hash);
    stmt.bind_text(2, credential.pin_encrypted);
    stmt.bind_int64(3, credential.expires_at.millis());
    stmt.bind_int64(4, now.millis());
    stmt.bind_int64(5, id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }

    return Result<bool, Error>::ok(db_.changes() == 1);
}

Result<void, Error> BookingRepository::update_details(
    BookingId id, int number_of_seats, const Location& pickup, Timestamp now
) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE bookings SET
            number_of_seats = ?,
            pickup_address = ?, pickup_city = ?, pickup_state = ?, pickup_zip_code = ?,
            pickup_latitude = ?, pickup_longitude = ?,
            updated_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, number_of_seats);
    bind_location(stmt, 2, pickup);
    stmt.bind_int64(8, now.millis());
    stmt.bind_int64(9, id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

Result<void, Error> BookingRepository::update_pin_attempts(
    BookingId id, int attempts, std::optional<Timestamp> locked_until, Timestamp now
) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE bookings SET
            pickup_pin_attempts = ?,
            pickup_pin_locked_until = ?,
            updated_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, attempts);
    stmt.bind_optional_timestamp(2, locked_until);
    stmt.bind_int64(3, now.millis());
    stmt.bind_int64(4, id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

Result<void, Error> BookingRepository::mark_picked_up(BookingId id,
                                                      int attempts,
                                                      std::optional<Timestamp> locked_until,
                                                      Timestamp now) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE bookings SET
            pickup_status = 'picked_up',
            picked_up_at = ?1,
            pickup_pin_attempts = ?2,
            pickup_pin_locked_until = ?3,
            updated_at = ?1
        WHERE id = ?4;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, now.millis());
    stmt.bind_int(2, attempts);
    stmt.bind_optional_timestamp(3, locked_until);
    stmt.bind_int64(4, id.value);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

} // namespace waypool::storage
