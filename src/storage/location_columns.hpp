#pragma once

#include "storage/database.hpp"
#include "core/ride.hpp"

namespace waypool::storage {

// A Location occupies six consecutive columns:
// address, city, state, zip_code, latitude, longitude.
constexpr int LOCATION_COLUMN_COUNT = 6;

inline void bind_location(Statement& stmt, int first_index, const Location& loc) {
    stmt.bind_text(first_index, loc.address);
    stmt.bind_text(first_index + 1, loc.city);
    stmt.bind_text(first_index + 2, loc.state);
    stmt.bind_text(first_index + 3, loc.zip_code);
    stmt.bind_double(first_index + 4, loc.latitude);
    stmt.bind_double(first_index + 5, loc.longitude);
}

[[nodiscard]] inline Location column_location(const Statement& stmt, int first_column) {
    return Location{
        .address = stmt.column_text(first_column),
        .city = stmt.column_text(first_column + 1),
        .state = stmt.column_text(first_column + 2),
        .zip_code = stmt.column_text(first_column + 3),
        .latitude = stmt.column_double(first_column + 4),
        .longitude = stmt.column_double(first_column + 5)
    };
}

} // namespace waypool::storage
