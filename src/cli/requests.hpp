#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "service/booking_service.hpp"
#include "service/ride_service.hpp"

#include <QJsonObject>
#include <QString>

namespace waypool::cli {

/**
 * Parse a JSON object argument. Anything else is InvalidArgument.
 */
[[nodiscard]] Result<QJsonObject, Error> parse_object(const QString& text);

/**
 * Positive integer id from a command argument.
 */
[[nodiscard]] Result<int64_t, Error> parse_id(const QString& text, const char* what);

/**
 * {"address", "city", "state", "zipCode", "latitude", "longitude"}.
 * Address, latitude and longitude are required.
 */
[[nodiscard]] Result<Location, Error> parse_location(const QJsonObject& json, const char* what);

/**
 * {"origin", "destination", "departureTime" (ISO 8601), "availableSeats",
 *  "pricePerSeatCents"}
 */
[[nodiscard]] Result<service::RideListing, Error> parse_ride_listing(const QJsonObject& json);

/**
 * {"rideId", "numberOfSeats", "pickupLocation"}
 */
[[nodiscard]] Result<service::BookingRequest, Error> parse_booking_request(const QJsonObject& json);

/**
 * {"numberOfSeats"?, "pickupLocation"?}
 */
[[nodiscard]] Result<service::BookingEdit, Error> parse_booking_edit(const QJsonObject& json);

} // namespace waypool::cli
