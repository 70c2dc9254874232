#pragma once

#include "core/booking.hpp"
#include "core/ride.hpp"
#include "core/result.hpp"
#include <QJsonObject>

namespace waypool::service {

/**
 * JSON snapshots handed to notifiers and printed by the CLI.
 * Booking snapshots never carry the stored PIN forms.
 */
[[nodiscard]] QJsonObject location_to_json(const Location& location);
[[nodiscard]] QJsonObject ride_to_json(const Ride& ride);
[[nodiscard]] QJsonObject booking_to_json(const Booking& booking);

/**
 * {"error": code, "message": ..., details}. Internal failures are
 * reported without their message.
 */
[[nodiscard]] QJsonObject error_to_json(const Error& error);

} // namespace waypool::service
