#include "service/snapshots.hpp"

#include <QString>

namespace waypool::service {
namespace {

QString qs(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QString iso(Timestamp ts) {
    return QString::fromStdString(ts.to_iso_string());
}

} // namespace

QJsonObject location_to_json(const Location& location) {
    QJsonObject obj;
    obj.insert(QStringLiteral("address"), QString::fromStdString(location.address));
    obj.insert(QStringLiteral("city"), QString::fromStdString(location.city));
    obj.insert(QStringLiteral("state"), QString::fromStdString(location.state));
    obj.insert(QStringLiteral("zipCode"), QString::fromStdString(location.zip_code));
    obj.insert(QStringLiteral("latitude"), location.latitude);
    obj.insert(QStringLiteral("longitude"), location.longitude);
    return obj;
}

QJsonObject ride_to_json(const Ride& ride) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(ride.id.value));
    obj.insert(QStringLiteral("driverId"), static_cast<qint64>(ride.driver_id.value));
    obj.insert(QStringLiteral("origin"), location_to_json(ride.origin));
    obj.insert(QStringLiteral("destination"), location_to_json(ride.destination));
    obj.insert(QStringLiteral("departureTime"), iso(ride.departure));
    obj.insert(QStringLiteral("totalSeats"), ride.total_seats);
    obj.insert(QStringLiteral("availableSeats"), ride.available_seats);
    obj.insert(QStringLiteral("pricePerSeatCents"), static_cast<qint64>(ride.price_per_seat_cents));
    obj.insert(QStringLiteral("status"), qs(to_string(ride.status)));
    obj.insert(QStringLiteral("createdAt"), iso(ride.created_at));
    obj.insert(QStringLiteral("updatedAt"), iso(ride.updated_at));
    return obj;
}

QJsonObject booking_to_json(const Booking& booking) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(booking.id.value));
    obj.insert(QStringLiteral("rideId"), static_cast<qint64>(booking.ride_id.value));
    obj.insert(QStringLiteral("riderId"), static_cast<qint64>(booking.rider_id.value));
    obj.insert(QStringLiteral("confirmationNumber"), QString::fromStdString(booking.confirmation_number));
    obj.insert(QStringLiteral("pickupLocation"), location_to_json(booking.pickup));
    obj.insert(QStringLiteral("numberOfSeats"), booking.number_of_seats);
    obj.insert(QStringLiteral("pricePerSeatCents"), static_cast<qint64>(booking.price_per_seat_cents));
    obj.insert(QStringLiteral("totalPriceCents"),
               static_cast<qint64>(booking.price_per_seat_cents * booking.number_of_seats));
    obj.insert(QStringLiteral("status"), qs(to_string(booking.status)));
    obj.insert(QStringLiteral("pickupStatus"), qs(to_string(booking.pickup_status)));
    obj.insert(QStringLiteral("hasPickupPin"), booking.credential.has_value());
    if (booking.credential) {
        obj.insert(QStringLiteral("pickupPinExpiresAt"), iso(booking.credential->expires_at));
    }
    if (booking.pickup_pin_locked_until) {
        obj.insert(QStringLiteral("pickupPinLockedUntil"), iso(*booking.pickup_pin_locked_until));
    }
    if (booking.picked_up_at) {
        obj.insert(QStringLiteral("pickedUpAt"), iso(*booking.picked_up_at));
    }
    if (booking.payment_authorization) {
        obj.insert(QStringLiteral("paymentAuthorization"),
                   QString::fromStdString(*booking.payment_authorization));
    }
    obj.insert(QStringLiteral("createdAt"), iso(booking.created_at));
    obj.insert(QStringLiteral("updatedAt"), iso(booking.updated_at));
    return obj;
}

QJsonObject error_to_json(const Error& error) {
    QJsonObject obj;
    obj.insert(QStringLiteral("error"), qs(to_string(error.code)));
    obj.insert(QStringLiteral("message"), error.is_business()
        ? QString::fromStdString(error.message)
        : QStringLiteral("internal error"));
    if (error.attempts_remaining) {
        obj.insert(QStringLiteral("attemptsRemaining"), *error.attempts_remaining);
    }
    if (error.seats_available) {
        obj.insert(QStringLiteral("seatsAvailable"), *error.seats_available);
    }
    if (error.retry_after) {
        obj.insert(QStringLiteral("retryAfter"), iso(*error.retry_after));
    }
    return obj;
}

} // namespace waypool::service
