#include "cli/requests.hpp"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>

namespace waypool::cli {
namespace {

Error invalid(const std::string& message) {
    return Error{message, ErrorCode::InvalidArgument};
}

// JSON numbers that are whole and fit an int.
std::optional<int> whole_number(const QJsonValue& value) {
    if (!value.isDouble()) return std::nullopt;
    const double d = value.toDouble();
    if (std::floor(d) != d || d < -2147483648.0 || d > 2147483647.0) return std::nullopt;
    return static_cast<int>(d);
}

} // namespace

Result<QJsonObject, Error> parse_object(const QString& text) {
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError) {
        return Result<QJsonObject, Error>::err(invalid("Malformed JSON: " + error.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<QJsonObject, Error>::err(invalid("Expected a JSON object"));
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

Result<int64_t, Error> parse_id(const QString& text, const char* what) {
    bool ok = false;
    const qint64 id = text.trimmed().toLongLong(&ok);
    if (!ok || id <= 0) {
        return Result<int64_t, Error>::err(invalid(std::string(what) + " must be a positive integer"));
    }
    return Result<int64_t, Error>::ok(id);
}

Result<Location, Error> parse_location(const QJsonObject& json, const char* what) {
    const auto lat = json.value(QStringLiteral("latitude"));
    const auto lng = json.value(QStringLiteral("longitude"));
    if (!lat.isDouble() || !lng.isDouble()) {
        return Result<Location, Error>::err(
            invalid(std::string(what) + " requires latitude and longitude"));
    }

    Location location{
        .address = json.value(QStringLiteral("address")).toString().toStdString(),
        .city = json.value(QStringLiteral("city")).toString().toStdString(),
        .state = json.value(QStringLiteral("state")).toString().toStdString(),
        .zip_code = json.value(QStringLiteral("zipCode")).toString().toStdString(),
        .latitude = lat.toDouble(),
        .longitude = lng.toDouble()
    };

    auto valid = service::validate_location(location, what);
    if (valid.is_err()) {
        return Result<Location, Error>::err(valid.unwrap_err());
    }
    return Result<Location, Error>::ok(std::move(location));
}

Result<service::RideListing, Error> parse_ride_listing(const QJsonObject& json) {
    using ListingResult = Result<service::RideListing, Error>;

    auto origin = parse_location(json.value(QStringLiteral("origin")).toObject(), "Origin");
    if (origin.is_err()) return ListingResult::err(origin.unwrap_err());
    auto destination = parse_location(json.value(QStringLiteral("destination")).toObject(), "Destination");
    if (destination.is_err()) return ListingResult::err(destination.unwrap_err());

    const auto departure = QDateTime::fromString(
        json.value(QStringLiteral("departureTime")).toString(), Qt::ISODateWithMs);
    if (!departure.isValid()) {
        return ListingResult::err(invalid("departureTime must be an ISO 8601 timestamp"));
    }

    auto seats = whole_number(json.value(QStringLiteral("availableSeats")));
    if (!seats) {
        return ListingResult::err(invalid("availableSeats must be an integer"));
    }

    const auto price = json.value(QStringLiteral("pricePerSeatCents"));
    if (!price.isDouble() || std::floor(price.toDouble()) != price.toDouble()) {
        return ListingResult::err(invalid("pricePerSeatCents must be an integer"));
    }

    return ListingResult::ok(service::RideListing{
        .origin = std::move(origin).unwrap(),
        .destination = std::move(destination).unwrap(),
        .departure = Timestamp(departure.toMSecsSinceEpoch()),
        .seats = *seats,
        .price_per_seat_cents = static_cast<int64_t>(price.toDouble())
    });
}

Result<service::BookingRequest, Error> parse_booking_request(const QJsonObject& json) {
    using RequestResult = Result<service::BookingRequest, Error>;

    auto ride = whole_number(json.value(QStringLiteral("rideId")));
    if (!ride || *ride <= 0) {
        return RequestResult::err(invalid("rideId must be a positive integer"));
    }
    auto seats = whole_number(json.value(QStringLiteral("numberOfSeats")));
    if (!seats) {
        return RequestResult::err(invalid("numberOfSeats must be an integer"));
    }
    auto pickup = parse_location(json.value(QStringLiteral("pickupLocation")).toObject(), "Pickup");
    if (pickup.is_err()) return RequestResult::err(pickup.unwrap_err());

    return RequestResult::ok(service::BookingRequest{
        .ride_id = RideId(*ride),
        .number_of_seats = *seats,
        .pickup = std::move(pickup).unwrap()
    });
}

Result<service::BookingEdit, Error> parse_booking_edit(const QJsonObject& json) {
    using EditResult = Result<service::BookingEdit, Error>;

    service::BookingEdit edit;
    if (json.contains(QStringLiteral("numberOfSeats"))) {
        auto seats = whole_number(json.value(QStringLiteral("numberOfSeats")));
        if (!seats) {
            return EditResult::err(invalid("numberOfSeats must be an integer"));
        }
        edit.number_of_seats = *seats;
    }
    if (json.contains(QStringLiteral("pickupLocation"))) {
        auto pickup = parse_location(json.value(QStringLiteral("pickupLocation")).toObject(), "Pickup");
        if (pickup.is_err()) return EditResult::err(pickup.unwrap_err());
        edit.pickup = std::move(pickup).unwrap();
    }
    return EditResult::ok(std::move(edit));
}

} // namespace waypool::cli
