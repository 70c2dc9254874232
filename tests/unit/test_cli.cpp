#include <catch2/catch_test_macros.hpp>
#include "cli/commands.hpp"
#include "cli/requests.hpp"
#include "service/snapshots.hpp"
#include "support/fixtures.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace waypool;
using namespace waypool::cli;
using namespace waypool::testing;

namespace {

const QString PICKUP_JSON = QStringLiteral(
    R"({"address": "3401 Walnut St", "city": "Philadelphia", "state": "PA",
        "zipCode": "19104", "latitude": 39.95, "longitude": -75.19})");

QString ride_json(int seats) {
    return QStringLiteral(
        R"({"origin": {"address": "30th Street Station", "latitude": 39.95, "longitude": -75.18},
            "destination": {"address": "Penn Station", "latitude": 40.75, "longitude": -73.99},
            "departureTime": "2031-05-01T08:30:00.000Z",
            "availableSeats": %1,
            "pricePerSeatCents": 1800})").arg(seats);
}

} // namespace

TEST_CASE("Request parsing", "[cli][requests]") {
    SECTION("ride listing") {
        auto listing = parse_ride_listing(parse_object(ride_json(3)).unwrap()).unwrap();
        REQUIRE(listing.seats == 3);
        REQUIRE(listing.price_per_seat_cents == 1800);
        REQUIRE(listing.origin.address == "30th Street Station");
        REQUIRE(listing.departure.to_iso_string() == "2031-05-01T08:30:00.000Z");
    }

    SECTION("booking request") {
        auto json = parse_object(QStringLiteral(R"({"rideId": 7, "numberOfSeats": 2, "pickupLocation": %1})")
                                     .arg(PICKUP_JSON)).unwrap();
        auto request = parse_booking_request(json).unwrap();
        REQUIRE(request.ride_id == RideId(7));
        REQUIRE(request.number_of_seats == 2);
        REQUIRE(request.pickup.zip_code == "19104");
    }

    SECTION("partial edit") {
        auto edit = parse_booking_edit(parse_object(QStringLiteral(R"({"numberOfSeats": 3})")).unwrap()).unwrap();
        REQUIRE(edit.number_of_seats == 3);
        REQUIRE_FALSE(edit.pickup.has_value());
    }

    SECTION("malformed input") {
        REQUIRE(parse_object(QStringLiteral("{not json")).unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(parse_object(QStringLiteral("[1, 2]")).is_err());
        REQUIRE(parse_id(QStringLiteral("0"), "rideId").is_err());
        REQUIRE(parse_id(QStringLiteral("abc"), "rideId").is_err());
        REQUIRE(parse_id(QStringLiteral(" 12 "), "rideId").unwrap() == 12);

        auto no_coordinates = parse_object(QStringLiteral(
            R"({"rideId": 1, "numberOfSeats": 1, "pickupLocation": {"address": "x"}})")).unwrap();
        REQUIRE(parse_booking_request(no_coordinates).is_err());

        auto fractional = parse_object(QStringLiteral(R"({"numberOfSeats": 1.5})")).unwrap();
        REQUIRE(parse_booking_edit(fractional).is_err());

        auto bad_time = parse_object(ride_json(2).replace(QStringLiteral("2031-05-01T08:30:00.000Z"),
                                                          QStringLiteral("tomorrow"))).unwrap();
        REQUIRE(parse_ride_listing(bad_time).is_err());
    }
}

TEST_CASE("Snapshots", "[cli][snapshots]") {
    ServiceFixture f;
    auto ride = f.publish(2, 1500);
    auto booking = f.confirmed(ride.id, 2);

    SECTION("booking snapshot never carries stored PIN forms") {
        const auto json = service::booking_to_json(booking);
        REQUIRE(json.value(QStringLiteral("hasPickupPin")).toBool());
        REQUIRE(json.value(QStringLiteral("totalPriceCents")).toInteger() == 3000);
        REQUIRE(json.value(QStringLiteral("status")).toString() == QStringLiteral("confirmed"));

        const auto text = QJsonDocument(json).toJson();
        REQUIRE_FALSE(text.contains(QByteArray::fromStdString(booking.credential->pin_hash)));
        REQUIRE_FALSE(text.contains(QByteArray::fromStdString(booking.credential->pin_encrypted)));
    }

    SECTION("errors carry their details") {
        auto json = service::error_to_json(Error::credential_mismatch(2));
        REQUIRE(json.value(QStringLiteral("error")).toString() == QStringLiteral("credential_mismatch"));
        REQUIRE(json.value(QStringLiteral("attemptsRemaining")).toInt() == 2);

        auto internal = service::error_to_json(Error{"sqlite: disk I/O error"});
        REQUIRE(internal.value(QStringLiteral("error")).toString() == QStringLiteral("internal"));
        REQUIRE_FALSE(internal.value(QStringLiteral("message")).toString().contains(QStringLiteral("sqlite")));
    }
}

TEST_CASE("Commands drive the services", "[cli][commands]") {
    ServiceFixture f;
    Services services{f.rides, f.bookings, f.pickups};
    const auto driver = Caller::driver(DRIVER);
    const auto rider = Caller::rider(RIDER);

    auto published = run_command(QStringLiteral("publish"), {ride_json(2)}, driver, services);
    REQUIRE(published.is_ok());
    const auto ride_id = QString::number(published.unwrap().toObject().value(QStringLiteral("id")).toInteger());

    auto booked = run_command(QStringLiteral("book"),
        {QStringLiteral(R"({"rideId": %1, "numberOfSeats": 2, "pickupLocation": %2})").arg(ride_id, PICKUP_JSON)},
        rider, services);
    REQUIRE(booked.is_ok());
    const auto booking_id = QString::number(booked.unwrap().toObject().value(QStringLiteral("id")).toInteger());

    auto accepted = run_command(QStringLiteral("accept"), {booking_id}, driver, services);
    REQUIRE(accepted.unwrap().toObject().value(QStringLiteral("status")).toString() == QStringLiteral("confirmed"));

    auto ride = run_command(QStringLiteral("ride"), {ride_id}, rider, services);
    REQUIRE(ride.unwrap().toObject().value(QStringLiteral("availableSeats")).toInt() == 0);

    auto listed = run_command(QStringLiteral("bookings"), {ride_id}, driver, services);
    REQUIRE(listed.unwrap().toArray().size() == 1);

    auto pin = run_command(QStringLiteral("pin"), {booking_id}, rider, services);
    const auto pin_text = pin.unwrap().toObject().value(QStringLiteral("pickupPin")).toString();
    REQUIRE(pin_text.size() == 4);

    REQUIRE(run_command(QStringLiteral("start-ride"), {ride_id}, driver, services).is_ok());
    auto verified = run_command(QStringLiteral("verify-pickup"), {booking_id, pin_text}, driver, services);
    REQUIRE(verified.unwrap().toObject().value(QStringLiteral("pickupStatus")).toString() ==
            QStringLiteral("picked_up"));

    REQUIRE(run_command(QStringLiteral("complete-ride"), {ride_id}, driver, services).is_ok());

    SECTION("bad usage is an invalid argument with the usage exit code") {
        auto missing = run_command(QStringLiteral("accept"), {}, driver, services);
        REQUIRE(missing.unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(exit_code_for(missing.unwrap_err()) == InternalFailure);

        auto unknown = run_command(QStringLiteral("teleport"), {}, driver, services);
        REQUIRE(exit_code_for(unknown.unwrap_err()) == InternalFailure);

        auto bad_id = run_command(QStringLiteral("ride"), {QStringLiteral("x")}, driver, services);
        REQUIRE(exit_code_for(bad_id.unwrap_err()) == InternalFailure);
    }

    SECTION("business failures map to their own exit code") {
        auto refused = run_command(QStringLiteral("cancel"), {booking_id}, rider, services);
        REQUIRE(refused.is_err());
        REQUIRE(exit_code_for(refused.unwrap_err()) == BusinessFailure);
        REQUIRE(exit_code_for(Error{"disk full"}) == InternalFailure);
    }
}

TEST_CASE("Migrate moves the schema both ways", "[cli][migrate]") {
    auto db = storage::Database::open_memory().unwrap();

    auto latest = run_migrate(db, {});
    REQUIRE(latest.unwrap().toObject().value(QStringLiteral("schemaVersion")).toInt() ==
            storage::MigrationRunner::latest_version());

    auto down = run_migrate(db, {QStringLiteral("1")});
    REQUIRE(down.unwrap().toObject().value(QStringLiteral("schemaVersion")).toInt() == 1);
    REQUIRE(db.prepare("SELECT pickup_pin_hash FROM bookings;").is_err());

    auto up = run_migrate(db, {QStringLiteral("2")});
    REQUIRE(up.unwrap().toObject().value(QStringLiteral("schemaVersion")).toInt() == 2);

    auto bad = run_migrate(db, {QStringLiteral("seven")});
    REQUIRE(exit_code_for(bad.unwrap_err()) == InternalFailure);
    auto too_far = run_migrate(db, {QStringLiteral("9")});
    REQUIRE(too_far.unwrap_err().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Command names cover the full surface", "[cli][commands]") {
    const auto names = command_names();
    for (const char* name : {"migrate", "publish", "book", "accept", "reject", "cancel",
                             "edit", "pin", "verify-pickup", "start-ride", "complete-ride",
                             "cancel-ride", "rides", "bookings"}) {
        REQUIRE(names.contains(QString::fromLatin1(name)));
    }
}
