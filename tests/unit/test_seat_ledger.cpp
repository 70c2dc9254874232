#include <catch2/catch_test_macros.hpp>
#include "storage/seat_ledger.hpp"
#include "storage/ride_repository.hpp"
#include "support/fixtures.hpp"

using namespace waypool;
using namespace waypool::storage;
using namespace waypool::testing;

namespace {

RideId insert_ride(Database& db, int seats) {
    const Timestamp now(1'700'000'000'000);
    RideRepository rides(db);
    return rides.insert(Ride{
        .driver_id = DRIVER,
        .origin = make_location("A"),
        .destination = make_location("B"),
        .departure = now + std::chrono::hours(2),
        .total_seats = seats,
        .available_seats = seats,
        .price_per_seat_cents = 1000,
        .created_at = now,
        .updated_at = now
    }).unwrap().id;
}

} // namespace

TEST_CASE("SeatLedger reserve and release", "[ledger]") {
    auto db = open_migrated_memory();
    SeatLedger ledger(db);
    const auto ride = insert_ride(db, 3);

    SECTION("reserve returns what is left") {
        REQUIRE(ledger.reserve(ride, 2).unwrap() == 1);
        REQUIRE(ledger.available(ride).unwrap() == 1);
    }

    SECTION("reserve refuses to oversell and leaves the count alone") {
        REQUIRE(ledger.reserve(ride, 2).is_ok());
        auto refused = ledger.reserve(ride, 2);
        REQUIRE(refused.is_err());
        REQUIRE(refused.unwrap_err().code == ErrorCode::InsufficientSeats);
        REQUIRE(refused.unwrap_err().seats_available == 1);
        REQUIRE(ledger.available(ride).unwrap() == 1);
    }

    SECTION("the last seat can be taken") {
        REQUIRE(ledger.reserve(ride, 3).unwrap() == 0);
        REQUIRE(ledger.reserve(ride, 1).unwrap_err().seats_available == 0);
    }

    SECTION("release gives seats back") {
        REQUIRE(ledger.reserve(ride, 3).is_ok());
        REQUIRE(ledger.release(ride, 2).unwrap() == 2);
    }

    SECTION("release never exceeds the published count") {
        REQUIRE(ledger.reserve(ride, 1).is_ok());
        auto result = ledger.release(ride, 2);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::Internal);
        REQUIRE(ledger.available(ride).unwrap() == 2);
    }

    SECTION("non-positive counts are rejected") {
        REQUIRE(ledger.reserve(ride, 0).unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(ledger.reserve(ride, -1).unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(ledger.release(ride, 0).unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(ledger.available(ride).unwrap() == 3);
    }

    SECTION("unknown ride") {
        REQUIRE(ledger.reserve(RideId(404), 1).unwrap_err().code == ErrorCode::NotFound);
        REQUIRE(ledger.release(RideId(404), 1).unwrap_err().code == ErrorCode::NotFound);
        REQUIRE(ledger.available(RideId(404)).unwrap_err().code == ErrorCode::NotFound);
    }
}

TEST_CASE("SeatLedger adjust", "[ledger]") {
    auto db = open_migrated_memory();
    SeatLedger ledger(db);
    const auto ride = insert_ride(db, 4);
    REQUIRE(ledger.reserve(ride, 2).is_ok());

    REQUIRE(ledger.adjust(ride, 1).unwrap() == 1);
    REQUIRE(ledger.adjust(ride, -2).unwrap() == 3);
    REQUIRE(ledger.adjust(ride, 0).unwrap() == 3);
    REQUIRE(ledger.adjust(ride, 4).unwrap_err().code == ErrorCode::InsufficientSeats);
    REQUIRE(ledger.available(ride).unwrap() == 3);
}

TEST_CASE("SeatLedger joins the caller's transaction", "[ledger]") {
    auto db = open_migrated_memory();
    SeatLedger ledger(db);
    const auto ride = insert_ride(db, 2);

    auto result = db.transaction([&]() -> Result<void, Error> {
        auto reserved = ledger.reserve(ride, 2);
        if (reserved.is_err()) {
            return Result<void, Error>::err(reserved.unwrap_err());
        }
        return Result<void, Error>::err(Error{"later step failed", ErrorCode::InvalidState});
    });

    REQUIRE(result.is_err());
    REQUIRE(ledger.available(ride).unwrap() == 2);
}
