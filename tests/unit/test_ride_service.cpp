#include <catch2/catch_test_macros.hpp>
#include "service/ride_service.hpp"
#include "support/fixtures.hpp"

using namespace waypool;
using namespace waypool::service;
using namespace waypool::testing;

namespace {

RideListing listing(Timestamp departure, int seats) {
    return RideListing{
        .origin = make_location("Union Station"),
        .destination = make_location("Logan Airport", 42.36, -71.01),
        .departure = departure,
        .seats = seats,
        .price_per_seat_cents = 4200
    };
}

} // namespace

TEST_CASE("Publishing a ride", "[ride][publish]") {
    ServiceFixture f;
    const auto departure = f.clock.now() + std::chrono::hours(5);

    SECTION("opens every seat") {
        auto ride = f.rides.publish(Caller::driver(DRIVER), listing(departure, 4)).unwrap();
        REQUIRE(ride.id.is_valid());
        REQUIRE(ride.status == RideStatus::Scheduled);
        REQUIRE(ride.total_seats == 4);
        REQUIRE(ride.available_seats == 4);
        REQUIRE(ride.driver_id == DRIVER);
        REQUIRE(f.rides.get(ride.id).unwrap() == ride);
    }

    SECTION("seat count bounds") {
        REQUIRE(f.rides.publish(Caller::driver(DRIVER), listing(departure, 0)).unwrap_err().code ==
                ErrorCode::InvalidArgument);
        REQUIRE(f.rides.publish(Caller::driver(DRIVER), listing(departure, 9)).unwrap_err().code ==
                ErrorCode::InvalidArgument);
        REQUIRE(f.rides.publish(Caller::driver(DRIVER), listing(departure, 8)).is_ok());
    }

    SECTION("negative price") {
        auto bad = listing(departure, 2);
        bad.price_per_seat_cents = -1;
        REQUIRE(f.rides.publish(Caller::driver(DRIVER), bad).unwrap_err().code ==
                ErrorCode::InvalidArgument);
    }

    SECTION("riders cannot publish") {
        REQUIRE(f.rides.publish(Caller::rider(RIDER), listing(departure, 2)).unwrap_err().code ==
                ErrorCode::Forbidden);
    }

    SECTION("listing by driver") {
        REQUIRE(f.rides.publish(Caller::driver(DRIVER), listing(departure, 2)).is_ok());
        REQUIRE(f.rides.publish(Caller::driver(OTHER_DRIVER), listing(departure, 2)).is_ok());
        REQUIRE(f.rides.list_for_driver(Caller::driver(DRIVER)).unwrap().size() == 1);
    }
}

TEST_CASE("Ride lifecycle", "[ride][lifecycle]") {
    ServiceFixture f;
    auto ride = f.publish(3);

    SECTION("start then complete") {
        REQUIRE(f.rides.start(Caller::driver(DRIVER), ride.id).unwrap().status == RideStatus::InProgress);
        REQUIRE(f.rides.complete(Caller::driver(DRIVER), ride.id).unwrap().status == RideStatus::Completed);
    }

    SECTION("cannot complete before starting") {
        REQUIRE(f.rides.complete(Caller::driver(DRIVER), ride.id).unwrap_err().code ==
                ErrorCode::InvalidState);
    }

    SECTION("only the owner moves the ride") {
        REQUIRE(f.rides.start(Caller::driver(OTHER_DRIVER), ride.id).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.rides.cancel(Caller::rider(RIDER), ride.id).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.rides.get(ride.id).unwrap().status == RideStatus::Scheduled);
    }

    SECTION("unknown ride") {
        REQUIRE(f.rides.start(Caller::driver(DRIVER), RideId(404)).unwrap_err().code ==
                ErrorCode::NotFound);
    }
}

TEST_CASE("Cancelling a ride settles its bookings", "[ride][cancel]") {
    ServiceFixture f;
    auto ride = f.publish(4);
    auto confirmed = f.confirmed(ride.id, 3);
    auto pending = f.request(ride.id, 1, OTHER_RIDER).unwrap();
    REQUIRE(f.available(ride.id) == 1);

    auto cancelled = f.rides.cancel(Caller::driver(DRIVER), ride.id).unwrap();
    REQUIRE(cancelled.status == RideStatus::Cancelled);
    REQUIRE(cancelled.available_seats == 4);

    REQUIRE(f.bookings.get(Caller::rider(RIDER), confirmed.id).unwrap().status == BookingStatus::Cancelled);
    REQUIRE(f.bookings.get(Caller::rider(OTHER_RIDER), pending.id).unwrap().status == BookingStatus::Cancelled);

    size_t ride_cancelled = 0;
    for (const auto& sent : f.notifier.sent) {
        if (sent.event == "ride.cancelled") ++ride_cancelled;
    }
    REQUIRE(ride_cancelled == 2);

    SECTION("a cancelled ride stays cancelled") {
        REQUIRE(f.rides.cancel(Caller::driver(DRIVER), ride.id).unwrap_err().code ==
                ErrorCode::InvalidState);
        REQUIRE(f.available(ride.id) == 4);
    }
}

TEST_CASE("Completing a ride", "[ride][complete]") {
    ServiceFixture f;
    auto ride = f.publish(4);
    auto confirmed = f.confirmed(ride.id, 2);
    auto pending = f.request(ride.id, 1, OTHER_RIDER).unwrap();
    REQUIRE(f.rides.start(Caller::driver(DRIVER), ride.id).is_ok());

    auto completed = f.rides.complete(Caller::driver(DRIVER), ride.id).unwrap();
    REQUIRE(completed.status == RideStatus::Completed);
    REQUIRE(completed.available_seats == 2);

    REQUIRE(f.bookings.get(Caller::rider(RIDER), confirmed.id).unwrap().status == BookingStatus::Completed);
    REQUIRE(f.bookings.get(Caller::rider(OTHER_RIDER), pending.id).unwrap().status == BookingStatus::Cancelled);
    REQUIRE_FALSE(f.notifier.saw("ride.cancelled"));
}
