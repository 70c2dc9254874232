#include <catch2/catch_test_macros.hpp>
#include "core/booking.hpp"
#include "core/ride.hpp"

using namespace waypool;

TEST_CASE("Booking transitions follow the declared edges", "[lifecycle][booking]") {
    SECTION("pending can be accepted, rejected or cancelled") {
        REQUIRE(transition(BookingStatus::Pending, BookingEvent::Accept).unwrap() == BookingStatus::Confirmed);
        REQUIRE(transition(BookingStatus::Pending, BookingEvent::Reject).unwrap() == BookingStatus::Rejected);
        REQUIRE(transition(BookingStatus::Pending, BookingEvent::Cancel).unwrap() == BookingStatus::Cancelled);
    }

    SECTION("confirmed can be cancelled or completed") {
        REQUIRE(transition(BookingStatus::Confirmed, BookingEvent::Cancel).unwrap() == BookingStatus::Cancelled);
        REQUIRE(transition(BookingStatus::Confirmed, BookingEvent::Complete).unwrap() == BookingStatus::Completed);
    }

    SECTION("a pending booking cannot complete") {
        auto result = transition(BookingStatus::Pending, BookingEvent::Complete);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidState);
    }

    SECTION("a confirmed booking cannot be accepted twice") {
        REQUIRE(transition(BookingStatus::Confirmed, BookingEvent::Accept).is_err());
        REQUIRE(transition(BookingStatus::Confirmed, BookingEvent::Reject).is_err());
    }

    SECTION("terminal states accept no event") {
        for (auto from : {BookingStatus::Rejected, BookingStatus::Cancelled, BookingStatus::Completed}) {
            for (auto event : {BookingEvent::Accept, BookingEvent::Reject,
                               BookingEvent::Cancel, BookingEvent::Complete}) {
                auto result = transition(from, event);
                REQUIRE(result.is_err());
                REQUIRE(result.unwrap_err().code == ErrorCode::InvalidState);
            }
        }
    }
}

TEST_CASE("Only confirmed bookings hold seats", "[lifecycle][booking]") {
    REQUIRE(holds_seats(BookingStatus::Confirmed));
    REQUIRE_FALSE(holds_seats(BookingStatus::Pending));
    REQUIRE_FALSE(holds_seats(BookingStatus::Cancelled));
    REQUIRE_FALSE(holds_seats(BookingStatus::Completed));
}

TEST_CASE("Booking status names round-trip", "[lifecycle][booking]") {
    for (auto status : {BookingStatus::Pending, BookingStatus::Confirmed, BookingStatus::Rejected,
                        BookingStatus::Cancelled, BookingStatus::Completed}) {
        REQUIRE(parse_booking_status(to_string(status)) == status);
    }
    REQUIRE(parse_pickup_status("picked_up") == PickupStatus::PickedUp);
    REQUIRE_FALSE(parse_booking_status("accepted").has_value());
}

TEST_CASE("Edits are allowed until the ride starts", "[lifecycle][booking]") {
    REQUIRE(check_editable(BookingStatus::Pending, RideStatus::Scheduled).is_ok());
    REQUIRE(check_editable(BookingStatus::Confirmed, RideStatus::Scheduled).is_ok());

    REQUIRE(check_editable(BookingStatus::Confirmed, RideStatus::InProgress).unwrap_err().code ==
            ErrorCode::InvalidState);
    REQUIRE(check_editable(BookingStatus::Confirmed, RideStatus::Completed).is_err());
    REQUIRE(check_editable(BookingStatus::Pending, RideStatus::Cancelled).is_err());
    REQUIRE(check_editable(BookingStatus::Cancelled, RideStatus::Scheduled).is_err());
    REQUIRE(check_editable(BookingStatus::Rejected, RideStatus::Scheduled).is_err());
}

TEST_CASE("Credential state follows expiry", "[lifecycle][booking]") {
    Booking booking;
    REQUIRE(booking.credential_state(Timestamp(1000)) == CredentialState::None);

    booking.credential = PickupCredential{"hash", "sealed", Timestamp(2000)};
    REQUIRE(booking.credential_state(Timestamp(1999)) == CredentialState::Active);
    REQUIRE(booking.credential_state(Timestamp(2000)) == CredentialState::Expired);
}

TEST_CASE("Ride transitions", "[lifecycle][ride]") {
    REQUIRE(transition(RideStatus::Scheduled, RideEvent::Start).unwrap() == RideStatus::InProgress);
    REQUIRE(transition(RideStatus::InProgress, RideEvent::Complete).unwrap() == RideStatus::Completed);
    REQUIRE(transition(RideStatus::Scheduled, RideEvent::Cancel).unwrap() == RideStatus::Cancelled);
    REQUIRE(transition(RideStatus::InProgress, RideEvent::Cancel).unwrap() == RideStatus::Cancelled);

    SECTION("a scheduled ride cannot complete without starting") {
        REQUIRE(transition(RideStatus::Scheduled, RideEvent::Complete).unwrap_err().code ==
                ErrorCode::InvalidState);
    }

    SECTION("terminal rides stay put") {
        REQUIRE(transition(RideStatus::Completed, RideEvent::Cancel).is_err());
        REQUIRE(transition(RideStatus::Cancelled, RideEvent::Start).is_err());
        REQUIRE(is_terminal(RideStatus::Completed));
        REQUIRE(is_terminal(RideStatus::Cancelled));
        REQUIRE_FALSE(is_terminal(RideStatus::InProgress));
    }

    SECTION("status names round-trip") {
        REQUIRE(parse_ride_status("in-progress") == RideStatus::InProgress);
        REQUIRE(to_string(RideStatus::Cancelled) == "cancelled");
        REQUIRE_FALSE(parse_ride_status("started").has_value());
    }
}
