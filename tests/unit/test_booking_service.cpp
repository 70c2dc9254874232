#include <catch2/catch_test_macros.hpp>
#include "service/booking_service.hpp"
#include "support/fixtures.hpp"

#include <regex>

using namespace waypool;
using namespace waypool::service;
using namespace waypool::testing;

TEST_CASE("Booking request", "[booking][create]") {
    ServiceFixture f;
    auto ride = f.publish(3, 1500);

    SECTION("creates a pending booking without reserving seats") {
        auto booking = f.request(ride.id, 2).unwrap();
        REQUIRE(booking.status == BookingStatus::Pending);
        REQUIRE(booking.rider_id == RIDER);
        REQUIRE(booking.price_per_seat_cents == 1500);
        REQUIRE_FALSE(booking.credential.has_value());
        REQUIRE(f.available(ride.id) == 3);
        REQUIRE(std::regex_match(booking.confirmation_number,
                                 std::regex("WP-[0-9]{8}-[0-9A-Z]{6}")));
        REQUIRE(f.notifier.saw("booking.requested"));
        REQUIRE(f.notifier.sent.back().recipient == DRIVER);
    }

    SECTION("authorizes the full price") {
        auto booking = f.request(ride.id, 2).unwrap();
        REQUIRE(f.payments.amounts == std::vector<int64_t>{3000});
        REQUIRE(booking.payment_authorization == "auth-1");
    }

    SECTION("declined payment stores nothing") {
        f.payments.decline = true;
        auto result = f.request(ride.id, 1);
        REQUIRE(result.unwrap_err().code == ErrorCode::PaymentFailed);
        REQUIRE_FALSE(f.notifier.saw("booking.requested"));

        f.payments.decline = false;
        REQUIRE(f.request(ride.id, 1).is_ok());
    }

    SECTION("more seats than available") {
        auto result = f.request(ride.id, 4);
        REQUIRE(result.unwrap_err().code == ErrorCode::InsufficientSeats);
        REQUIRE(result.unwrap_err().seats_available == 3);
        REQUIRE(f.payments.amounts.empty());
    }

    SECTION("zero seats") {
        REQUIRE(f.request(ride.id, 0).unwrap_err().code == ErrorCode::InvalidArgument);
    }

    SECTION("pickup needs an address and sane coordinates") {
        BookingRequest request{ride.id, 1, make_location("")};
        REQUIRE(f.bookings.create(Caller::rider(RIDER), request).unwrap_err().code ==
                ErrorCode::InvalidArgument);

        request.pickup = make_location("somewhere", 91.0, 0.0);
        REQUIRE(f.bookings.create(Caller::rider(RIDER), request).unwrap_err().code ==
                ErrorCode::InvalidArgument);
    }

    SECTION("one open booking per rider") {
        REQUIRE(f.request(ride.id, 1).is_ok());
        REQUIRE(f.request(ride.id, 1).unwrap_err().code == ErrorCode::InvalidState);
        REQUIRE(f.request(ride.id, 1, OTHER_RIDER).is_ok());
    }

    SECTION("drivers cannot book") {
        BookingRequest request{ride.id, 1, make_location("x")};
        REQUIRE(f.bookings.create(Caller::driver(OTHER_DRIVER), request).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.bookings.create(Caller::rider(DRIVER), request).unwrap_err().code ==
                ErrorCode::Forbidden);
    }

    SECTION("unknown or started ride") {
        REQUIRE(f.request(RideId(404), 1).unwrap_err().code == ErrorCode::NotFound);

        REQUIRE(f.rides.start(Caller::driver(DRIVER), ride.id).is_ok());
        REQUIRE(f.request(ride.id, 1).unwrap_err().code == ErrorCode::InvalidState);
    }
}

TEST_CASE("Accepting a booking reserves seats and issues a PIN", "[booking][accept]") {
    ServiceFixture f;
    auto ride = f.publish(2);
    auto booking = f.request(ride.id, 2).unwrap();

    auto accepted = f.bookings.accept(Caller::driver(DRIVER), booking.id);
    REQUIRE(accepted.is_ok());

    const auto& confirmed = accepted.unwrap();
    REQUIRE(confirmed.status == BookingStatus::Confirmed);
    REQUIRE(confirmed.pickup_status == PickupStatus::Pending);
    REQUIRE(confirmed.credential.has_value());
    REQUIRE(confirmed.credential->expires_at == f.clock.now() + std::chrono::hours(24));
    REQUIRE(f.available(ride.id) == 0);
    REQUIRE(f.notifier.saw("booking.accepted"));

    SECTION("the rider can reveal the PIN") {
        auto revealed = f.bookings.reveal_pin(Caller::rider(RIDER), booking.id).unwrap();
        REQUIRE(pickup::is_valid_pin_format(revealed.pin));
        REQUIRE(f.credentials.matches(*confirmed.credential, revealed.pin));
        REQUIRE(revealed.expires_at == confirmed.credential->expires_at);
    }

    SECTION("accepting twice is refused") {
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), booking.id).unwrap_err().code ==
                ErrorCode::InvalidState);
        REQUIRE(f.available(ride.id) == 0);
    }

    SECTION("an expired PIN is not revealed") {
        f.clock.advance(std::chrono::hours(24));
        REQUIRE(f.bookings.reveal_pin(Caller::rider(RIDER), booking.id).unwrap_err().code ==
                ErrorCode::CredentialExpired);
    }
}

TEST_CASE("Accept guards", "[booking][accept]") {
    ServiceFixture f;
    auto ride = f.publish(2);

    SECTION("only the ride's driver") {
        auto booking = f.request(ride.id, 1).unwrap();
        REQUIRE(f.bookings.accept(Caller::driver(OTHER_DRIVER), booking.id).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.bookings.accept(Caller::rider(RIDER), booking.id).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.available(ride.id) == 2);
    }

    SECTION("not enough seats left leaves the booking pending") {
        auto first = f.request(ride.id, 2).unwrap();
        auto second = f.request(ride.id, 1, OTHER_RIDER).unwrap();
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), first.id).is_ok());

        auto refused = f.bookings.accept(Caller::driver(DRIVER), second.id);
        REQUIRE(refused.unwrap_err().code == ErrorCode::InsufficientSeats);
        REQUIRE(refused.unwrap_err().seats_available == 0);

        auto still = f.bookings.get(Caller::rider(OTHER_RIDER), second.id).unwrap();
        REQUIRE(still.status == BookingStatus::Pending);
        REQUIRE_FALSE(still.credential.has_value());
    }

    SECTION("no accepting once the ride has started") {
        auto booking = f.request(ride.id, 1).unwrap();
        REQUIRE(f.rides.start(Caller::driver(DRIVER), ride.id).is_ok());
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), booking.id).unwrap_err().code ==
                ErrorCode::InvalidState);
        REQUIRE(f.available(ride.id) == 2);
    }

    SECTION("unknown booking") {
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), BookingId(404)).unwrap_err().code ==
                ErrorCode::NotFound);
    }
}

TEST_CASE("Rejecting a booking", "[booking][reject]") {
    ServiceFixture f;
    auto ride = f.publish(2);
    auto booking = f.request(ride.id, 2).unwrap();

    auto rejected = f.bookings.reject(Caller::driver(DRIVER), booking.id).unwrap();
    REQUIRE(rejected.status == BookingStatus::Rejected);
    REQUIRE(f.available(ride.id) == 2);
    REQUIRE(f.notifier.saw("booking.rejected"));

    SECTION("cannot be accepted afterwards") {
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), booking.id).unwrap_err().code ==
                ErrorCode::InvalidState);
    }

    SECTION("rider may request again") {
        REQUIRE(f.request(ride.id, 1).is_ok());
    }
}

TEST_CASE("Rider cancels a booking", "[booking][cancel]") {
    ServiceFixture f;
    auto ride = f.publish(3);

    SECTION("confirmed seats return to the ride") {
        auto booking = f.confirmed(ride.id, 2);
        REQUIRE(f.available(ride.id) == 1);

        auto cancelled = f.bookings.cancel(Caller::rider(RIDER), booking.id).unwrap();
        REQUIRE(cancelled.status == BookingStatus::Cancelled);
        REQUIRE(f.available(ride.id) == 3);
        REQUIRE(f.notifier.sent.back().event == "booking.cancelled");
        REQUIRE(f.notifier.sent.back().recipient == DRIVER);
    }

    SECTION("pending bookings release nothing") {
        auto booking = f.request(ride.id, 2).unwrap();
        REQUIRE(f.bookings.cancel(Caller::rider(RIDER), booking.id).is_ok());
        REQUIRE(f.available(ride.id) == 3);
    }

    SECTION("cancelling twice") {
        auto booking = f.confirmed(ride.id, 1);
        REQUIRE(f.bookings.cancel(Caller::rider(RIDER), booking.id).is_ok());
        REQUIRE(f.bookings.cancel(Caller::rider(RIDER), booking.id).unwrap_err().code ==
                ErrorCode::InvalidState);
        REQUIRE(f.available(ride.id) == 3);
    }

    SECTION("only the booking's rider") {
        auto booking = f.request(ride.id, 1).unwrap();
        REQUIRE(f.bookings.cancel(Caller::rider(OTHER_RIDER), booking.id).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.bookings.cancel(Caller::driver(DRIVER), booking.id).unwrap_err().code ==
                ErrorCode::Forbidden);
    }

    SECTION("not after the ride completed") {
        auto booking = f.confirmed(ride.id, 1);
        REQUIRE(f.rides.start(Caller::driver(DRIVER), ride.id).is_ok());
        REQUIRE(f.rides.complete(Caller::driver(DRIVER), ride.id).is_ok());
        REQUIRE(f.bookings.cancel(Caller::rider(RIDER), booking.id).unwrap_err().code ==
                ErrorCode::InvalidState);
    }
}

TEST_CASE("Rider edits a booking", "[booking][edit]") {
    ServiceFixture f;
    auto ride = f.publish(4);

    SECTION("confirmed booking grows and shrinks against the ledger") {
        auto booking = f.confirmed(ride.id, 2);
        REQUIRE(f.available(ride.id) == 2);

        auto grown = f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{3, std::nullopt});
        REQUIRE(grown.unwrap().number_of_seats == 3);
        REQUIRE(f.available(ride.id) == 1);

        auto shrunk = f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{1, std::nullopt});
        REQUIRE(shrunk.unwrap().number_of_seats == 1);
        REQUIRE(f.available(ride.id) == 3);
        REQUIRE(f.notifier.saw("booking.updated"));
    }

    SECTION("growing past availability changes nothing") {
        auto booking = f.confirmed(ride.id, 2);
        auto result = f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{5, std::nullopt});
        REQUIRE(result.unwrap_err().code == ErrorCode::InsufficientSeats);
        REQUIRE(f.available(ride.id) == 2);
        REQUIRE(f.bookings.get(Caller::rider(RIDER), booking.id).unwrap().number_of_seats == 2);
    }

    SECTION("pending booking only checks availability") {
        auto booking = f.request(ride.id, 1).unwrap();
        REQUIRE(f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{4, std::nullopt}).is_ok());
        REQUIRE(f.available(ride.id) == 4);
        REQUIRE(f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{5, std::nullopt})
                    .unwrap_err().code == ErrorCode::InsufficientSeats);
    }

    SECTION("pickup location only") {
        auto booking = f.request(ride.id, 1).unwrap();
        const auto moved = make_location("Clark Park");
        auto edited = f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{std::nullopt, moved});
        REQUIRE(edited.unwrap().pickup == moved);
    }

    SECTION("no change sends no notification") {
        auto booking = f.request(ride.id, 1).unwrap();
        const auto sent = f.notifier.sent.size();
        REQUIRE(f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{}).is_ok());
        REQUIRE(f.notifier.sent.size() == sent);
    }

    SECTION("not after the ride starts") {
        auto booking = f.confirmed(ride.id, 1);
        REQUIRE(f.rides.start(Caller::driver(DRIVER), ride.id).is_ok());
        REQUIRE(f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{2, std::nullopt})
                    .unwrap_err().code == ErrorCode::InvalidState);
    }

    SECTION("invalid values") {
        auto booking = f.request(ride.id, 1).unwrap();
        REQUIRE(f.bookings.edit(Caller::rider(RIDER), booking.id, BookingEdit{0, std::nullopt})
                    .unwrap_err().code == ErrorCode::InvalidArgument);
        REQUIRE(f.bookings.edit(Caller::rider(OTHER_RIDER), booking.id, BookingEdit{2, std::nullopt})
                    .unwrap_err().code == ErrorCode::Forbidden);
    }
}

TEST_CASE("Notification failures never fail an operation", "[booking][notify]") {
    ServiceFixture f;
    auto ride = f.publish(2);

    SECTION("returned error") {
        f.notifier.mode = RecordingNotifier::Mode::Fail;
        auto booking = f.request(ride.id, 1);
        REQUIRE(booking.is_ok());
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), booking.unwrap().id).is_ok());
    }

    SECTION("thrown exception") {
        f.notifier.mode = RecordingNotifier::Mode::Throw;
        auto booking = f.request(ride.id, 1);
        REQUIRE(booking.is_ok());
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), booking.unwrap().id).is_ok());
        REQUIRE(f.available(ride.id) == 1);
    }
}

TEST_CASE("Booking visibility", "[booking][read]") {
    ServiceFixture f;
    auto ride = f.publish(3);
    auto booking = f.request(ride.id, 1).unwrap();
    REQUIRE(f.request(ride.id, 1, OTHER_RIDER).is_ok());

    REQUIRE(f.bookings.get(Caller::rider(RIDER), booking.id).is_ok());
    REQUIRE(f.bookings.get(Caller::driver(DRIVER), booking.id).is_ok());
    REQUIRE(f.bookings.get(Caller::rider(OTHER_RIDER), booking.id).unwrap_err().code ==
            ErrorCode::Forbidden);

    REQUIRE(f.bookings.list_for_ride(Caller::driver(DRIVER), ride.id).unwrap().size() == 2);
    REQUIRE(f.bookings.list_for_ride(Caller::driver(OTHER_DRIVER), ride.id).unwrap_err().code ==
            ErrorCode::Forbidden);

    SECTION("PIN is only for confirmed bookings of the caller") {
        REQUIRE(f.bookings.reveal_pin(Caller::rider(RIDER), booking.id).unwrap_err().code ==
                ErrorCode::InvalidState);
        REQUIRE(f.bookings.accept(Caller::driver(DRIVER), booking.id).is_ok());
        REQUIRE(f.bookings.reveal_pin(Caller::rider(OTHER_RIDER), booking.id).unwrap_err().code ==
                ErrorCode::Forbidden);
        REQUIRE(f.bookings.reveal_pin(Caller::driver(DRIVER), booking.id).unwrap_err().code ==
                ErrorCode::Forbidden);
    }
}

TEST_CASE("Confirmation numbers", "[booking]") {
    REQUIRE(crypto::init().is_ok());
    const auto number = BookingService::make_confirmation_number(Timestamp(1'700'000'000'000));
    REQUIRE(number.rfind("WP-20231114-", 0) == 0);
    REQUIRE(number.size() == 18);
}
