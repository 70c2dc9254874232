#pragma once

#include "core/clock.hpp"
#include "pickup/credential_service.hpp"
#include "service/booking_service.hpp"
#include "service/collaborators.hpp"
#include "service/pickup_verification.hpp"
#include "service/ride_service.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"

#include <QJsonObject>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace waypool::testing {

inline constexpr UserId DRIVER{1};
inline constexpr UserId RIDER{2};
inline constexpr UserId OTHER_RIDER{3};
inline constexpr UserId OTHER_DRIVER{4};

/**
 * ManualClock - Clock that only moves when told to. Safe to read from
 * several worker threads.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp(1'700'000'000'000))
        : millis_(start.millis()) {}

    [[nodiscard]] Timestamp now() const override {
        return Timestamp(millis_.load());
    }

    void set(Timestamp t) { millis_.store(t.millis()); }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        millis_.fetch_add(std::chrono::duration_cast<Timestamp::Duration>(d).count());
    }

private:
    std::atomic<int64_t> millis_;
};

inline storage::Database open_migrated_memory() {
    auto db = storage::Database::open_memory().unwrap();
    storage::initialize_database(db).unwrap();
    return db;
}

inline pickup::CredentialService make_credentials(const pickup::PinPolicy& policy = {}) {
    return pickup::CredentialService::create("test-pickup-secret",
                                             crypto::HashParams::minimal(),
                                             policy).unwrap();
}

inline Location make_location(const std::string& address, double lat = 40.0, double lng = -75.0) {
    return Location{
        .address = address,
        .city = "Philadelphia",
        .state = "PA",
        .zip_code = "19104",
        .latitude = lat,
        .longitude = lng
    };
}

/**
 * Remembers every event; optionally fails or throws on delivery.
 */
class RecordingNotifier final : public service::Notifier {
public:
    enum class Mode { Deliver, Fail, Throw };

    struct Sent {
        UserId recipient;
        std::string event;
        QJsonObject payload;
    };

    Mode mode = Mode::Deliver;
    std::vector<Sent> sent;

    Result<void, Error> notify(UserId recipient,
                               std::string_view event,
                               const QJsonObject& payload) override {
        sent.push_back(Sent{recipient, std::string(event), payload});
        if (mode == Mode::Throw) {
            throw std::runtime_error("push gateway unreachable");
        }
        if (mode == Mode::Fail) {
            return Result<void, Error>::err(Error{"push gateway refused"});
        }
        return Result<void, Error>::ok();
    }

    [[nodiscard]] bool saw(std::string_view event) const {
        for (const auto& s : sent) {
            if (s.event == event) return true;
        }
        return false;
    }
};

class FakePayments final : public service::PaymentAuthorizer {
public:
    bool decline = false;
    std::vector<int64_t> amounts;

    Result<std::string, Error> authorize(int64_t amount_cents,
                                         const std::string& payer_reference) override {
        amounts.push_back(amount_cents);
        if (decline) {
            return Result<std::string, Error>::err(Error{"card declined for " + payer_reference});
        }
        return Result<std::string, Error>::ok("auth-" + std::to_string(amounts.size()));
    }
};

/**
 * One connection with every service wired to it and a clock that only
 * moves when the test says so.
 */
struct ServiceFixture {
    explicit ServiceFixture(const pickup::PinPolicy& policy = {})
        : db(open_migrated_memory())
        , credentials(make_credentials(policy))
        , rides(db, clock, &notifier)
        , bookings(db, clock, credentials, &payments, &notifier)
        , pickups(db, clock, credentials, &notifier) {}

    storage::Database db;
    ManualClock clock;
    RecordingNotifier notifier;
    FakePayments payments;
    pickup::CredentialService credentials;
    service::RideService rides;
    service::BookingService bookings;
    service::PickupVerifier pickups;

    Ride publish(int seats = 3, int64_t price = 1500, UserId driver = DRIVER) {
        return rides.publish(Caller::driver(driver), service::RideListing{
            .origin = make_location("30th Street Station"),
            .destination = make_location("Penn Station", 40.75, -73.99),
            .departure = clock.now() + std::chrono::hours(48),
            .seats = seats,
            .price_per_seat_cents = price
        }).unwrap();
    }

    Result<Booking, Error> request(RideId ride, int seats, UserId rider = RIDER) {
        return bookings.create(Caller::rider(rider), service::BookingRequest{
            .ride_id = ride,
            .number_of_seats = seats,
            .pickup = make_location("3401 Walnut St")
        });
    }

    Booking confirmed(RideId ride, int seats, UserId rider = RIDER) {
        auto booking = request(ride, seats, rider).unwrap();
        return bookings.accept(Caller::driver(DRIVER), booking.id).unwrap();
    }

    int available(RideId ride) {
        return storage::SeatLedger(db).available(ride).unwrap();
    }
};

} // namespace waypool::testing
