#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <compare>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <functional>

namespace waypool {

/**
 * Id - Store-assigned integer identity, tagged so ride, booking and user
 * ids cannot be mixed up.
 */
template<typename Tag>
struct Id {
    int64_t value{0};

    constexpr Id() noexcept = default;
    explicit constexpr Id(int64_t v) noexcept : value(v) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value > 0; }
    [[nodiscard]] std::string to_string() const { return std::to_string(value); }

    auto operator<=>(const Id&) const = default;
    bool operator==(const Id&) const = default;
};

using RideId = Id<struct RideTag>;
using BookingId = Id<struct BookingTag>;
using UserId = Id<struct UserTag>;

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since Unix epoch for SQLite compatibility.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    /**
     * Get the current wall-clock time. Services read time through
     * waypool::Clock instead so tests can control it.
     */
    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as ISO 8601 string (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto ms = millis_ % 1000;
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

    /**
     * Format the UTC calendar date as YYYYMMDD.
     */
    [[nodiscard]] std::string to_compact_date() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y%m%d");
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    template<typename Rep, typename Period>
    Timestamp operator+(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(millis_ + std::chrono::duration_cast<Duration>(d).count());
    }

    template<typename Rep, typename Period>
    Timestamp operator-(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(millis_ - std::chrono::duration_cast<Duration>(d).count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace waypool

namespace std {
    template<typename Tag>
    struct hash<waypool::Id<Tag>> {
        size_t operator()(const waypool::Id<Tag>& id) const noexcept {
            return std::hash<int64_t>{}(id.value);
        }
    };
}
