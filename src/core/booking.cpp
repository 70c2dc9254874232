#include "core/booking.hpp"

#include <array>

namespace waypool {
namespace {

struct BookingEdge {
    BookingStatus from;
    BookingEvent event;
    BookingStatus to;
};

constexpr std::array<BookingEdge, 5> BOOKING_EDGES = {{
    {BookingStatus::Pending, BookingEvent::Accept, BookingStatus::Confirmed},
    {BookingStatus::Pending, BookingEvent::Reject, BookingStatus::Rejected},
    {BookingStatus::Pending, BookingEvent::Cancel, BookingStatus::Cancelled},
    {BookingStatus::Confirmed, BookingEvent::Cancel, BookingStatus::Cancelled},
    {BookingStatus::Confirmed, BookingEvent::Complete, BookingStatus::Completed},
}};

} // namespace

std::optional<BookingStatus> parse_booking_status(std::string_view name) {
    if (name == "pending") return BookingStatus::Pending;
    if (name == "confirmed") return BookingStatus::Confirmed;
    if (name == "rejected") return BookingStatus::Rejected;
    if (name == "cancelled") return BookingStatus::Cancelled;
    if (name == "completed") return BookingStatus::Completed;
    return std::nullopt;
}

std::optional<PickupStatus> parse_pickup_status(std::string_view name) {
    if (name == "pending") return PickupStatus::Pending;
    if (name == "picked_up") return PickupStatus::PickedUp;
    return std::nullopt;
}

Result<BookingStatus> transition(BookingStatus from, BookingEvent event) {
    for (const auto& edge : BOOKING_EDGES) {
        if (edge.from == from && edge.event == event) {
            return Result<BookingStatus>::ok(edge.to);
        }
    }
    return Result<BookingStatus>::err(Error{
        "Cannot " + std::string(to_string(event)) + " a " +
            std::string(to_string(from)) + " booking",
        ErrorCode::InvalidState});
}

Result<void> check_editable(BookingStatus booking, RideStatus ride) {
    if (booking == BookingStatus::Cancelled || booking == BookingStatus::Rejected) {
        return Result<void>::err(Error{
            "Cannot update a " + std::string(to_string(booking)) + " booking",
            ErrorCode::InvalidState});
    }
    if (booking == BookingStatus::Completed || ride == RideStatus::Completed) {
        return Result<void>::err(Error{"Cannot update a completed booking", ErrorCode::InvalidState});
    }
    if (ride == RideStatus::InProgress) {
        return Result<void>::err(Error{
            "Cannot update booking for a ride that has already started", ErrorCode::InvalidState});
    }
    if (ride == RideStatus::Cancelled) {
        return Result<void>::err(Error{
            "Cannot update booking for a cancelled ride", ErrorCode::InvalidState});
    }
    return Result<void>::ok();
}

} // namespace waypool
