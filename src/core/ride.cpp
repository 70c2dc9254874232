#include "core/ride.hpp"

#include <array>

namespace waypool {
namespace {

struct RideEdge {
    RideStatus from;
    RideEvent event;
    RideStatus to;
};

constexpr std::array<RideEdge, 4> RIDE_EDGES = {{
    {RideStatus::Scheduled, RideEvent::Start, RideStatus::InProgress},
    {RideStatus::InProgress, RideEvent::Complete, RideStatus::Completed},
    {RideStatus::Scheduled, RideEvent::Cancel, RideStatus::Cancelled},
    {RideStatus::InProgress, RideEvent::Cancel, RideStatus::Cancelled},
}};

} // namespace

Result<RideStatus> transition(RideStatus from, RideEvent event) {
    for (const auto& edge : RIDE_EDGES) {
        if (edge.from == from && edge.event == event) {
            return Result<RideStatus>::ok(edge.to);
        }
    }
    return Result<RideStatus>::err(Error{
        "Cannot " + std::string(to_string(event)) + " a " +
            std::string(to_string(from)) + " ride",
        ErrorCode::InvalidState});
}

} // namespace waypool
