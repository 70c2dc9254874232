#include "core/types.hpp"

#include <type_traits>

// Implementation is entirely in the header for this simple types module.

namespace waypool {

// Ids and timestamps are passed by value everywhere.
static_assert(std::is_trivially_copyable_v<RideId>, "RideId should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(sizeof(Timestamp) == sizeof(int64_t), "Timestamp should wrap a single int64");

} // namespace waypool
