#ifndef LOCALSTORE_UTIL_TYPES_HPP
#define LOCALSTORE_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace localstore::util {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// ordered_json keeps object keys in insertion order, which gives a deterministic file layout
using Json = nlohmann::ordered_json;

using SubscriptionId = std::uint64_t;
using TimerId = std::uint64_t;

}  // namespace localstore::util

#endif
