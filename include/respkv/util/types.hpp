#ifndef RESPKV_UTIL_TYPES_HPP
#define RESPKV_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>

namespace respkv::util {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

}  // namespace respkv::util

#endif
