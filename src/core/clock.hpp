#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace voxgate::core {

using TimePoint = std::chrono::system_clock::time_point;

// Time source injected into every time-dependent component.
using NowFn = std::function<TimePoint()>;

inline NowFn system_now() {
    return [] { return std::chrono::system_clock::now(); };
}

// Seconds since the Unix epoch, as reported in rate-limit and audit payloads.
inline double to_epoch_seconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

inline int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace voxgate::core
