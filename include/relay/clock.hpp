#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace relay {

// Wall clock abstraction: milliseconds since the Unix epoch.
// Default uses system_clock, tests can inject a fake clock.
using WallClock = std::function<std::int64_t()>;

inline std::int64_t current_time_ms() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());
    return static_cast<std::int64_t>(ms.count());
}

}  // namespace relay
