#pragma once

#include <chrono>
#include <functional>

namespace powshield {

// Wall-clock source shared by the freshness check and the expiring stores.
// Injected so that windows and expiry can be driven deterministically.
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock system_clock_source() {
    return [] { return std::chrono::system_clock::now(); };
}

inline long long unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}
