#pragma once

#include "../core/types.hpp"

#include <time.h>
#include <cstdio>

namespace svcExchange::platform::impl_posix {

inline timestamp_t get_system_time_us() noexcept {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<timestamp_t>(ts.tv_sec) * 1000000ULL + static_cast<timestamp_t>(ts.tv_nsec / 1000);
}

inline void write_line(const char* msg) noexcept {
    if (msg) { std::puts(msg); }
}

} // namespace svcExchange::platform::impl_posix
