#pragma once

#include "../core/types.hpp"

namespace svcExchange::platform::impl_generic {

// No clock source on bare userspace jobs: hand out a monotonic counter instead.
inline timestamp_t get_system_time_us() noexcept {
    static timestamp_t counter = 0;
    return ++counter;
}

// Bare jobs print through the kernel log syscall, which itself marshals its
// string through the exchange area. Logging from here would recurse.
inline void write_line(const char* msg) noexcept { (void)msg; }

} // namespace svcExchange::platform::impl_generic
