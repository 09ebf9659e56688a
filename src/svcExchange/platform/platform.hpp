#pragma once

// Auto-detect platform if the build system did not provide one
#if !defined(SVCEXCHANGE_PLATFORM_POSIX) && \
    !defined(SVCEXCHANGE_PLATFORM_GENERIC)
  #if defined(__unix__) || defined(__APPLE__)
    #define SVCEXCHANGE_PLATFORM_POSIX
  #else
    #define SVCEXCHANGE_PLATFORM_GENERIC
  #endif
#endif

#include "../core/types.hpp"
#include <cstdio>

#if defined(SVCEXCHANGE_PLATFORM_POSIX)
#  include "impl_posix.hpp"
   namespace svcExchange::platform { namespace impl = svcExchange::platform::impl_posix; }
#else
#  include "impl_generic.hpp"
   namespace svcExchange::platform { namespace impl = svcExchange::platform::impl_generic; }
#endif

namespace svcExchange::platform {

inline timestamp_t get_system_time_us() noexcept { return impl::get_system_time_us(); }

// Centralized logging
#ifndef SVCEXCHANGE_ENABLE_LOGGING
#define SVCEXCHANGE_ENABLE_LOGGING 1 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

inline void log(const char* message) noexcept {
#if SVCEXCHANGE_ENABLE_LOGGING
    impl::write_line(message);
#else
    (void)message;
#endif
}

inline void logf(const char* fmt, u32 arg1) noexcept {
#if SVCEXCHANGE_ENABLE_LOGGING
    char buffer[128]; std::snprintf(buffer, sizeof(buffer), fmt, arg1); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1;
#endif
}
inline void logf(const char* fmt, u32 arg1, u32 arg2) noexcept {
#if SVCEXCHANGE_ENABLE_LOGGING
    char buffer[128]; std::snprintf(buffer, sizeof(buffer), fmt, arg1, arg2); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1; (void)arg2;
#endif
}
inline void logf(const char* fmt, u32 arg1, u32 arg2, u32 arg3) noexcept {
#if SVCEXCHANGE_ENABLE_LOGGING
    char buffer[128]; std::snprintf(buffer, sizeof(buffer), fmt, arg1, arg2, arg3); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1; (void)arg2; (void)arg3;
#endif
}
inline void logf(const char* fmt, u32 arg1, u32 arg2, u32 arg3, u32 arg4) noexcept {
#if SVCEXCHANGE_ENABLE_LOGGING
    char buffer[128]; std::snprintf(buffer, sizeof(buffer), fmt, arg1, arg2, arg3, arg4); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1; (void)arg2; (void)arg3; (void)arg4;
#endif
}

} // namespace svcExchange::platform
