#pragma once

#include "../platform/platform.hpp"

/**
 * @brief Precondition check for debug builds
 *
 * Logs the failing location and halts the job. Compiled out unless
 * SVCEXCHANGE_DEBUG is defined.
 */
#ifdef SVCEXCHANGE_DEBUG
    #define SVCEXCHANGE_ASSERT(condition) \
        do { \
            if (!(condition)) { \
                ::svcExchange::platform::logf("svcExchange assert failed: line %u", static_cast<::svcExchange::u32>(__LINE__)); \
                while (true) { /* halt */ } \
            } \
        } while (0)
#else
    #define SVCEXCHANGE_ASSERT(condition) ((void)0)
#endif
