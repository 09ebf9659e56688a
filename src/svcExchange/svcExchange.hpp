#pragma once

/**
 * @file svcExchange.hpp
 * @brief Main header for svcExchange - kernel/user exchange area access
 *
 * Userspace side of the syscall exchange area: a statically placed buffer in
 * the .svcexchange section, typed copy operations in and out of it, and the
 * overlap guard that keeps byte copies from aliasing it.
 * No RTTI, no exceptions, no dynamic allocation.
 * Depends only on ETL (Embedded Template Library).
 *
 * @version 1.0.0
 * @date 2025
 */

#include "svcExchange/core/types.hpp"
#include "svcExchange/core/config.hpp"
#include "svcExchange/error/result.hpp"
#include "svcExchange/error/error_handler.hpp"
#include "svcExchange/diagnostics/transfer_stats.hpp"
#include "svcExchange/exchange/overlap_guard.hpp"
#include "svcExchange/exchange/area.hpp"
#include "svcExchange/uapi/types.hpp"

/**
 * @namespace svcExchange
 * @brief Main namespace for the exchange area library
 */
namespace svcExchange {

    /**
     * @brief Announce the exchange area on the platform log
     *
     * Optional. The area needs no initialization of its own: it is zero-filled
     * by the loader.
     * @return true if the area is usable
     */
    inline bool initialize() noexcept {
        const memory::region bounds = runtime::area_bounds();
        platform::logf("svcExchange: exchange area %u bytes, align %u",
                       static_cast<u32>(bounds.size()),
                       static_cast<u32>(config::exchange_area_align));
        return bounds.size() == config::exchange_area_len;
    }

    /**
     * @brief Get library version
     */
    constexpr const char* version() noexcept {
        return "1.0.0";
    }

} // namespace svcExchange
