#pragma once

#include <cstddef>

#include "types.hpp"

// Exchange area capacity in bytes. Shared with the kernel side of the boundary,
// both images must be built with the same value.
#ifndef SVCEXCHANGE_AREA_LEN
#define SVCEXCHANGE_AREA_LEN 128
#endif

// Linker section holding the exchange area. The kernel locates the area through
// this section, not through a handshake.
#ifndef SVCEXCHANGE_AREA_SECTION_NAME
#define SVCEXCHANGE_AREA_SECTION_NAME ".svcexchange"
#endif

#ifndef SVCEXCHANGE_AREA_ALIGN
#define SVCEXCHANGE_AREA_ALIGN alignof(std::max_align_t)
#endif

// Placement attribute for the area storage. Override to an empty definition on
// toolchains without ELF-style named sections.
#ifndef SVCEXCHANGE_AREA_ATTR
#  if (defined(__GNUC__) || defined(__clang__)) && !defined(__APPLE__)
#    define SVCEXCHANGE_AREA_ATTR __attribute__((section(SVCEXCHANGE_AREA_SECTION_NAME), used))
#  else
#    define SVCEXCHANGE_AREA_ATTR
#  endif
#endif

// Feature toggles (macros for preprocessor guards)
#ifndef SVCEXCHANGE_ENABLE_STATS
#define SVCEXCHANGE_ENABLE_STATS 1
#endif

namespace svcExchange::config {

        // Exchange area geometry
        constexpr size_t exchange_area_len = SVCEXCHANGE_AREA_LEN;
        constexpr size_t exchange_area_align = SVCEXCHANGE_AREA_ALIGN;

        // Feature toggles as constexpr for compile-time branching
        constexpr bool enable_stats = (SVCEXCHANGE_ENABLE_STATS != 0);

        // -------- Compile-time sanity checks for build flags --------
        static_assert(exchange_area_len >= 1, "SVCEXCHANGE_AREA_LEN must be >= 1");
        static_assert(exchange_area_align != 0 && (exchange_area_align & (exchange_area_align - 1U)) == 0,
                      "SVCEXCHANGE_AREA_ALIGN must be a power of two");
}  // namespace svcExchange::config
