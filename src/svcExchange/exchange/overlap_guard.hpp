#pragma once

// Overlap guard for untyped byte transfers.
//
// The exchange area is filled and drained with a non-overlapping memory copy,
// which has no defined behaviour when the caller buffer aliases the area. Every
// byte-granularity transfer goes through check_overlap() first. This is the only
// place in the library that reasons about raw addresses.

#include "../core/types.hpp"
#include "../error/result.hpp"
#include "../memory/layout.hpp"
#include "../runtime.hpp"

namespace svcExchange::exchange {

/**
 * @brief Aliasing configuration that caused a rejection
 */
enum class overlap_error : u8 {
    starts_inside = 1,  // buffer starts in [area_start, area_end]
    ends_inside = 2,    // buffer end lands in [area_start, area_end]
    contains_area = 3   // buffer covers the whole area
};

using overlap_result = result<void, overlap_error>;

/**
 * @brief Check a caller buffer against explicit area bounds
 *
 * Both area bounds are inclusive, so a buffer that merely touches the area
 * (ending at area.begin or starting at area.end) is rejected as well.
 * Stateless; evaluated from scratch on every call.
 *
 * @param pointer start of the caller buffer
 * @param length  byte length of the caller buffer, may be 0
 * @param area    exchange area bounds
 */
inline overlap_result check_overlap(address_t pointer, usize length, const memory::region& area) noexcept {
    if (area.contains(pointer)) {
        return overlap_result(overlap_error::starts_inside);
    }

    // Unlikely while the area sits at the very beginning of the job RAM
    const address_t buffer_end = memory::saturating_add(pointer, length);
    if (area.contains(buffer_end)) {
        return overlap_result(overlap_error::ends_inside);
    }

    if (pointer <= area.begin && buffer_end >= area.end) {
        return overlap_result(overlap_error::contains_area);
    }
    return ok<overlap_error>();
}

/**
 * @brief Check a caller buffer against the job exchange area
 */
inline overlap_result check_overlap(const void* pointer, usize length) noexcept {
    return check_overlap(memory::address_of(pointer), length, runtime::area_bounds());
}

} // namespace svcExchange::exchange
