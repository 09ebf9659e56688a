#pragma once

#include <type_traits>

#include "../core/types.hpp"

namespace svcExchange::uapi {

/* Outcome of an exchange area transfer */
enum class status : u8 {
    ok = 0,        // transfer performed (possibly clipped to the area length)
    invalid = 1    // transfer refused, area untouched
};

constexpr const char* to_string(status s) noexcept {
    return (s == status::ok) ? "ok" : "invalid";
}

/**
 * @brief Shared memory descriptor returned by the kernel shm_get_infos call
 *
 * Layout is fixed by the kernel uapi; only copied as raw bytes here.
 */
struct shm_info {
    u32 handle;
    u32 label;
    usize base;
    usize len;
    u32 perms;

    constexpr bool operator==(const shm_info& other) const noexcept {
        return handle == other.handle && label == other.label && base == other.base &&
               len == other.len && perms == other.perms;
    }
    constexpr bool operator!=(const shm_info& other) const noexcept { return !(*this == other); }
};

static_assert(std::is_trivially_copyable<shm_info>::value, "shm_info crosses the boundary as raw bytes");
static_assert(std::is_standard_layout<shm_info>::value, "shm_info layout is shared with the kernel");

} // namespace svcExchange::uapi
