#include "runtime.hpp"
#include "runtime_io.hpp"

#include <cstring>

#include <etl/algorithm.h>

namespace svcExchange::runtime {

namespace {

// The one exchange area of the job. Zero-filled by the loader (.svcexchange is
// a data section), shared with the kernel, never reallocated.
alignas(config::exchange_area_align)
unsigned char g_exchange_area[config::exchange_area_len] SVCEXCHANGE_AREA_ATTR = {}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

// Raw copies, clipped to the area length. Callers have ruled out aliasing.
usize fill_area(const void* src, usize bytes) noexcept {
    const usize count = etl::min(bytes, area_size());
    if (count != 0U) {
        std::memcpy(&g_exchange_area[0], src, count);
    }
    return count;
}

usize drain_area(void* dst, usize bytes) noexcept {
    const usize count = etl::min(bytes, area_size());
    if (count != 0U) {
        std::memcpy(dst, &g_exchange_area[0], count);
    }
    return count;
}

} // namespace

memory::region area_bounds() noexcept {
    return memory::region::from(memory::address_of(&g_exchange_area[0]), area_size());
}

byte_transfer write_bytes(const u8* src, usize length) noexcept {
    const exchange::overlap_result check = exchange::check_overlap(src, length);
    if (check.is_error()) {
        return byte_transfer(check.error());
    }
    return ok<exchange::overlap_error>(fill_area(src, length));
}

byte_transfer read_bytes(u8* dst, usize length) noexcept {
    const exchange::overlap_result check = exchange::check_overlap(dst, length);
    if (check.is_error()) {
        return byte_transfer(check.error());
    }
    return ok<exchange::overlap_error>(drain_area(dst, length));
}

// Records are exempt from the overlap guard, see transfer<uapi::shm_info>
usize write_records(const uapi::shm_info* src, usize count) noexcept {
    return fill_area(src, memory::array_bytes(count, sizeof(uapi::shm_info)));
}

usize read_records(uapi::shm_info* dst, usize count) noexcept {
    return drain_area(dst, memory::array_bytes(count, sizeof(uapi::shm_info)));
}

} // namespace svcExchange::runtime
