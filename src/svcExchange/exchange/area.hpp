#pragma once

// Kernel/user exchange area access.
//
// The exchange area is the shared memory zone through which the kernel and a
// userspace job exchange non-scalar syscall data. When a syscall needs
// non-scalar input, the job copies it into the area before the call; when a
// syscall returns non-scalar data, the job copies it out of the area after the
// call returns.
//
// The set of types that transit through the area is known at build time, so
// the copy contract is specialized per type (transfer<T>) and area handles only
// accept those types.

#include <etl/algorithm.h>
#include <etl/type_traits.h>

#include "../core/assert.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../diagnostics/transfer_stats.hpp"
#include "../error/error_handler.hpp"
#include "../memory/layout.hpp"
#include "../runtime_io.hpp"
#include "../uapi/types.hpp"
#include "overlap_guard.hpp"

namespace svcExchange::exchange {

/**
 * @brief Per-type copy contract
 *
 * Only specialized for the types the syscall boundary exchanges. Each
 * specialization provides copy_to, copy_from, copy_vec_to and copy_vec_from.
 */
template <typename T>
struct transfer;

template <typename T>
struct is_exchangeable : etl::false_type {};

template <>
struct is_exchangeable<uapi::shm_info> : etl::true_type {};

template <>
struct is_exchangeable<u8> : etl::true_type {};

namespace detail {

inline void report_refusal(overlap_error why, direction dir, usize length) noexcept {
    error::error_context ctx = error::error_handler::make_context(
        error::error_event::overlap_rejected,
        error::error_severity::error,
        error_code::overlap);
    ctx.data[0] = static_cast<u32>(why);
    ctx.data[1] = static_cast<u32>(dir);
    ctx.data[2] = static_cast<u32>(etl::min<usize>(length, 0xFFFFFFFFU));
    error::report_error(ctx);
    diagnostics::record_refusal();
}

inline uapi::status settle(const runtime::byte_transfer& moved, direction dir, usize length) noexcept {
    if (moved.is_error()) {
        report_refusal(moved.error(), dir, length);
        return uapi::status::invalid;
    }
    diagnostics::record_transfer(dir, length, moved.value());
    return uapi::status::ok;
}

} // namespace detail

/**
 * @brief shm_info record transfers
 *
 * In the real protocol this record is only ever written into the area by the
 * kernel (shm_get_infos) and read back by the job. copy_to() exists for test
 * and diagnostic purposes. None of these operations go through the overlap
 * guard: the record path is exempt and must stay so.
 */
template <>
struct transfer<uapi::shm_info> {
    static uapi::status copy_to(const uapi::shm_info* from) noexcept {
        return copy_vec_to(from, 1U);
    }

    static uapi::status copy_from(uapi::shm_info* to) noexcept {
        return copy_vec_from(to, 1U);
    }

    static uapi::status copy_vec_to(const uapi::shm_info* from, usize count) noexcept {
        SVCEXCHANGE_ASSERT(from != nullptr || count == 0U);
        const usize moved = runtime::write_records(from, count);
        diagnostics::record_transfer(direction::to_area,
                                     memory::array_bytes(count, sizeof(uapi::shm_info)), moved);
        return uapi::status::ok;
    }

    static uapi::status copy_vec_from(uapi::shm_info* to, usize count) noexcept {
        SVCEXCHANGE_ASSERT(to != nullptr || count == 0U);
        const usize moved = runtime::read_records(to, count);
        diagnostics::record_transfer(direction::from_area,
                                     memory::array_bytes(count, sizeof(uapi::shm_info)), moved);
        return uapi::status::ok;
    }
};

/**
 * @brief Raw byte transfers
 *
 * Used to marshal strings and other opaque payloads. Every byte transfer is
 * checked against the overlap guard and refused, without touching memory,
 * when the caller buffer aliases the area.
 */
template <>
struct transfer<u8> {
    static uapi::status copy_vec_to(const u8* from, usize length) noexcept {
        SVCEXCHANGE_ASSERT(from != nullptr || length == 0U);
        return detail::settle(runtime::write_bytes(from, length), direction::to_area, length);
    }

    static uapi::status copy_vec_from(u8* to, usize length) noexcept {
        SVCEXCHANGE_ASSERT(to != nullptr || length == 0U);
        return detail::settle(runtime::read_bytes(to, length), direction::from_area, length);
    }

    // Single bytes take the same guarded path
    static uapi::status copy_to(const u8* from) noexcept { return copy_vec_to(from, 1U); }

    static uapi::status copy_from(u8* to) noexcept { return copy_vec_from(to, 1U); }
};

/**
 * @brief Opaque exchange area handle
 *
 * Stateless: every handle refers to the single exchange area of the job.
 * Constructing one does not touch the area, which is zero-filled once at load
 * time. Handles only borrow the area for the duration of a call.
 */
class area {
public:
    constexpr area() noexcept = default;

    /**
     * @brief Area length in bytes
     *
     * Lets callers check that their data fits before a transfer; anything
     * longer is clipped.
     */
    static constexpr usize area_length() noexcept { return config::exchange_area_len; }

    /**
     * @brief Copy a single T object into the area
     */
    template <typename T>
    uapi::status copy_to(const T* from) const noexcept {
        static_assert(is_exchangeable<T>::value, "type has no exchange area transfer contract");
        return transfer<T>::copy_to(from);
    }

    /**
     * @brief Copy a single T object out of the area
     */
    template <typename T>
    uapi::status copy_from(T* to) const noexcept {
        static_assert(is_exchangeable<T>::value, "type has no exchange area transfer contract");
        return transfer<T>::copy_from(to);
    }

    /**
     * @brief Copy `count` contiguous T objects into the area
     *
     * Typically used to hand a string to the kernel log syscall.
     */
    template <typename T>
    uapi::status copy_vec_to(const T* from, usize count) const noexcept {
        static_assert(is_exchangeable<T>::value, "type has no exchange area transfer contract");
        return transfer<T>::copy_vec_to(from, count);
    }

    template <typename T>
    uapi::status copy_vec_from(T* to, usize count) const noexcept {
        static_assert(is_exchangeable<T>::value, "type has no exchange area transfer contract");
        return transfer<T>::copy_vec_from(to, count);
    }
};

} // namespace svcExchange::exchange
