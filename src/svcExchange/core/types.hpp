#pragma once

#include <cstddef>
#include <cstdint>

namespace svcExchange {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using usize = std::size_t;

// Raw address, only ever compared, never dereferenced
using address_t = std::uintptr_t;

// Time types (microseconds for precision)
using timestamp_t = u64;

/* Transfer direction, seen from the userspace job */
enum class direction : u8 {
    to_area = 0,    // job -> exchange area (before a syscall)
    from_area = 1   // exchange area -> job (after a syscall)
};

}  // namespace svcExchange
