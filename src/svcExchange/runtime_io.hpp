#pragma once

// Transfers in and out of the exchange area storage.
//
// Only typed entry points exist: byte buffers always pass the overlap guard,
// shm_info records never do. Every transfer is clipped to area_size().

#include "core/types.hpp"
#include "error/result.hpp"
#include "exchange/overlap_guard.hpp"
#include "runtime.hpp"
#include "uapi/types.hpp"

namespace svcExchange::runtime {

// Bytes moved, or the reason the guard refused the caller buffer
using byte_transfer = result<usize, exchange::overlap_error>;

byte_transfer write_bytes(const u8* src, usize length) noexcept;
byte_transfer read_bytes(u8* dst, usize length) noexcept;

// Record transfers of `count` contiguous records. Return the bytes moved.
usize write_records(const uapi::shm_info* src, usize count) noexcept;
usize read_records(uapi::shm_info* dst, usize count) noexcept;

} // namespace svcExchange::runtime
