#pragma once

// svcExchange exchange area storage.
// Storage defined in runtime.cpp, placed in its own linker section so that the
// kernel can find it by convention. Transfers in and out of it are declared in
// runtime_io.hpp.
// No dynamic allocation, no RTTI.

#include <cstddef>

#include "core/config.hpp"
#include "memory/layout.hpp"

namespace svcExchange::runtime {

constexpr std::size_t area_size() noexcept { return config::exchange_area_len; }

// Address range of the exchange area. Numeric addresses only: the area itself
// is never handed out as a reference.
memory::region area_bounds() noexcept;

} // namespace svcExchange::runtime
