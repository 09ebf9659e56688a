#pragma once

// Address ranges used to describe the exchange area to the overlap guard.
// Pure header-only: numeric addresses only, nothing here dereferences memory.

#include <cstddef>
#include <limits>

#include "../core/types.hpp"

namespace svcExchange::memory {

// a + n without wrapping past the top of the address space
constexpr address_t saturating_add(address_t a, std::size_t n) noexcept {
    constexpr address_t top = std::numeric_limits<address_t>::max();
    return (static_cast<address_t>(n) > top - a) ? top : a + static_cast<address_t>(n);
}

// count * elem_size, saturated instead of wrapped
constexpr std::size_t array_bytes(std::size_t count, std::size_t elem_size) noexcept {
    return (elem_size != 0U && count > std::numeric_limits<std::size_t>::max() / elem_size)
        ? std::numeric_limits<std::size_t>::max()
        : count * elem_size;
}

// Address range. `end` is one past the last byte, and both ends are treated as
// part of the range when testing membership (see contains()).
struct region {
    address_t begin;
    address_t end;

    static constexpr region from(address_t base, std::size_t size) noexcept {
        return region{base, saturating_add(base, size)};
    }

    constexpr std::size_t size() const noexcept { return static_cast<std::size_t>(end - begin); }

    // Inclusive on both bounds: an address equal to `end` is considered inside.
    constexpr bool contains(address_t addr) const noexcept {
        return addr >= begin && addr <= end;
    }
};

template <typename T>
inline address_t address_of(const T* ptr) noexcept {
    return reinterpret_cast<address_t>(ptr); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

} // namespace svcExchange::memory
