#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../platform/platform.hpp"

namespace svcExchange::diagnostics {

/**
 * @brief Exchange area traffic counters
 *
 * Updated by the area handle after each transfer. Not synchronized, like the
 * area itself.
 */
struct transfer_stats {
    u32 writes{0};          // successful transfers into the area
    u32 reads{0};           // successful transfers out of the area
    u64 bytes_written{0};
    u64 bytes_read{0};
    u32 refused{0};         // transfers rejected by the overlap guard
    u32 clipped{0};         // transfers truncated to the area length

    timestamp_t last_transfer_time{0};

    void record_transfer(direction dir, usize requested, usize moved) noexcept {
        if (dir == direction::to_area) {
            writes++;
            bytes_written += moved;
        } else {
            reads++;
            bytes_read += moved;
        }
        if (moved < requested) {
            clipped++;
        }
        last_transfer_time = platform::get_system_time_us();
    }

    void record_refusal() noexcept {
        refused++;
    }

    void reset() noexcept {
        *this = transfer_stats{};
    }
};

/**
 * @brief Global transfer statistics instance
 */
inline transfer_stats& get_global_transfer_stats() noexcept {
    static transfer_stats stats;
    return stats;
}

inline void record_transfer(direction dir, usize requested, usize moved) noexcept {
    if constexpr (config::enable_stats) {
        get_global_transfer_stats().record_transfer(dir, requested, moved);
    } else {
        (void)dir; (void)requested; (void)moved;
    }
}

inline void record_refusal() noexcept {
    if constexpr (config::enable_stats) {
        get_global_transfer_stats().record_refusal();
    }
}

} // namespace svcExchange::diagnostics
