#pragma once

#include "../core/types.hpp"
#include "../platform/platform.hpp"
#include "result.hpp"

namespace svcExchange {
namespace error {

/**
 * @brief Error event types for callbacks
 */
enum class error_event : u8 {
    overlap_rejected    // byte copy refused by the overlap guard
};

/**
 * @brief Error severity levels
 */
enum class error_severity : u8 {
    info,       // Informational, no action needed
    warning,    // Warning, may need attention
    error,      // Error, requires handling
    critical,   // Critical, system may be unstable
    fatal       // Fatal, job must be restarted
};

/**
 * @brief Error context information
 *
 * For error_event::overlap_rejected, data[] holds
 * { overlap_error, direction, requested length, 0 }.
 */
struct error_context {
    error_event event{error_event::overlap_rejected};
    error_severity severity{error_severity::error};
    error_code code{error_code::success};
    timestamp_t timestamp{0};
    u32 data[4]{0, 0, 0, 0};  // Event-specific data

    error_context() noexcept = default;
};

/**
 * @brief Error handler callback type
 */
using error_handler_fn = void(*)(const error_context& ctx) noexcept;

/**
 * @brief Global error handler configuration
 */
class error_handler {
private:
    error_handler_fn callback_{nullptr};
    bool enabled_{false};
    u32 error_count_{0};
    error_context last_error_;

public:
    error_handler() noexcept = default;

    /**
     * @brief Set error handler callback
     */
    void set_callback(error_handler_fn callback) noexcept {
        callback_ = callback;
        enabled_ = (callback != nullptr);
    }

    /**
     * @brief Report an error
     */
    void report_error(const error_context& ctx) noexcept {
        error_count_++;
        last_error_ = ctx;

        if (enabled_ && callback_ != nullptr) {
            callback_(ctx);
        }

        if (ctx.severity >= error_severity::error) {
            platform::logf("svcExchange error: event=%u data=%u,%u,%u",
                          static_cast<u32>(ctx.event),
                          ctx.data[0],
                          ctx.data[1],
                          ctx.data[2]);
        }
    }

    /**
     * @brief Create error context helper
     */
    static error_context make_context(
        error_event event,
        error_severity severity,
        error_code code = error_code::success
    ) noexcept {
        error_context ctx;
        ctx.event = event;
        ctx.severity = severity;
        ctx.code = code;
        ctx.timestamp = platform::get_system_time_us();
        return ctx;
    }

    u32 get_error_count() const noexcept {
        return error_count_;
    }

    const error_context& get_last_error() const noexcept {
        return last_error_;
    }

    /**
     * @brief Reset error statistics
     */
    void reset() noexcept {
        error_count_ = 0;
        last_error_ = error_context();
    }
};

/**
 * @brief Global error handler instance
 */
inline error_handler& get_global_error_handler() noexcept {
    static error_handler handler;
    return handler;
}

/**
 * @brief Convenience function to report errors
 */
inline void report_error(const error_context& ctx) noexcept {
    get_global_error_handler().report_error(ctx);
}

} // namespace error
} // namespace svcExchange
