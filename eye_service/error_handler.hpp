#ifndef ERROR_HANDLER_HPP
#define ERROR_HANDLER_HPP

#include "eye_types.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>

/**
 * ErrorHandler - Counts and reports engine errors for the service
 *
 * Features:
 * - Per-kind counters
 * - Rate-limited logging (suppressed reports are summarised on the next line)
 * - Optional listener, e.g. to answer a rejected command on stdout
 *
 * None of the engine errors is fatal; the service keeps rendering.
 */
class ErrorHandler {
public:
    using Listener = std::function<void(EyeError kind, const std::string &message)>;
    using Clock = std::function<uint64_t()>;

    ErrorHandler();

    /**
     * Use a custom millisecond clock (tests).
     */
    explicit ErrorHandler(Clock clock);

    void report(EyeError kind, const std::string &message);

    /**
     * Convenience for command outcomes; successes are ignored.
     */
    void report(const CommandResult &result, const std::string &context);

    uint32_t getCount(EyeError kind) const;
    uint32_t totalCount() const;
    uint32_t suppressedCount() const { return m_suppressed_count; }
    void clearCounts();

    void setListener(Listener listener);

private:
    Clock m_clock;
    std::array<uint32_t, 4> m_counts{{0, 0, 0, 0}};

    uint64_t m_last_log_time_ms = 0;
    bool m_logged_once = false;
    uint32_t m_suppressed_count = 0;

    Listener m_listener;
};

#endif // ERROR_HANDLER_HPP
