/**
 * ErrorHandler Implementation
 */

#include "error_handler.hpp"
#include "logger.h"

#include <chrono>

#define LOG_RATE_LIMIT_MS 100  // Minimum time between logs

static uint64_t now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

ErrorHandler::ErrorHandler()
    : ErrorHandler(now_ms) {
}

ErrorHandler::ErrorHandler(Clock clock)
    : m_clock(clock ? std::move(clock) : Clock(now_ms)) {
}

void ErrorHandler::report(EyeError kind, const std::string &message) {
    if (kind == EyeError::NONE) return;

    size_t slot = static_cast<size_t>(kind);
    if (slot < m_counts.size()) {
        m_counts[slot]++;
    }

    if (m_listener) {
        m_listener(kind, message);
    }

    // Rate limiting
    uint64_t now = m_clock();
    if (m_logged_once && now - m_last_log_time_ms < LOG_RATE_LIMIT_MS) {
        m_suppressed_count++;
        return;
    }
    m_last_log_time_ms = now;
    m_logged_once = true;

    if (m_suppressed_count > 0) {
        LOG_WARN(LOG_TAG_SERVICE, "%s: %s (+%u suppressed)",
                 toString(kind), message.c_str(), m_suppressed_count);
        m_suppressed_count = 0;
    } else {
        LOG_WARN(LOG_TAG_SERVICE, "%s: %s", toString(kind), message.c_str());
    }
}

void ErrorHandler::report(const CommandResult &result, const std::string &context) {
    if (result.ok) return;
    report(result.error, context + ": " + result.message);
}

uint32_t ErrorHandler::getCount(EyeError kind) const {
    size_t slot = static_cast<size_t>(kind);
    return slot < m_counts.size() ? m_counts[slot] : 0;
}

uint32_t ErrorHandler::totalCount() const {
    uint32_t total = 0;
    for (uint32_t c : m_counts) total += c;
    return total;
}

void ErrorHandler::clearCounts() {
    m_counts.fill(0);
    m_suppressed_count = 0;
}

void ErrorHandler::setListener(Listener listener) {
    m_listener = std::move(listener);
}
