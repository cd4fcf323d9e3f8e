/**
 * EventLineBuffer Implementation
 */

#include "event_line_buffer.hpp"

EventLineBuffer::EventLineBuffer(size_t max_line)
    : m_max_line(max_line) {
    m_partial.reserve(max_line + 1);
}

size_t EventLineBuffer::feed(const char *data, size_t len, const LineHandler &handler) {
    size_t dropped = 0;

    for (size_t i = 0; i < len; i++) {
        char c = data[i];

        if (c == '\n') {
            if (m_discarding) {
                m_discarding = false;
                continue;
            }
            if (!m_partial.empty() && m_partial.back() == '\r') {
                m_partial.pop_back();
            }
            if (!m_partial.empty()) {
                handler(m_partial);
            }
            m_partial.clear();
            continue;
        }

        if (m_discarding) continue;

        m_partial.push_back(c);
        if (m_partial.size() > m_max_line) {
            dropped++;
            m_discarding = true;
            m_partial.clear();
        }
    }

    return dropped;
}

void EventLineBuffer::clear() {
    m_partial.clear();
    m_discarding = false;
}
