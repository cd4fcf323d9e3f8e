#ifndef EVENT_LINE_BUFFER_HPP
#define EVENT_LINE_BUFFER_HPP

#include <cstddef>
#include <functional>
#include <string>

/**
 * EventLineBuffer - Splits a byte stream into newline-delimited events
 *
 * Bytes may arrive in arbitrary chunks. A trailing '\r' is stripped and
 * blank lines are skipped. A line longer than the limit is discarded up
 * to its newline and counted instead of delivered.
 */
class EventLineBuffer {
public:
    using LineHandler = std::function<void(const std::string &line)>;

    explicit EventLineBuffer(size_t max_line);

    /**
     * Append bytes; every completed line goes to the handler.
     * Returns the number of over-long lines dropped by this call.
     */
    size_t feed(const char *data, size_t len, const LineHandler &handler);

    size_t pending() const { return m_partial.size(); }
    void clear();

private:
    size_t m_max_line;
    std::string m_partial;
    bool m_discarding = false;
};

#endif // EVENT_LINE_BUFFER_HPP
