/**
 * RoboEyes - Logger
 *
 * Process-wide leveled logging. Each line carries a millisecond
 * timestamp, the level and a subsystem tag. WARN and ERROR go to
 * stderr, lower levels to stdout; every line is also appended to the
 * log file when one is open.
 */

#ifndef ROBOEYES_LOGGER_H
#define ROBOEYES_LOGGER_H

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Subsystem tags
#define LOG_TAG_ANIM     "Anim"
#define LOG_TAG_CONFIG   "Config"
#define LOG_TAG_CMD      "Cmd"
#define LOG_TAG_RENDER   "Render"
#define LOG_TAG_SEQ      "Seq"
#define LOG_TAG_SERVICE  "Eye"

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) { m_level.store(level); }

    /**
     * Set level by name (debug, info, warn, error, off; any case).
     * Returns false and keeps the current level for unknown names.
     */
    bool setLevel(const std::string& name);

    LogLevel level() const { return m_level.load(); }
    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF && level >= m_level.load();
    }

    bool openFile(const std::string& path);
    void closeFile();

    void log(LogLevel level, const char* tag, const char* fmt, ...)
        __attribute__((format(printf, 4, 5)));

    static bool parseLevel(const std::string& name, LogLevel& out);
    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* tag, const char* msg);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ofstream m_file;
    std::mutex m_mutex;
};

// Arguments are only formatted when the level is enabled
#define LOG_AT(level, tag, fmt, ...)                                  \
    do {                                                              \
        if (Logger::instance().isEnabled(level))                      \
            Logger::instance().log(level, tag, fmt, ##__VA_ARGS__);   \
    } while (0)

#define LOG_DEBUG(tag, fmt, ...) LOG_AT(LogLevel::DEBUG, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  LOG_AT(LogLevel::INFO,  tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  LOG_AT(LogLevel::WARN,  tag, fmt, ##__VA_ARGS__)
#define LOG_ERROR(tag, fmt, ...) LOG_AT(LogLevel::ERROR, tag, fmt, ##__VA_ARGS__)

#endif // ROBOEYES_LOGGER_H
