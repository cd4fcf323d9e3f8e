/**
 * Logger Implementation
 */

#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace {

// "YYYY-MM-DD HH:MM:SS.mmm", local time
void formatTimestamp(char* buf, size_t size) {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    struct tm tm_info;
    localtime_r(&ts.tv_sec, &tm_info);
    int n = static_cast<int>(strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_info));
    snprintf(buf + n, size - n, ".%03ld", ts.tv_nsec / 1000000L);
}

}  // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    closeFile();
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "debug") out = LogLevel::DEBUG;
    else if (n == "info") out = LogLevel::INFO;
    else if (n == "warn" || n == "warning") out = LogLevel::WARN;
    else if (n == "error") out = LogLevel::ERROR;
    else if (n == "off" || n == "none") out = LogLevel::OFF;
    else return false;
    return true;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   break;
    }
    return "?????";
}

bool Logger::setLevel(const std::string& name) {
    LogLevel parsed;
    if (!parseLevel(name, parsed)) return false;
    setLevel(parsed);
    return true;
}

bool Logger::openFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
    m_file.open(path, std::ios::app);
    if (!m_file.is_open()) {
        std::cerr << "[Logger] Cannot open log file " << path << std::endl;
        return false;
    }
    return true;
}

void Logger::closeFile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
}

void Logger::log(LogLevel level, const char* tag, const char* fmt, ...) {
    if (!isEnabled(level)) return;

    char msg[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    write(level, tag, msg);
}

void Logger::write(LogLevel level, const char* tag, const char* msg) {
    char line[1200];
    char timestamp[32];
    formatTimestamp(timestamp, sizeof(timestamp));
    snprintf(line, sizeof(line), "%s [%s] [%s] %s", timestamp, levelName(level), tag, msg);

    std::lock_guard<std::mutex> lock(m_mutex);

    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << line << '\n';
    out.flush();

    if (m_file.is_open()) {
        m_file << line << '\n';
        m_file.flush();
    }
}
