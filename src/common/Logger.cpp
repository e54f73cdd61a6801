#include "gateway/common/Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace gateway {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : color_(::isatty(STDOUT_FILENO) == 1) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

bool Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    if (path.empty()) return true;
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) return false;
    color_ = false;
    return true;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = file_.is_open() ? static_cast<std::ostream&>(file_) : std::cout;

    // Format: [Time] [Level] [File:Line] Message
    if (color_) out << LevelToColor(level);
    out << "[" << FormatNow() << "] "
        << "[" << LevelToString(level) << "] "
        << "[" << file << ":" << line << "] "
        << msg;
    if (color_) out << "\033[0m";
    out << std::endl;
}

} // namespace common
} // namespace gateway
