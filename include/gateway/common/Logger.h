#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace gateway {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr);

    // Append to a file instead of stdout. Empty path restores stdout.
    bool SetLogFile(const std::string& path);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = false;
    std::ofstream file_;
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "worker pid=" << pid;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace gateway

#define LOG_DEBUG \
    if (gateway::common::LogLevel::DEBUG >= gateway::common::Logger::Instance().GetLevel()) \
    gateway::common::LogStream(gateway::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (gateway::common::LogLevel::INFO >= gateway::common::Logger::Instance().GetLevel()) \
    gateway::common::LogStream(gateway::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (gateway::common::LogLevel::WARN >= gateway::common::Logger::Instance().GetLevel()) \
    gateway::common::LogStream(gateway::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (gateway::common::LogLevel::ERROR >= gateway::common::Logger::Instance().GetLevel()) \
    gateway::common::LogStream(gateway::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (gateway::common::LogLevel::FATAL >= gateway::common::Logger::Instance().GetLevel()) \
    gateway::common::LogStream(gateway::common::LogLevel::FATAL, __FILE__, __LINE__)
