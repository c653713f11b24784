#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace taglimit {
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
    LogLevel GetLevel() const;
    // Unknown names fall back to INFO. Matching is case-insensitive.
    LogLevel ParseLevel(const std::string& levelStr) const;

    // ANSI colors are only emitted when stdout is a terminal unless forced.
    void SetColor(bool enabled);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = false;
    mutable std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "tag " << tag << " running=" << n;
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
} // namespace taglimit

#define TAGLIMIT_LOG(lvl) \
    if (taglimit::common::LogLevel::lvl >= taglimit::common::Logger::Instance().GetLevel()) \
    taglimit::common::LogStream(taglimit::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG TAGLIMIT_LOG(DEBUG)
#define LOG_INFO TAGLIMIT_LOG(INFO)
#define LOG_WARN TAGLIMIT_LOG(WARN)
#define LOG_ERROR TAGLIMIT_LOG(ERROR)
#define LOG_FATAL TAGLIMIT_LOG(FATAL)
