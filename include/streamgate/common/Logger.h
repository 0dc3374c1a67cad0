#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <mutex>
#include <sstream>

namespace streamgate {
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

    // Mirror records into a size-rotated file (path, path.1 .. path.N).
    // maxBytes <= 0 disables rotation. Returns false if the file cannot be opened.
    bool SetLogFile(const std::string& path, long maxBytes, int backups);
    void CloseLogFile();

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void RotateLocked();

    LogLevel level_ = LogLevel::INFO;
    std::mutex mutex_;

    std::ofstream file_;
    std::string filePath_;
    long maxBytes_{0};
    int backups_{0};
    long written_{0};
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
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
} // namespace streamgate

#define STREAMGATE_LOG_IF(lvl) \
    if (streamgate::common::LogLevel::lvl >= streamgate::common::Logger::Instance().GetLevel()) \
    streamgate::common::LogStream(streamgate::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG STREAMGATE_LOG_IF(DEBUG)
#define LOG_INFO  STREAMGATE_LOG_IF(INFO)
#define LOG_WARN  STREAMGATE_LOG_IF(WARN)
#define LOG_ERROR STREAMGATE_LOG_IF(ERROR)
#define LOG_FATAL STREAMGATE_LOG_IF(FATAL)
