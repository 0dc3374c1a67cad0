#include "streamgate/common/Logger.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

namespace streamgate {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);
    std::ostringstream ss;
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

const char* BaseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

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

bool Logger::SetLogFile(const std::string& path, long maxBytes, int backups) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        filePath_.clear();
        return false;
    }
    filePath_ = path;
    maxBytes_ = maxBytes;
    backups_ = backups < 0 ? 0 : backups;
    file_.seekp(0, std::ios::end);
    written_ = static_cast<long>(file_.tellp());
    return true;
}

void Logger::CloseLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    filePath_.clear();
}

void Logger::RotateLocked() {
    file_.close();
    if (backups_ > 0) {
        std::remove((filePath_ + "." + std::to_string(backups_)).c_str());
        for (int i = backups_ - 1; i >= 1; --i) {
            std::string from = filePath_ + "." + std::to_string(i);
            std::string to = filePath_ + "." + std::to_string(i + 1);
            std::rename(from.c_str(), to.c_str());
        }
        std::rename(filePath_.c_str(), (filePath_ + ".1").c_str());
        file_.open(filePath_, std::ios::app);
    } else {
        file_.open(filePath_, std::ios::trunc);
    }
    written_ = 0;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::ostringstream rec;
    rec << "[" << FormatNow() << "] "
        << "[" << LevelToString(level) << "] "
        << "[" << std::this_thread::get_id() << "] "
        << "[" << BaseName(file) << ":" << line << "] "
        << msg;
    const std::string text = rec.str();

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << LevelToColor(level) << text << "\033[0m" << std::endl;

    if (file_.is_open()) {
        file_ << text << '\n';
        file_.flush();
        written_ += static_cast<long>(text.size() + 1);
        if (maxBytes_ > 0 && written_ >= maxBytes_) {
            RotateLocked();
        }
    }
}

} // namespace common
} // namespace streamgate
