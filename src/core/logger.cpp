#include "core/logger.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

LogLevel logLevelFromString(const std::string& s) {
    if (s == "debug")                  return LogLevel::Debug;
    if (s == "info")                   return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error")                  return LogLevel::Error;
    if (s == "fatal")                  return LogLevel::Fatal;
    return LogLevel::Info;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default:              return "UNKNOWN";
    }
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() const {
    return level_;
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (out_.is_open())
        out_.close();

    logPath_ = path;
    out_.open(path, std::ios::app);

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    fileSize_ = ec ? 0 : static_cast<size_t>(size);
}

void Logger::setRotation(size_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mutex_);
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles < 1 ? 1 : maxFiles;
}

// Called with mutex_ held.
void Logger::rotateIfNeeded() {
    if (!out_.is_open() || fileSize_ < maxBytes_)
        return;

    out_.close();

    // path.(n-1) -> path.n, ..., path -> path.1; the oldest generation is overwritten
    std::error_code ec;
    for (int i = maxFiles_ - 1; i >= 1; --i) {
        fs::path from = logPath_ + "." + std::to_string(i);
        if (fs::exists(from, ec))
            fs::rename(from, logPath_ + "." + std::to_string(i + 1), ec);
    }
    fs::rename(logPath_, logPath_ + ".1", ec);
    if (ec) {
        std::cerr << "Logger: rotation of " << logPath_ << " failed: " << ec.message() << std::endl;
    }

    out_.open(logPath_, std::ios::trunc);
    fileSize_ = 0;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_)
        return;

    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif

    std::lock_guard<std::mutex> lock(mutex_);
    rotateIfNeeded();

    if (out_.is_open()) {
        writeLine(out_, level, message, tm);
        // timestamp and level tag
        fileSize_ += message.size() + 30;
    } else {
        writeLine(std::cout, level, message, tm);
    }
}

void Logger::writeLine(std::ostream& os, LogLevel level, const std::string& message, const std::tm& tm) {
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << " [" << levelToString(level) << "] "
       << message << std::endl;
}
