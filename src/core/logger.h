#pragma once
#include <atomic>
#include <cstddef>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error, Fatal };

// Unknown names map to Info.
LogLevel logLevelFromString(const std::string& s);

/**
 * Process-wide logger shared by every forwarding worker.
 *
 * Lines go to stdout until setFile() is called. A file that grows past the
 * rotation size is renamed to <path>.1 (older generations shift up) and a
 * new file is started.
 */
class Logger {
public:
    static constexpr size_t DEFAULT_MAX_BYTES = 100 * 1024 * 1024;
    static constexpr int DEFAULT_MAX_FILES = 6;

    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    void setFile(const std::string& path);
    void setRotation(size_t maxBytes, int maxFiles);

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* levelToString(LogLevel level);

    void rotateIfNeeded();
    void writeLine(std::ostream& os, LogLevel level, const std::string& message, const std::tm& tm);

    std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};

    std::ofstream out_;
    std::string logPath_;
    size_t fileSize_ = 0;
    size_t maxBytes_ = DEFAULT_MAX_BYTES;
    int maxFiles_ = DEFAULT_MAX_FILES;
};
