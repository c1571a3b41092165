// POWERBOND - Logging System
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE through FATAL)
// - Log categories for filtering
// - Console, file and callback sinks
// - Printf-style and stream-style interfaces

#ifndef POWERBOND_UTIL_LOGGING_H
#define POWERBOND_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace powerbond {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown names map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* EXCHANGE = "exchange";
    constexpr const char* AUTH = "auth";
    constexpr const char* CURVE = "curve";
    constexpr const char* CAP = "cap";
    constexpr const char* DB = "db";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rotating it to path.1 .. path.N past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    size_t GetCurrentSize() const { return currentSize_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
    size_t currentSize_{0};

    void OpenFile(std::ios::openmode mode);
    void Rotate();
};

/// Hands each entry to a callback (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    bool allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define POWERBOND_LOGGER ::powerbond::util::Logger::Instance()

#define POWERBOND_LOG_ENABLED(level, category) \
    POWERBOND_LOGGER.WillLog(::powerbond::util::LogLevel::level, category)

#define POWERBOND_LOG(level, category) \
    if (POWERBOND_LOG_ENABLED(level, category)) \
        ::powerbond::util::LogStream(::powerbond::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   POWERBOND_LOG(Trace, category)
#define LOG_DEBUG(category)   POWERBOND_LOG(Debug, category)
#define LOG_INFO(category)    POWERBOND_LOG(Info, category)
#define LOG_WARN(category)    POWERBOND_LOG(Warn, category)
#define LOG_ERROR(category)   POWERBOND_LOG(Error, category)
#define LOG_FATAL(category)   POWERBOND_LOG(Fatal, category)

#define POWERBOND_LOGF(level, category, ...) \
    do { \
        if (POWERBOND_LOG_ENABLED(level, category)) { \
            POWERBOND_LOGGER.LogF(::powerbond::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  POWERBOND_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   POWERBOND_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   POWERBOND_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  POWERBOND_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

} // namespace util
} // namespace powerbond

#endif // POWERBOND_UTIL_LOGGING_H
