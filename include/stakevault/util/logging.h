// STAKEVAULT - Logging System
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Leveled, category-filtered logging. Messages are built with LOG_* streams
// (or LogWarnF for printf-style text) and fanned out to registered sinks.

#ifndef STAKEVAULT_UTIL_LOGGING_H
#define STAKEVAULT_UTIL_LOGGING_H

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

namespace stakevault {
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

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* STAKING = "staking";
    constexpr const char* REWARD = "reward";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* CUSTODY = "custody";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
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
    std::string function;
    std::chrono::system_clock::time_point timestamp;
};

/// Which fields a sink renders in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout, errors optionally to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    const char* GetColorCode(LogLevel level) const;

    Config config_;
    std::mutex mutex_;
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a file, rotating it once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogFormat format{true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    void OpenLocked();
    void Rotate();

    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};
};

// ============================================================================
// Callback Sink
// ============================================================================

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

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

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to explicitly enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

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
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
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
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STAKEVAULT_LOGGER ::stakevault::util::Logger::Instance()

#define STAKEVAULT_LOG_ENABLED(level, category) \
    STAKEVAULT_LOGGER.WillLog(::stakevault::util::LogLevel::level, category)

#define STAKEVAULT_LOG(level, category) \
    if (STAKEVAULT_LOG_ENABLED(level, category)) \
        ::stakevault::util::LogStream(::stakevault::util::LogLevel::level, category, \
                                      __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   STAKEVAULT_LOG(Trace, category)
#define LOG_DEBUG(category)   STAKEVAULT_LOG(Debug, category)
#define LOG_INFO(category)    STAKEVAULT_LOG(Info, category)
#define LOG_WARN(category)    STAKEVAULT_LOG(Warn, category)
#define LOG_ERROR(category)   STAKEVAULT_LOG(Error, category)

#define STAKEVAULT_LOGF(level, category, ...) \
    do { \
        if (STAKEVAULT_LOG_ENABLED(level, category)) { \
            STAKEVAULT_LOGGER.LogF(::stakevault::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogWarnF(category, ...)   STAKEVAULT_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace stakevault

#endif // STAKEVAULT_UTIL_LOGGING_H
