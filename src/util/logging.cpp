// STAKEVAULT - Logging Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

#include <unistd.h>

namespace stakevault {
namespace util {

namespace {

struct LevelInfo {
    LogLevel level;
    const char* name;
    const char* color;
};

const LevelInfo LEVELS[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[35;1m"},
    {LogLevel::Off,   "OFF",   "\033[0m"},
};

const LevelInfo* FindLevel(LogLevel level) {
    for (const auto& info : LEVELS) {
        if (info.level == level) {
            return &info;
        }
    }
    return nullptr;
}

/// "2024-01-15 10:30:00.123" in local time
std::string TimestampText(std::chrono::system_clock::time_point tp) {
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&secs, &local);

    char text[32];
    size_t len = std::strftime(text, sizeof(text), "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(text + len, sizeof(text) - len, ".%03ld", millis);
    return text;
}

} // namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    const LevelInfo* info = FindLevel(level);
    return info ? info->name : "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string name;
    name.reserve(str.size());
    for (unsigned char c : str) {
        name.push_back(static_cast<char>(std::toupper(c)));
    }

    if (name == "WARNING") return LogLevel::Warn;
    if (name == "NONE") return LogLevel::Off;
    for (const auto& info : LEVELS) {
        if (name == info.name) {
            return info.level;
        }
    }
    return LogLevel::Info;
}

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    std::string out = str.substr(0, width);
    out.resize(width, pad);
    return out;
}

std::string GetBasename(const std::string& path) {
    return path.substr(path.find_last_of("/\\") + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::string line;

    if (format.showTimestamp) {
        line += TimestampText(entry.timestamp) + " ";
    }
    if (format.showLevel) {
        line += "[" + FixedWidth(LogLevelToString(entry.level), 5) + "] ";
    }
    if (format.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        line += "[" + entry.category + "] ";
    }
    if (format.showLocation && !entry.file.empty()) {
        line += GetBasename(entry.file) + ":" + std::to_string(entry.line) + " ";
        if (!entry.function.empty()) {
            line += entry.function + "() ";
        }
    }

    return line + entry.message;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string text = FormatLogEntry(entry, config_.format);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Warn) ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && isatty(fileno(stream))) {
        std::fprintf(stream, "%s%s\033[0m\n", GetColorCode(entry.level), text.c_str());
    } else {
        std::fprintf(stream, "%s\n", text.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

const char* ConsoleSink::GetColorCode(LogLevel level) const {
    const LevelInfo* info = FindLevel(level);
    return info ? info->color : "\033[0m";
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpenLocked();
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.close();
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::OpenLocked() {
    if (config_.path.empty()) {
        return;
    }

    file_.open(config_.path, config_.append ? std::ios::app : std::ios::trunc);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string text = FormatLogEntry(entry, config_.format) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.maxSize > 0 && currentSize_ >= config_.maxSize && file_.is_open()) {
        Rotate();
    }
    if (!file_.is_open()) {
        return;
    }

    file_ << text;
    currentSize_ += text.size();
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

void FileSink::Rotate() {
    file_.close();

    // Shift path.1 .. path.(maxFiles-1) up by one; path.maxFiles is dropped
    auto numbered = [this](size_t n) { return config_.path + "." + std::to_string(n); };
    std::remove(numbered(config_.maxFiles).c_str());
    for (size_t n = config_.maxFiles; n > 1; --n) {
        std::rename(numbered(n - 1).c_str(), numbered(n).c_str());
    }
    std::rename(config_.path.c_str(), numbered(1).c_str());

    file_.open(config_.path, std::ios::trunc);
    currentSize_ = 0;
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_ && entry.level >= level_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Flush();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_ = false;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_ = true;
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategoriesEnabled_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* function,
                  const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char text[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(text, sizeof(text), format, args);
    va_end(args);

    Log(level, category, text, file, line, function);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line, const char* function)
    : level_(level), category_(category), file_(file), line_(line), function_(function) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_, function_);
}

} // namespace util
} // namespace stakevault
