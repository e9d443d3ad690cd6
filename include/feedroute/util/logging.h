// FEEDROUTE - Logging System
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Provides the logging used across the registry:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Pluggable sinks (console, callback)
// - Printf-style and stream-style interfaces

#ifndef FEEDROUTE_UTIL_LOGGING_H
#define FEEDROUTE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace feedroute {
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

/// Parse log level, rejecting unknown strings
bool TryParseLogLevel(const std::string& str, LogLevel& level);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* ALIAS = "alias";
    constexpr const char* RESOLVER = "resolver";
    constexpr const char* FEES = "fees";
    constexpr const char* PROOF = "proof";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
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

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stdout/stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{true};           // Warnings and above go to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showLocation{false};       // file:line
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    void SetConfig(const Config& config) { config_ = config; }
    const Config& GetConfig() const { return config_; }

    /// Render an entry the way Write() prints it (without colors)
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

    void SetCallback(Callback callback) { callback_ = std::move(callback); }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    void DisableAllCategories();

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
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper; the message is emitted on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;
    LogStream& operator=(LogStream&& other) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define FEEDROUTE_LOGGER ::feedroute::util::Logger::Instance()

#define FEEDROUTE_LOG_ENABLED(level, category) \
    FEEDROUTE_LOGGER.WillLog(::feedroute::util::LogLevel::level, category)

#define FEEDROUTE_LOG(level, category) \
    if (FEEDROUTE_LOG_ENABLED(level, category)) \
        ::feedroute::util::LogStream(::feedroute::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   FEEDROUTE_LOG(Trace, category)
#define LOG_DEBUG(category)   FEEDROUTE_LOG(Debug, category)
#define LOG_INFO(category)    FEEDROUTE_LOG(Info, category)
#define LOG_WARN(category)    FEEDROUTE_LOG(Warn, category)
#define LOG_ERROR(category)   FEEDROUTE_LOG(Error, category)
#define LOG_FATAL(category)   FEEDROUTE_LOG(Fatal, category)

#define FEEDROUTE_LOGF(level, category, ...) \
    do { \
        if (FEEDROUTE_LOG_ENABLED(level, category)) { \
            FEEDROUTE_LOGGER.LogF(::feedroute::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  FEEDROUTE_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   FEEDROUTE_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   FEEDROUTE_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  FEEDROUTE_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace feedroute

#endif // FEEDROUTE_UTIL_LOGGING_H
