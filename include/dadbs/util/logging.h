// DADBS - Logging System
// Copyright (c) 2024 DADBS Developers
// MIT License
//
// Process-wide logger with pluggable sinks. Components log through the
// stream macros (LOG_INFO(category) << ...) or the printf-style LogInfoF
// family; both are filtered by level and category before any formatting.

#ifndef DADBS_UTIL_LOGGING_H
#define DADBS_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace dadbs {
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

/// Parse log level from string (case-insensitive), nullopt if unknown
std::optional<LogLevel> ParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CONSENSUS = "consensus";
    constexpr const char* STAKE = "stake";
    constexpr const char* ADDRESS = "address";
    constexpr const char* CONFIG = "config";
    constexpr const char* DB = "db";
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
    std::thread::id threadId;
};

/// Which decorations a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
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

    /// Minimum level this sink accepts
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout; errors optionally go to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
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
    Config config_;
    std::mutex mutex_;
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const std::string& path);
    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const std::string& GetPath() const { return config_.path; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Forwards entries to a callback (used by tests and embedders)
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

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

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

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
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
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define DADBS_LOGGER ::dadbs::util::Logger::Instance()

#define DADBS_LOG_ENABLED(level, category) \
    DADBS_LOGGER.WillLog(::dadbs::util::LogLevel::level, category)

#define DADBS_LOG(level, category) \
    if (DADBS_LOG_ENABLED(level, category)) \
        ::dadbs::util::LogStream(::dadbs::util::LogLevel::level, category, \
                                 __FILE__, __LINE__)

#define LOG_TRACE(category)   DADBS_LOG(Trace, category)
#define LOG_DEBUG(category)   DADBS_LOG(Debug, category)
#define LOG_INFO(category)    DADBS_LOG(Info, category)
#define LOG_WARN(category)    DADBS_LOG(Warn, category)
#define LOG_ERROR(category)   DADBS_LOG(Error, category)

#define DADBS_LOGF(level, category, ...) \
    do { \
        if (DADBS_LOG_ENABLED(level, category)) { \
            DADBS_LOGGER.LogF(::dadbs::util::LogLevel::level, category, \
                              __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  DADBS_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   DADBS_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   DADBS_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  DADBS_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Basename of a source path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace dadbs

#endif // DADBS_UTIL_LOGGING_H
