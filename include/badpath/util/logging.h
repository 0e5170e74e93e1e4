// BADPATH - Logging System
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Diagnostic logging for the path checker. Records are tagged with the
// checker stage that produced them ("normalize", "match", ...) and can be
// narrowed to a few stages with EnableCategory().
//
// The library never installs a sink on its own; until the host application
// adds one, every record is dropped. Sinks write to stderr so stdout stays
// free for verdicts.

#ifndef BADPATH_UTIL_LOGGING_H
#define BADPATH_UTIL_LOGGING_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace badpath {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Fallbacks and per-check decisions
    Info = 2,    // Registry changes, configuration loads
    Warn = 3,    // Dangerous paths reported by exception
    Error = 4,
    Off = 5      // Disable logging
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
    constexpr const char* PLATFORM = "platform";
    constexpr const char* NORMALIZE = "normalize";
    constexpr const char* MATCH = "match";
    constexpr const char* VALIDATE = "validate";
    constexpr const char* ACCESS = "access";
    constexpr const char* CHECKER = "checker";
    constexpr const char* CONFIG = "config";
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
};

/// "[LEVEL] [category] message"; the default category is left out
std::string FormatEntry(const LogEntry& entry);

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    /// Set minimum log level for this sink
    virtual void SetLevel(LogLevel level) = 0;

    /// Get minimum log level for this sink
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stderr, colored when stderr is a terminal
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool useColors = true);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    LogLevel level_;
    bool useColors_;
    std::mutex mutex_;
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

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger
class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Global minimum log level
    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Category filtering. Enabling one category switches the logger from
    /// "all categories" to an explicit allow-list.
    void EnableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    /// Restrict output to the given stages; an empty list allows all
    void SetCategories(const std::vector<std::string>& categories);

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper, emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (active_) {
            manip(stream_);
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define BADPATH_LOGGER ::badpath::util::Logger::Instance()

#define BADPATH_LOG_ENABLED(level, category) \
    BADPATH_LOGGER.WillLog(::badpath::util::LogLevel::level, category)

#define BADPATH_LOG(level, category) \
    if (BADPATH_LOG_ENABLED(level, category)) \
        ::badpath::util::LogStream(::badpath::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   BADPATH_LOG(Trace, category)
#define LOG_DEBUG(category)   BADPATH_LOG(Debug, category)
#define LOG_INFO(category)    BADPATH_LOG(Info, category)
#define LOG_WARN(category)    BADPATH_LOG(Warn, category)
#define LOG_ERROR(category)   BADPATH_LOG(Error, category)

} // namespace util
} // namespace badpath

#endif // BADPATH_UTIL_LOGGING_H
