// COINKEY - Logging
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Leveled, categorised logging for the key library and coinkey-tool.
// The library only emits; the application decides where entries go by
// attaching sinks. Until a sink is attached nothing is written.

#ifndef COINKEY_UTIL_LOGGING_H
#define COINKEY_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace coinkey {
namespace util {

// ============================================================================
// Levels and Categories
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

/// Upper-case level name ("WARN")
const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" and "none" as aliases.
/// Returns nullopt for unknown names.
std::optional<LogLevel> LogLevelFromString(const std::string& str);

/// Categories used by the library. Entries in DEFAULT print without a tag.
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* CURVE = "curve";    // group setup, OpenSSL failures
    constexpr const char* KEYS = "keys";      // scalar and point validation
    constexpr const char* ASN1 = "asn1";      // EC private key records
    constexpr const char* HASH = "hash";      // digest failures
    constexpr const char* TOOL = "tool";      // coinkey-tool
}

/// The categories above, in declaration order
const std::vector<std::string>& KnownLogCategories();

// ============================================================================
// Entries and Formatting
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool timestamp{true};
    bool level{true};
    bool category{true};
    bool location{false};   // basename:line
};

/// "<time> [LEVEL] [category] file:line message", fields per `format`
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Last path component of a source file name
std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    /// Entries below this level are ignored by the sink
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stderr, leaving stdout to command output
class ConsoleSink : public ILogSink {
public:
    struct Options {
        LogLevel level{LogLevel::Info};
        LogFormat format;
        bool useColors{true};   // only applied when stderr is a terminal
    };

    ConsoleSink();
    explicit ConsoleSink(const Options& options);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { options_.level = level; }
    LogLevel GetLevel() const override { return options_.level; }

    std::string Format(const LogEntry& entry) const {
        return FormatLogEntry(entry, options_.format);
    }

private:
    Options options_;
    std::mutex mutex_;
};

/// Appends fully formatted entries (timestamp and location included) to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    /// False when the file could not be opened; writes are then dropped
    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Hands entries to a function (tests, embedding applications)
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

/**
 * Process-wide logger.
 *
 * An entry is emitted when its level reaches the threshold of its
 * category: the per-category level when one is set, the global level
 * otherwise. Per-category levels can lower the threshold (for example
 * "--debug=keys") as well as raise it.
 */
class Logger {
public:
    static Logger& Instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ClearCategoryLevels();

    /// Threshold applied to `category`
    LogLevel GetEffectiveLevel(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    /// printf-style; messages are truncated at 4 KiB
    void LogF(LogLevel level, const std::string& category, const char* file, int line,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex categoriesMutex_;
    std::map<std::string, LogLevel> categoryLevels_;

    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

/**
 * Apply a comma-separated "--debug" value: each named category is set to
 * Debug; "1", "all" or an empty value lowers the global level to Debug,
 * "0" or "false" leaves the levels alone.
 * Returns false, changing nothing, when a name is not a known category.
 */
bool EnableDebugCategories(const std::string& list);

// ============================================================================
// Stream Logging
// ============================================================================

/// Collects a message with operator<< and logs it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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
// Macros
// ============================================================================

#define COINKEY_LOGGER ::coinkey::util::Logger::Instance()

/// Stream arguments are not evaluated when the entry would be dropped
#define COINKEY_LOG(level, category) \
    if (!COINKEY_LOGGER.WillLog(::coinkey::util::LogLevel::level, category)) {} else \
        ::coinkey::util::LogStream(::coinkey::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   COINKEY_LOG(Trace, category)
#define LOG_DEBUG(category)   COINKEY_LOG(Debug, category)
#define LOG_INFO(category)    COINKEY_LOG(Info, category)
#define LOG_WARN(category)    COINKEY_LOG(Warn, category)
#define LOG_ERROR(category)   COINKEY_LOG(Error, category)
#define LOG_FATAL(category)   COINKEY_LOG(Fatal, category)

#define COINKEY_LOGF(level, category, ...) \
    do { \
        if (COINKEY_LOGGER.WillLog(::coinkey::util::LogLevel::level, category)) { \
            COINKEY_LOGGER.LogF(::coinkey::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  COINKEY_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   COINKEY_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   COINKEY_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  COINKEY_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "<operation> took <N>us" at `level` when it goes out of scope
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation,
                   LogLevel level = LogLevel::Debug);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

private:
    const char* category_;
    std::string operation_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace coinkey

#endif // COINKEY_UTIL_LOGGING_H
