// COINKEY - Logging Implementation
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include "coinkey/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <utility>

#include <unistd.h>

namespace coinkey {
namespace util {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "";
    }
}

} // anonymous namespace

// ============================================================================
// Levels and Categories
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> LogLevelFromString(const std::string& str) {
    static const std::map<std::string, LogLevel> names = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"off", LogLevel::Off},
        {"none", LogLevel::Off},
    };

    auto it = names.find(ToLower(str));
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<std::string>& KnownLogCategories() {
    static const std::vector<std::string> categories = {
        LogCategory::DEFAULT, LogCategory::CURVE, LogCategory::KEYS,
        LogCategory::ASN1, LogCategory::HASH, LogCategory::TOOL
    };
    return categories;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::string out;

    if (format.timestamp) {
        out += FormatLogTimestamp(entry.timestamp);
        out += ' ';
    }
    if (format.level) {
        out += '[';
        out += LogLevelToString(entry.level);
        out += "] ";
    }
    if (format.category && !entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        out += '[' + entry.category + "] ";
    }
    if (format.location && !entry.file.empty()) {
        out += GetBasename(entry.file) + ':' + std::to_string(entry.line) + ' ';
    }

    out += entry.message;
    return out;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Options& options) : options_(options) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < options_.level) {
        return;
    }

    std::string line = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (options_.useColors && isatty(fileno(stderr))) {
        std::fprintf(stderr, "%s%s\033[0m\n", ColorFor(entry.level), line.c_str());
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : path_(path), file_(path, std::ios::out | std::ios::app), level_(level) {}

FileSink::~FileSink() {
    Flush();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }

    LogFormat full;
    full.location = true;
    std::string line = FormatLogEntry(entry, full);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
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

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categoryLevels_[category] = level;
}

void Logger::ClearCategoryLevels() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categoryLevels_.clear();
}

LogLevel Logger::GetEffectiveLevel(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    auto it = categoryLevels_.find(category);
    return it != categoryLevels_.end() ? it->second : level_.load();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= GetEffectiveLevel(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category, const char* file, int line,
                  const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

bool EnableDebugCategories(const std::string& list) {
    std::vector<std::string> names;
    std::istringstream stream(list);
    std::string name;
    while (std::getline(stream, name, ',')) {
        name = ToLower(name);
        // "--nodebug" arrives as "false"
        if (!name.empty() && name != "0" && name != "false") {
            names.push_back(name);
        }
    }
    if (names.empty() && !list.empty()) {
        return true;
    }

    const auto& known = KnownLogCategories();
    bool all = names.empty();
    for (const auto& n : names) {
        if (n == "1" || n == "all" || n == "true") {
            all = true;
        } else if (std::find(known.begin(), known.end(), n) == known.end()) {
            return false;
        }
    }

    Logger& logger = Logger::Instance();
    if (all) {
        logger.SetLevel(LogLevel::Debug);
        return true;
    }
    for (const auto& n : names) {
        logger.SetCategoryLevel(n, LogLevel::Debug);
    }
    return true;
}

// ============================================================================
// LogStream / ScopedLogTimer
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation, LogLevel level)
    : category_(category)
    , operation_(std::move(operation))
    , level_(level)
    , start_(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (!logger.WillLog(level_, category_)) {
        return;
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_).count();
    logger.Log(level_, category_, operation_ + " took " + std::to_string(micros) + "us");
}

} // namespace util
} // namespace coinkey
