// BTCSTAKER - Logging Implementation
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License

#include "btcstaker/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace btcstaker {
namespace util {

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
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "OFF")   return LogLevel::Off;
    return std::nullopt;
}

bool IsKnownLogCategory(const std::string& name) {
    return name == LogCategory::STORE || name == LogCategory::DB ||
           name == LogCategory::CLI || name == LogCategory::CONFIG;
}

std::string FormatLogRecord(const LogRecord& record) {
    auto time = std::chrono::system_clock::to_time_t(record.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ')
        << " [" << std::left << std::setw(5) << LogLevelToString(record.level) << "] ";
    if (!record.category.empty()) {
        oss << "[" << record.category << "] ";
    }
    oss << record.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void LogSink::Submit(const LogRecord& record) {
    if (record.level < GetLevel()) {
        return;
    }
    Write(record.level, FormatLogRecord(record));
}

ConsoleSink::ConsoleSink(const Config& config) : LogSink(config.level), config_(config) {}

void ConsoleSink::Write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = config_.useStderr ? stderr : stdout;

    if (config_.useColors && isatty(fileno(stream))) {
        const char* color = "\033[0m";
        switch (level) {
            case LogLevel::Trace: color = "\033[90m"; break;
            case LogLevel::Debug: color = "\033[36m"; break;
            case LogLevel::Warn:  color = "\033[33m"; break;
            case LogLevel::Error: color = "\033[31m"; break;
            default: break;
        }
        fprintf(stream, "%s%s\033[0m\n", color, line.c_str());
    } else {
        fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(config_.useStderr ? stderr : stdout);
}

FileSink::FileSink(const Config& config) : LogSink(config.level) {
    file_.open(config.path, config.append ? (std::ios::out | std::ios::app) : std::ios::out);
}

void FileSink::Write(LogLevel /*level*/, const std::string& line) {
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
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::SetCategories(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_ = std::set<std::string>(categories.begin(), categories.end());
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message) {
    if (!WillLog(level, category)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.message = message;
    record.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Submit(record);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str());
}

} // namespace util
} // namespace btcstaker
