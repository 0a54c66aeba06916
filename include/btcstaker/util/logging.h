// BTCSTAKER - Logging System
// Copyright (c) 2024 BTCSTAKER Developers
// MIT License
//
// Leveled, categorized logging with stream-style macros. The Logger
// singleton filters by level and category and hands each record to its
// sinks, which apply their own level and write one formatted line.

#ifndef BTCSTAKER_UTIL_LOGGING_H
#define BTCSTAKER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace btcstaker {
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
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn. nullopt for unknown names.
std::optional<LogLevel> ParseLogLevel(const std::string& name);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* STORE = "store";
    constexpr const char* DB = "db";
    constexpr const char* CLI = "cli";
    constexpr const char* CONFIG = "config";
}

/// True for the names in LogCategory
bool IsKnownLogCategory(const std::string& name);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

/// "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [category] message", level padded to 5
std::string FormatLogRecord(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

/**
 * Destination for log records. Records below the sink's level are dropped
 * before formatting.
 */
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    void Submit(const LogRecord& record);
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    /// One formatted line without the trailing newline
    virtual void Write(LogLevel level, const std::string& line) = 0;

private:
    std::atomic<LogLevel> level_;
};

/// Writes to stdout, or to stderr when useStderr is set
class ConsoleSink : public LogSink {
public:
    struct Config {
        bool useStderr{false};
        bool useColors{true};
        LogLevel level{LogLevel::Info};
    };

    explicit ConsoleSink(const Config& config);

    void Flush() override;

protected:
    void Write(LogLevel level, const std::string& line) override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file opened at construction
class FileSink : public LogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);

    /// False when the file could not be opened; records are then dropped
    bool IsOpen() const { return file_.is_open(); }

    void Flush() override;

protected:
    void Write(LogLevel level, const std::string& line) override;

private:
    std::ofstream file_;
    std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given categories; empty enables all
    void SetCategories(const std::vector<std::string>& categories);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message);

    void Flush();

    /// Flush and drop all sinks
    void Shutdown();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::set<std::string> categories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category) : level_(level), category_(category) {}
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
};

// ============================================================================
// Logging Macros
// ============================================================================

#define BTCSTAKER_LOG(level, category) \
    if (::btcstaker::util::Logger::Instance().WillLog(::btcstaker::util::LogLevel::level, category)) \
        ::btcstaker::util::LogStream(::btcstaker::util::LogLevel::level, category)

#define LOG_TRACE(category)   BTCSTAKER_LOG(Trace, category)
#define LOG_DEBUG(category)   BTCSTAKER_LOG(Debug, category)
#define LOG_INFO(category)    BTCSTAKER_LOG(Info, category)
#define LOG_WARN(category)    BTCSTAKER_LOG(Warn, category)
#define LOG_ERROR(category)   BTCSTAKER_LOG(Error, category)

} // namespace util
} // namespace btcstaker

#endif // BTCSTAKER_UTIL_LOGGING_H
