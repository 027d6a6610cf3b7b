// NOCKLEDGER - Logging System
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Process-wide logger with:
// - Levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories for filtering (wallet, ledger, consensus, mining, ...)
// - Pluggable sinks (console, file, callback)
// - Stream-style and printf-style macros
//
// The logger is the only process-wide state; ledger state always lives in
// an explicit Wallet object.

#ifndef NOCKLEDGER_UTIL_LOGGING_H
#define NOCKLEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace nockledger {
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

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive). Unknown names map to Info.
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* WALLET = "wallet";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* CONSENSUS = "consensus";
    constexpr const char* MINING = "mining";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* STORAGE = "storage";
    constexpr const char* NET = "net";
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
    std::thread::id threadId;
};

// ============================================================================
// Sinks
// ============================================================================

/// Output destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes formatted lines to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
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
    std::string Format(const LogEntry& entry) const;

    Config config_;
    std::mutex mutex_;
};

/// Appends formatted lines to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Forwards entries to a callback (tests, embedding applications)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace)
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

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

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
    bool allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
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

#define NOCKLEDGER_LOGGER ::nockledger::util::Logger::Instance()

#define NOCKLEDGER_LOG_ENABLED(level, category) \
    NOCKLEDGER_LOGGER.WillLog(::nockledger::util::LogLevel::level, category)

#define NOCKLEDGER_LOG(level, category) \
    if (!NOCKLEDGER_LOG_ENABLED(level, category)) {} else \
        ::nockledger::util::LogStream(::nockledger::util::LogLevel::level, category, \
                                      __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   NOCKLEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   NOCKLEDGER_LOG(Debug, category)
#define LOG_INFO(category)    NOCKLEDGER_LOG(Info, category)
#define LOG_WARN(category)    NOCKLEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   NOCKLEDGER_LOG(Error, category)

#define NOCKLEDGER_LOGF(level, category, ...) \
    do { \
        if (NOCKLEDGER_LOG_ENABLED(level, category)) { \
            NOCKLEDGER_LOGGER.LogF(::nockledger::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  NOCKLEDGER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   NOCKLEDGER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   NOCKLEDGER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  NOCKLEDGER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

} // namespace util
} // namespace nockledger

#endif // NOCKLEDGER_UTIL_LOGGING_H
