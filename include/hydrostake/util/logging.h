// HYDROSTAKE - Logging System
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License
//
// Entries carry a level and a category (staking, ledger, admin, ...) and are
// fanned out to sinks. A logger without sinks drops everything, which is the
// state tests start in.

#ifndef HYDROSTAKE_UTIL_LOGGING_H
#define HYDROSTAKE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace hydrostake {
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
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted, anything unknown is Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* STAKING = "staking";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* ADMIN = "admin";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// Prefixes rendered ahead of the message
struct LogLayout {
    bool timestamp{true};
    bool level{true};
    bool category{true};
    bool location{false};
};

/// "2024-01-31 12:00:00.000 [WARN ] [admin] engine.cpp:42 message"
std::string FormatLogLine(const LogEntry& entry, const LogLayout& layout);

/// Strip directories from a source path
std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

/// Output destination; entries below the sink's own threshold are skipped
class LogSink {
public:
    explicit LogSink(LogLevel threshold) : threshold_(threshold) {}
    virtual ~LogSink() = default;

    void Write(const LogEntry& entry) {
        if (entry.level >= threshold_.load()) {
            Emit(entry);
        }
    }

    virtual void Flush() {}

    void SetLevel(LogLevel level) { threshold_.store(level); }
    LogLevel GetLevel() const { return threshold_.load(); }

protected:
    virtual void Emit(const LogEntry& entry) = 0;

private:
    std::atomic<LogLevel> threshold_;
};

/// stdout, with errors optionally split off to stderr
class ConsoleSink : public LogSink {
public:
    struct Config {
        LogLevel level{LogLevel::Info};
        bool useColors{true};
        bool useStderr{false};
        LogLayout layout;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file; past maxSize bytes it becomes path.1 and older copies shift up
class FileSink : public LogSink {
public:
    struct Config {
        std::string path;
        LogLevel level{LogLevel::Debug};
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};  ///< 0 disables rotation
        size_t maxFiles{5};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;
    void Close();
    void Flush() override;

protected:
    void Emit(const LogEntry& entry) override;

private:
    bool OpenLocked(bool append);
    void RotateLocked();

    Config config_;
    std::ofstream file_;
    size_t written_{0};
    mutable std::mutex mutex_;
};

/// Hands entries to a function; used by tests to capture output
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

protected:
    void Emit(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Once any category is enabled, only enabled categories pass
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// Copy of the sink list so sinks run unlocked
    std::vector<std::shared_ptr<LogSink>> SnapshotSinks() const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::unordered_set<std::string> categories_;
    mutable std::mutex mutex_;
};

/// Collects one message through operator<< and logs it when destroyed
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
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    std::ostringstream stream_;
};

// ============================================================================
// Logging Macros
// ============================================================================

// Operands after << are not evaluated when the entry would be filtered out
#define HYDROSTAKE_LOG(level, category) \
    if (!::hydrostake::util::Logger::Instance().WillLog( \
            ::hydrostake::util::LogLevel::level, category)) { \
    } else \
        ::hydrostake::util::LogStream(::hydrostake::util::LogLevel::level, category, \
                                      __FILE__, __LINE__)

#define LOG_DEBUG(category)   HYDROSTAKE_LOG(Debug, category)
#define LOG_INFO(category)    HYDROSTAKE_LOG(Info, category)
#define LOG_WARN(category)    HYDROSTAKE_LOG(Warn, category)
#define LOG_ERROR(category)   HYDROSTAKE_LOG(Error, category)

} // namespace util
} // namespace hydrostake

#endif // HYDROSTAKE_UTIL_LOGGING_H
