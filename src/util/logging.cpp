// HYDROSTAKE - Logging Implementation
// Copyright (c) 2024 HYDROSTAKE Developers
// MIT License

#include "hydrostake/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>

#include <unistd.h>

namespace hydrostake {
namespace util {

namespace {

struct LevelInfo {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelInfo LEVELS[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info,  "INFO",  "\033[32m"},
    {LogLevel::Warn,  "WARN",  "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Off,   "OFF",   "\033[0m"},
};

constexpr const char* COLOR_RESET = "\033[0m";

const LevelInfo* FindLevel(LogLevel level) {
    for (const LevelInfo& info : LEVELS) {
        if (info.level == level) {
            return &info;
        }
    }
    return nullptr;
}

/// Local time with milliseconds
void PutTimestamp(std::ostream& out, std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
}

std::string BackupName(const std::string& path, size_t index) {
    return path + "." + std::to_string(index);
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    const LevelInfo* info = FindLevel(level);
    return info ? info->name : "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper;
    upper.reserve(str.size());
    for (unsigned char c : str) {
        upper.push_back(static_cast<char>(std::toupper(c)));
    }

    if (upper == "WARNING") return LogLevel::Warn;
    if (upper == "NONE") return LogLevel::Off;
    for (const LevelInfo& info : LEVELS) {
        if (upper == info.name) {
            return info.level;
        }
    }
    return LogLevel::Info;
}

std::string FormatLogLine(const LogEntry& entry, const LogLayout& layout) {
    std::ostringstream out;
    if (layout.timestamp) {
        PutTimestamp(out, entry.timestamp);
        out << ' ';
    }
    if (layout.level) {
        out << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (layout.category && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        out << '[' << entry.category << "] ";
    }
    if (layout.location && !entry.file.empty()) {
        out << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    out << entry.message;
    return out.str();
}

std::string GetBasename(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : ConsoleSink(Config()) {}

ConsoleSink::ConsoleSink(const Config& config)
    : LogSink(config.level), config_(config) {}

void ConsoleSink::Emit(const LogEntry& entry) {
    const std::string line = FormatLogLine(entry, config_.layout);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* out = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    if (config_.useColors && isatty(fileno(out))) {
        const LevelInfo* info = FindLevel(entry.level);
        std::fprintf(out, "%s%s%s\n", info ? info->color : COLOR_RESET,
                     line.c_str(), COLOR_RESET);
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config)
    : LogSink(config.level), config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.path.empty()) {
        OpenLocked(config_.append);
    }
}

FileSink::~FileSink() {
    Close();
}

bool FileSink::OpenLocked(bool append) {
    file_.close();
    file_.clear();
    file_.open(config_.path, std::ios::out | (append ? std::ios::app : std::ios::trunc));

    written_ = 0;
    if (!file_.is_open()) {
        return false;
    }
    std::error_code ec;
    const auto existing = std::filesystem::file_size(config_.path, ec);
    if (!ec) {
        written_ = static_cast<size_t>(existing);
    }
    return true;
}

void FileSink::RotateLocked() {
    namespace fs = std::filesystem;
    file_.close();

    // Missing backups are expected, so rename errors are not reported
    std::error_code ec;
    fs::remove(BackupName(config_.path, config_.maxFiles), ec);
    for (size_t index = config_.maxFiles; index > 1; --index) {
        fs::rename(BackupName(config_.path, index - 1), BackupName(config_.path, index), ec);
    }
    fs::rename(config_.path, BackupName(config_.path, 1), ec);

    OpenLocked(false);
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.close();
}

void FileSink::Emit(const LogEntry& entry) {
    LogLayout layout;
    layout.location = true;
    const std::string line = FormatLogLine(entry, layout) + '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxSize > 0 && written_ >= config_.maxSize) {
        RotateLocked();
    }
    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    written_ += line.size();
    if (config_.autoFlush) {
        file_.flush();
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
    : LogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Emit(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

std::vector<std::shared_ptr<LogSink>> Logger::SnapshotSinks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_;
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
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
    if (file) {
        entry.file = file;
    }
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    // A callback sink may itself log
    for (const auto& sink : SnapshotSinks()) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    for (const auto& sink : SnapshotSinks()) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace hydrostake
