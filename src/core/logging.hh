#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <sstream>
#include <source_location>
#include <vector>
#include <thread>
#include <condition_variable>
#include <queue>
#include <unordered_map>
#include <optional>

namespace oracle {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6,
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view log_level_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        case LogLevel::OFF:   return "";
    }
    return "";
}

// Case-insensitive; accepts "warning" as an alias for WARN
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
    std::string component;
    std::string message;
    std::string file;
    std::uint32_t line;
    std::string function;
};

struct LogFormat {
    bool colors = false;
    bool thread_id = true;
    bool source_location = false;
    bool function_name = false;
};

// Single-line rendering shared by the console and file sinks
[[nodiscard]] std::string format_log_entry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

// ============================================================================
// Console Log Sink
// ============================================================================

class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogEntry& entry) override;
    void flush() override;

    void set_use_colors(bool use_colors);
    void set_show_thread_id(bool show);
    void set_show_source_location(bool show);

private:
    LogFormat format_;
    std::mutex mutex_;
};

// ============================================================================
// File Log Sink
// ============================================================================

class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& filename);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const LogEntry& entry) override;
    void flush() override;

    void set_max_file_size(std::size_t bytes) { max_file_size_ = bytes; }
    void set_max_files(std::size_t count) { max_files_ = count; }

    [[nodiscard]] bool is_open() const { return file_ != nullptr; }

private:
    std::string filename_;
    std::FILE* file_ = nullptr;
    std::size_t current_size_ = 0;
    std::size_t max_file_size_ = 16 * 1024 * 1024;  // 16MB
    std::size_t max_files_ = 5;
    std::mutex mutex_;

    void rotate();
};

// ============================================================================
// Memory Log Sink
// ============================================================================

// Keeps the most recent entries in memory. Used to assert on log output.
class MemorySink : public LogSink {
public:
    explicit MemorySink(std::size_t capacity = 4096);

    void write(const LogEntry& entry) override;
    void flush() override {}

    [[nodiscard]] std::vector<LogEntry> entries() const;
    [[nodiscard]] std::size_t count(LogLevel level) const;
    [[nodiscard]] std::size_t count(LogLevel level, std::string_view component) const;
    [[nodiscard]] bool contains(std::string_view needle) const;
    void clear();

private:
    std::size_t capacity_;
    std::vector<LogEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Async Log Sink Wrapper
// ============================================================================

class AsyncSink : public LogSink {
public:
    explicit AsyncSink(std::shared_ptr<LogSink> inner_sink, std::size_t queue_size = 10000);
    ~AsyncSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

    void start();
    void stop();

    [[nodiscard]] std::size_t dropped() const { return dropped_.load(); }

private:
    std::shared_ptr<LogSink> inner_sink_;
    std::queue<LogEntry> queue_;
    std::size_t max_queue_size_;
    std::size_t in_flight_ = 0;
    std::atomic<std::size_t> dropped_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};

    void worker_loop();
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void set_component_level(const std::string& component, LogLevel level);
    void clear_component_levels();
    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);
    void clear_sinks();

    // Component levels are inherited from the nearest dotted parent
    // ("consensus" covers "consensus.defense").
    [[nodiscard]] bool is_enabled(LogLevel level, std::string_view component = {}) const;

    void log(LogLevel level,
             std::string_view component,
             std::string_view message,
             const std::source_location& loc = std::source_location::current());

    void flush();

    [[nodiscard]] LogLevel level() const { return level_.load(); }

private:
    Logger();
    ~Logger();

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::unordered_map<std::string, LogLevel> component_levels_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Log Stream Helper
// ============================================================================

class LogStream {
public:
    LogStream(LogLevel level,
              std::string_view component,
              const std::source_location& loc);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&) = default;
    LogStream& operator=(LogStream&&) = default;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::source_location loc_;
    std::ostringstream stream_;
    bool enabled_;
};

// ============================================================================
// Component Logger
// ============================================================================

class ComponentLogger {
public:
    explicit ComponentLogger(std::string component);

    [[nodiscard]] const std::string& component() const { return component_; }

    [[nodiscard]] bool is_trace_enabled() const;
    [[nodiscard]] bool is_debug_enabled() const;
    [[nodiscard]] bool is_info_enabled() const;

    LogStream trace(const std::source_location& loc = std::source_location::current()) const;
    LogStream debug(const std::source_location& loc = std::source_location::current()) const;
    LogStream info(const std::source_location& loc = std::source_location::current()) const;
    LogStream warn(const std::source_location& loc = std::source_location::current()) const;
    LogStream error(const std::source_location& loc = std::source_location::current()) const;
    LogStream fatal(const std::source_location& loc = std::source_location::current()) const;

    void trace(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void debug(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void info(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void warn(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void error(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void fatal(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;

private:
    std::string component_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ORACLE_LOG_TRACE(logger) \
    if ((logger).is_trace_enabled()) (logger).trace()

#define ORACLE_LOG_DEBUG(logger) \
    if ((logger).is_debug_enabled()) (logger).debug()

#define ORACLE_LOG_INFO(logger) \
    if ((logger).is_info_enabled()) (logger).info()

#define ORACLE_LOG_WARN(logger) (logger).warn()

#define ORACLE_LOG_ERROR(logger) (logger).error()

#define ORACLE_LOG_FATAL(logger) (logger).fatal()

// ============================================================================
// Default Loggers
// ============================================================================

namespace log {

inline ComponentLogger core("core");
inline ComponentLogger crypto("crypto");
inline ComponentLogger consensus("consensus");

inline ComponentLogger protocol("consensus.protocol");
inline ComponentLogger guard("consensus.guard");
inline ComponentLogger defense("consensus.defense");
inline ComponentLogger reputation("consensus.reputation");
inline ComponentLogger aggregation("consensus.aggregation");
inline ComponentLogger identity("consensus.identity");

}  // namespace log

// ============================================================================
// Initialization Helper
// ============================================================================

struct LogConfig {
    LogLevel default_level = LogLevel::INFO;
    std::unordered_map<std::string, LogLevel> component_levels;
    bool console_enabled = true;
    bool console_colors = true;
    bool console_thread_id = true;
    bool console_source_location = false;
    bool file_enabled = false;
    std::string file_path = "oracle.log";
    std::size_t file_max_size = 16 * 1024 * 1024;
    std::size_t file_max_count = 5;
    bool async_logging = true;
};

void init_logging(const LogConfig& config = LogConfig{});
void shutdown_logging();

}  // namespace oracle
