#include "logging.hh"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>

namespace oracle {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "off") return LogLevel::OFF;
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_log_entry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;

    auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    oss << std::setfill(' ');

    if (format.thread_id) {
        oss << " [" << entry.thread_id << "]";
    }

    oss << " ";
    if (format.colors) {
        oss << log_level_color(entry.level);
    }
    oss << "[" << std::setw(5) << log_level_name(entry.level) << "]";
    if (format.colors) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << " " << entry.message;

    if (format.source_location && !entry.file.empty()) {
        oss << " (" << std::filesystem::path(entry.file).filename().string()
            << ":" << entry.line;
        if (format.function_name && !entry.function.empty()) {
            oss << " " << entry.function;
        }
        oss << ")";
    }

    return oss.str();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) {
    format_.colors = use_colors;
}

void ConsoleSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << format_log_entry(entry, format_) << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

void ConsoleSink::set_use_colors(bool use_colors) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_.colors = use_colors;
}

void ConsoleSink::set_show_thread_id(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_.thread_id = show;
}

void ConsoleSink::set_show_source_location(bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_.source_location = show;
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& filename)
    : filename_(filename) {
    file_ = std::fopen(filename.c_str(), "a");
    if (file_) {
        std::fseek(file_, 0, SEEK_END);
        long pos = std::ftell(file_);
        current_size_ = pos > 0 ? static_cast<std::size_t>(pos) : 0;
    }
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_size_ >= max_file_size_) {
        rotate();
    }
    if (!file_) {
        return;
    }

    LogFormat format;
    format.source_location = true;
    format.function_name = true;

    std::string line = format_log_entry(entry, format);
    line.push_back('\n');
    std::fwrite(line.data(), 1, line.size(), file_);
    current_size_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

void FileSink::rotate() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    namespace fs = std::filesystem;
    std::error_code ec;

    if (max_files_ > 0) {
        fs::remove(filename_ + "." + std::to_string(max_files_), ec);

        for (std::size_t i = max_files_ - 1; i >= 1; --i) {
            std::string src = filename_ + "." + std::to_string(i);
            if (fs::exists(src, ec)) {
                fs::rename(src, filename_ + "." + std::to_string(i + 1), ec);
            }
        }

        if (fs::exists(filename_, ec)) {
            fs::rename(filename_, filename_ + ".1", ec);
        }
    }

    file_ = std::fopen(filename_.c_str(), "w");
    current_size_ = 0;
}

// ============================================================================
// MemorySink Implementation
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
    }
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t MemorySink::count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [level](const LogEntry& e) { return e.level == level; }));
}

std::size_t MemorySink::count(LogLevel level, std::string_view component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const LogEntry& e) { return e.level == level && e.component == component; }));
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [needle](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// AsyncSink Implementation
// ============================================================================

AsyncSink::AsyncSink(std::shared_ptr<LogSink> inner_sink, std::size_t queue_size)
    : inner_sink_(std::move(inner_sink))
    , max_queue_size_(queue_size == 0 ? 1 : queue_size) {}

AsyncSink::~AsyncSink() {
    stop();
}

void AsyncSink::write(const LogEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_queue_size_) {
            queue_.pop();
            dropped_.fetch_add(1);
        }
        queue_.push(entry);
    }
    cv_.notify_one();
}

void AsyncSink::flush() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_cv_.wait(lock, [this]() {
            return (queue_.empty() && in_flight_ == 0) || !running_.load();
        });
    }
    inner_sink_->flush();
}

void AsyncSink::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&AsyncSink::worker_loop, this);
}

void AsyncSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();
    drained_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    // Worker is gone; drain whatever it left behind on this thread
    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        inner_sink_->write(queue_.front());
        queue_.pop();
    }
    inner_sink_->flush();
}

void AsyncSink::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        cv_.wait(lock, [this]() {
            return !queue_.empty() || !running_.load();
        });

        while (!queue_.empty()) {
            LogEntry entry = std::move(queue_.front());
            queue_.pop();
            ++in_flight_;
            lock.unlock();

            inner_sink_->write(entry);

            lock.lock();
            --in_flight_;
        }
        drained_cv_.notify_all();
    }
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>(true));
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_component_level(const std::string& component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[component] = level;
}

void Logger::clear_component_levels() {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.clear();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, std::string_view component) const {
    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!component_levels_.empty()) {
            std::string name(component);
            while (true) {
                auto it = component_levels_.find(name);
                if (it != component_levels_.end()) {
                    return level >= it->second;
                }
                auto pos = name.rfind('.');
                if (pos == std::string::npos) {
                    break;
                }
                name.resize(pos);
            }
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {

    if (level == LogLevel::OFF || !is_enabled(level, component)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = std::string(component);
    entry.message = std::string(message);
    entry.file = loc.file_name();
    entry.line = loc.line();
    entry.function = loc.function_name();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level,
                     std::string_view component,
                     const std::source_location& loc)
    : level_(level)
    , component_(component)
    , loc_(loc)
    , enabled_(Logger::instance().is_enabled(level, component)) {}

LogStream::~LogStream() {
    if (enabled_) {
        std::string message = stream_.str();
        if (!message.empty()) {
            Logger::instance().log(level_, component_, message, loc_);
        }
    }
}

// ============================================================================
// ComponentLogger Implementation
// ============================================================================

ComponentLogger::ComponentLogger(std::string component)
    : component_(std::move(component)) {}

bool ComponentLogger::is_trace_enabled() const {
    return Logger::instance().is_enabled(LogLevel::TRACE, component_);
}

bool ComponentLogger::is_debug_enabled() const {
    return Logger::instance().is_enabled(LogLevel::DEBUG, component_);
}

bool ComponentLogger::is_info_enabled() const {
    return Logger::instance().is_enabled(LogLevel::INFO, component_);
}

LogStream ComponentLogger::trace(const std::source_location& loc) const {
    return LogStream(LogLevel::TRACE, component_, loc);
}

LogStream ComponentLogger::debug(const std::source_location& loc) const {
    return LogStream(LogLevel::DEBUG, component_, loc);
}

LogStream ComponentLogger::info(const std::source_location& loc) const {
    return LogStream(LogLevel::INFO, component_, loc);
}

LogStream ComponentLogger::warn(const std::source_location& loc) const {
    return LogStream(LogLevel::WARN, component_, loc);
}

LogStream ComponentLogger::error(const std::source_location& loc) const {
    return LogStream(LogLevel::ERROR, component_, loc);
}

LogStream ComponentLogger::fatal(const std::source_location& loc) const {
    return LogStream(LogLevel::FATAL, component_, loc);
}

void ComponentLogger::trace(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::TRACE, component_, msg, loc);
}

void ComponentLogger::debug(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::DEBUG, component_, msg, loc);
}

void ComponentLogger::info(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::INFO, component_, msg, loc);
}

void ComponentLogger::warn(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::WARN, component_, msg, loc);
}

void ComponentLogger::error(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::ERROR, component_, msg, loc);
}

void ComponentLogger::fatal(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::FATAL, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

namespace {

std::shared_ptr<LogSink> maybe_async(std::shared_ptr<LogSink> sink, bool async) {
    if (!async) {
        return sink;
    }
    auto wrapped = std::make_shared<AsyncSink>(std::move(sink));
    wrapped->start();
    return wrapped;
}

}  // namespace

void init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.clear_component_levels();
    logger.set_level(config.default_level);

    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    if (config.console_enabled) {
        auto console = std::make_shared<ConsoleSink>(config.console_colors);
        console->set_show_thread_id(config.console_thread_id);
        console->set_show_source_location(config.console_source_location);
        logger.add_sink(maybe_async(console, config.async_logging));
    }

    if (config.file_enabled) {
        auto file = std::make_shared<FileSink>(config.file_path);
        if (!file->is_open()) {
            log::core.error() << "Cannot open log file " << config.file_path;
        } else {
            file->set_max_file_size(config.file_max_size);
            file->set_max_files(config.file_max_count);
            logger.add_sink(maybe_async(file, config.async_logging));
        }
    }

    ORACLE_LOG_INFO(log::core) << "Logging initialized at level "
                               << log_level_name(config.default_level);
}

void shutdown_logging() {
    log::core.info("Logging shutting down");
    Logger::instance().flush();
}

}  // namespace oracle
