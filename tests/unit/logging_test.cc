#include <gtest/gtest.h>
#include "core/logging.hh"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace oracle {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        Logger::instance().add_sink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.remove_sink(sink_);
        logger.clear_component_levels();
        logger.set_level(LogLevel::INFO);
    }

    std::shared_ptr<MemorySink> sink_;
};

TEST_F(LoggingTest, LogLevelNames) {
    EXPECT_EQ(log_level_name(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(log_level_name(LogLevel::INFO), "INFO");
    EXPECT_EQ(log_level_name(LogLevel::WARN), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(log_level_name(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(log_level_name(LogLevel::OFF), "OFF");
}

TEST_F(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("off"), LogLevel::OFF);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST_F(LoggingTest, LoggerSingleton) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST_F(LoggingTest, LoggerIsEnabled) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::INFO);

    EXPECT_FALSE(logger.is_enabled(LogLevel::TRACE));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_TRUE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR));
}

TEST_F(LoggingTest, ComponentLoggerLevelCheck) {
    Logger::instance().set_level(LogLevel::WARN);

    ComponentLogger logger("test");
    EXPECT_FALSE(logger.is_debug_enabled());
    EXPECT_FALSE(logger.is_info_enabled());

    Logger::instance().set_level(LogLevel::DEBUG);
    EXPECT_FALSE(logger.is_trace_enabled());
    EXPECT_TRUE(logger.is_debug_enabled());
    EXPECT_TRUE(logger.is_info_enabled());
}

TEST_F(LoggingTest, ParentComponentLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    logger.set_component_level("consensus", LogLevel::DEBUG);

    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "consensus.defense"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "consensus.guard"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "crypto"));
}

TEST_F(LoggingTest, NearestParentWins) {
    Logger& logger = Logger::instance();
    logger.set_component_level("consensus", LogLevel::DEBUG);
    logger.set_component_level("consensus.defense", LogLevel::ERROR);

    EXPECT_FALSE(logger.is_enabled(LogLevel::WARN, "consensus.defense"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN, "consensus.protocol"));
}

TEST_F(LoggingTest, MemorySinkCapturesMessages) {
    log::defense.warn() << "collusion between " << "a" << " and " << "b";
    log::protocol.info("session opened");

    EXPECT_TRUE(sink_->contains("collusion between a and b"));
    EXPECT_TRUE(sink_->contains("session opened"));
    EXPECT_EQ(sink_->count(LogLevel::WARN, "consensus.defense"), 1);
    EXPECT_EQ(sink_->count(LogLevel::INFO, "consensus.protocol"), 1);
}

TEST_F(LoggingTest, DisabledLevelsAreNotWritten) {
    Logger::instance().set_level(LogLevel::WARN);
    log::core.info("hidden");
    log::core.debug() << "also hidden";
    ORACLE_LOG_DEBUG(log::core) << "hidden via macro";
    ORACLE_LOG_WARN(log::core) << "visible via macro";

    EXPECT_FALSE(sink_->contains("hidden"));
    EXPECT_TRUE(sink_->contains("visible via macro"));
}

TEST_F(LoggingTest, MemorySinkCapacity) {
    MemorySink sink(2);
    LogEntry entry{};
    entry.level = LogLevel::INFO;
    for (int i = 0; i < 3; ++i) {
        entry.message = "m" + std::to_string(i);
        sink.write(entry);
    }

    auto entries = sink.entries();
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].message, "m1");
    EXPECT_EQ(entries[1].message, "m2");

    sink.clear();
    EXPECT_TRUE(sink.entries().empty());
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry{};
    entry.level = LogLevel::WARN;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = "consensus.guard";
    entry.message = "too fast";
    entry.file = "/src/consensus/thinking_guard.cc";
    entry.line = 42;

    LogFormat format;
    format.thread_id = false;
    format.source_location = true;

    std::string line = format_log_entry(entry, format);
    EXPECT_NE(line.find("[ WARN]"), std::string::npos);
    EXPECT_NE(line.find("[consensus.guard] too fast"), std::string::npos);
    EXPECT_NE(line.find("(thinking_guard.cc:42)"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST_F(LoggingTest, AsyncSinkDrainsOnFlush) {
    auto inner = std::make_shared<MemorySink>();
    AsyncSink async(inner, 64);
    async.start();

    LogEntry entry{};
    entry.level = LogLevel::INFO;
    for (int i = 0; i < 10; ++i) {
        entry.message = "async " + std::to_string(i);
        async.write(entry);
    }
    async.flush();
    async.stop();

    EXPECT_EQ(inner->entries().size(), 10);
    EXPECT_EQ(async.dropped(), 0);
}

TEST_F(LoggingTest, LogConfigDefaults) {
    LogConfig config;

    EXPECT_EQ(config.default_level, LogLevel::INFO);
    EXPECT_TRUE(config.console_enabled);
    EXPECT_FALSE(config.file_enabled);
    EXPECT_TRUE(config.async_logging);
    EXPECT_TRUE(config.component_levels.empty());
}

TEST_F(LoggingTest, FileSinkWritesAndRotates) {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "oracle_file_sink_test.log";
    fs::remove(path);
    fs::remove(path.string() + ".1");

    {
        FileSink file(path.string());
        ASSERT_TRUE(file.is_open());
        file.set_max_file_size(128);
        file.set_max_files(2);

        LogEntry entry{};
        entry.level = LogLevel::WARN;
        entry.component = "consensus.defense";
        for (int i = 0; i < 8; ++i) {
            entry.message = "collusion finding " + std::to_string(i);
            file.write(entry);
        }
        file.flush();
    }

    EXPECT_TRUE(fs::exists(path.string() + ".1"));

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("collusion finding 7"), std::string::npos);

    fs::remove(path);
    fs::remove(path.string() + ".1");
    fs::remove(path.string() + ".2");
}

TEST_F(LoggingTest, InitLoggingAppliesConfig) {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "oracle_init_logging_test.log";
    fs::remove(path);

    LogConfig config;
    config.default_level = LogLevel::WARN;
    config.component_levels["consensus.guard"] = LogLevel::DEBUG;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_path = path.string();
    config.async_logging = false;
    init_logging(config);

    Logger& logger = Logger::instance();
    EXPECT_EQ(logger.level(), LogLevel::WARN);
    EXPECT_TRUE(log::guard.is_debug_enabled());
    EXPECT_FALSE(log::defense.is_info_enabled());

    log::guard.debug("window opened");
    shutdown_logging();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("window opened"), std::string::npos);

    LogConfig restore;
    restore.async_logging = false;
    init_logging(restore);
    logger.add_sink(sink_);
    fs::remove(path);
}

TEST_F(LoggingTest, ThreadSafety) {
    std::atomic<int> completed{0};

    auto log_func = [&completed]() {
        ComponentLogger thread_logger("thread");
        for (int i = 0; i < 100; ++i) {
            thread_logger.info() << "Thread message " << i;
        }
        completed++;
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back(log_func);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(completed.load(), 4);
    EXPECT_EQ(sink_->count(LogLevel::INFO, "thread"), 400);
}

}  // namespace
}  // namespace oracle
