//! # Logger Unit Tests
//!
//! Tests for the eden logging system: LogFilter parsing, formatting,
//! FileSink I/O, environment configuration, and the lexer's log output.

#include "eden/lexer/lexer.hpp"
#include "eden/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace eden::log;
namespace fs = std::filesystem;

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("lexer=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "lexer"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "reader"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "reader"));
    EXPECT_EQ(filter.min_level(), LogLevel::Debug);
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("lexer");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "reader"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "reader"));
}

TEST_F(LogFilterTest, ReparseClearsModules) {
    filter.parse("lexer=trace");
    filter.parse("reader=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "reader"));
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

auto make_record(LogLevel level, std::string message) -> LogRecord {
    return LogRecord{level, "lexer", std::move(message), __FILE__, __LINE__, 1234};
}

} // namespace

TEST(LogFormatTest, JsonEscapesMessage) {
    auto json = format_json(make_record(LogLevel::Warn, "say \"hi\"\n"));
    EXPECT_EQ(json, "{\"ts\":1234,\"level\":\"WARN\",\"module\":\"lexer\","
                    "\"msg\":\"say \\\"hi\\\"\\n\"}");
}

TEST(LogFormatTest, TextHasLevelModuleAndMessage) {
    auto text = format_text(make_record(LogLevel::Info, "hello"));
    EXPECT_NE(text.find("INFO "), std::string::npos);
    EXPECT_NE(text.find("[lexer] hello"), std::string::npos);
}

// ============================================================================
// FileSink
// ============================================================================

TEST(FileSinkTest, WritesOneLinePerRecord) {
    auto path = fs::temp_directory_path() / "eden_file_sink_test.log";
    fs::remove(path);

    {
        FileSink sink(path.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "first"));
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "second"));
    }

    std::ifstream in(path);
    std::string line1;
    std::string line2;
    std::getline(in, line1);
    std::getline(in, line2);

    EXPECT_NE(line1.find("[lexer] first"), std::string::npos);
    EXPECT_EQ(line2, "{\"ts\":1234,\"level\":\"ERROR\",\"module\":\"lexer\",\"msg\":\"second\"}");

    in.close();
    fs::remove(path);
}

// ============================================================================
// Environment Configuration
// ============================================================================

class LogEnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear();
    }
    void TearDown() override {
        clear();
    }

    static void clear() {
        unsetenv("EDEN_LOG");
        unsetenv("EDEN_LOG_FILE");
        unsetenv("EDEN_LOG_FORMAT");
    }
};

TEST_F(LogEnvTest, DefaultsToWarn) {
    auto config = config_from_env();
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogEnvTest, LevelName) {
    setenv("EDEN_LOG", "debug", 1);
    auto config = config_from_env();
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST_F(LogEnvTest, FilterSpec) {
    setenv("EDEN_LOG", "lexer=trace,*=error", 1);
    auto config = config_from_env();
    EXPECT_EQ(config.filter_spec, "lexer=trace,*=error");
}

TEST_F(LogEnvTest, FileAndFormat) {
    setenv("EDEN_LOG_FILE", "/tmp/eden.log", 1);
    setenv("EDEN_LOG_FORMAT", "json", 1);
    auto config = config_from_env();
    EXPECT_EQ(config.log_file, "/tmp/eden.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

// ============================================================================
// Logger
// ============================================================================

namespace {

/// Sink that keeps every record it receives.
class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<LogRecord>> records)
        : records_(std::move(records)) {}

    void write(const LogRecord& record) override {
        records_->push_back(record);
    }
    void flush() override {}

private:
    std::shared_ptr<std::vector<LogRecord>> records_;
};

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<LogRecord>> records_ = std::make_shared<std::vector<LogRecord>>();

    void capture(LogLevel level, std::string filter = "") {
        LogConfig config;
        config.level = level;
        config.filter_spec = std::move(filter);
        config.console = false;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(records_));
    }

    void TearDown() override {
        LogConfig quiet;
        quiet.console = false;
        Logger::init(quiet);
    }

    auto messages() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& record : *records_) {
            out.push_back(record.message);
        }
        return out;
    }
};

TEST_F(LoggerTest, LevelGate) {
    capture(LogLevel::Info);

    EDEN_LOG_DEBUG("lexer", "hidden");
    EDEN_LOG_INFO("lexer", "shown " << 42);
    EDEN_LOG_ERROR("reader", "also shown");

    ASSERT_EQ(records_->size(), 2u);
    EXPECT_EQ((*records_)[0].message, "shown 42");
    EXPECT_EQ((*records_)[0].level, LogLevel::Info);
    EXPECT_EQ((*records_)[1].module, "reader");
}

TEST_F(LoggerTest, ModuleFilterOverridesLevel) {
    capture(LogLevel::Error, "lexer=trace");

    EDEN_LOG_TRACE("lexer", "lexer trace");
    EDEN_LOG_WARN("reader", "reader warn");

    EXPECT_EQ(messages(), std::vector<std::string>{"lexer trace"});
}

TEST_F(LoggerTest, LexerTracesTokens) {
    capture(LogLevel::Warn, "lexer=trace");

    auto result = eden::lexer::tokenize("[nil]");
    ASSERT_TRUE(eden::is_ok(result));

    auto logged = messages();
    EXPECT_NE(std::find(logged.begin(), logged.end(), "Token nil(\"nil\")"), logged.end());
    EXPECT_NE(std::find(logged.begin(), logged.end(), "Produced 3 tokens"), logged.end());
}

TEST_F(LoggerTest, LexerLogsErrors) {
    capture(LogLevel::Debug);

    auto result = eden::lexer::tokenize("@");
    ASSERT_TRUE(eden::is_err(result));

    auto logged = messages();
    EXPECT_NE(std::find(logged.begin(), logged.end(),
                        "Tokenizing failed: unexpected input '@' at 1:0"),
              logged.end());
}

TEST_F(LoggerTest, NullSinkDiscards) {
    capture(LogLevel::Trace);
    Logger::instance().clear_sinks();
    Logger::instance().add_sink(std::make_unique<NullSink>());

    EDEN_LOG_INFO("lexer", "dropped");
    EXPECT_TRUE(records_->empty());
}
