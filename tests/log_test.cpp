//! # Logger Unit Tests
//!
//! Tests for the logging library: LogFilter parsing, line formatting,
//! ConsoleSink and FileSink output, the Logger singleton and macros,
//! command-line option parsing, and thread safety.

#include "bintag/log/log.hpp"
#include "bintag/tag/codec.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace bintag::log;
namespace fs = std::filesystem;

namespace {

LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

/// Owns argv storage for parse_log_options.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }

    char** argv() {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("codec=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "codec"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "codec"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "codec"));

    // Unmatched modules use the default (Info)
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("codec=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "codec"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("codec");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "codec"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("codec=trace,cli=info,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "codec"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("codec=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, ReparseReplacesModules) {
    filter.parse("codec=trace");
    filter.parse("cli=debug");
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "codec"));
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "cli"));
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevelCaseInsensitive) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
}

// ============================================================================
// Formatting and Sinks
// ============================================================================

TEST(LogFormatTest, TextLine) {
    auto line = format_text_line(make_record(LogLevel::Info, "cli", "hello"));
    EXPECT_NE(line.find("INFO "), std::string::npos);
    EXPECT_NE(line.find("[cli] hello\n"), std::string::npos);
    EXPECT_EQ(line[2], ':');
}

TEST(LogFormatTest, JsonLineEscapesSpecialCharacters) {
    auto line = format_json_line(
        make_record(LogLevel::Error, "codec", "line1\nline2\t\"quote\"\\\x01"));
    EXPECT_EQ(line, "{\"ts\":1234567890,\"level\":\"ERROR\",\"module\":\"codec\","
                    "\"msg\":\"line1\\nline2\\t\\\"quote\\\"\\\\\\u0001\"}\n");
}

TEST(ConsoleSinkTest, WritesToGivenStream) {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.write(make_record(LogLevel::Warn, "cli", "careful"));
    sink.flush();

    EXPECT_NE(out.str().find("WARN"), std::string::npos);
    EXPECT_NE(out.str().find("[cli] careful"), std::string::npos);
    EXPECT_EQ(out.str().find("\033["), std::string::npos);
}

TEST(ConsoleSinkTest, JsonFormat) {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.set_format(LogFormat::JSON);
    sink.write(make_record(LogLevel::Debug, "codec", "decoded"));

    EXPECT_EQ(out.str(),
              "{\"ts\":1234567890,\"level\":\"DEBUG\",\"module\":\"codec\",\"msg\":\"decoded\"}\n");
}

TEST(NullSinkTest, DiscardsMessages) {
    NullSink sink;
    sink.write(make_record(LogLevel::Fatal, "cli", "discarded"));
    sink.flush();
}

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() /
                    (std::string("bintag_log_test_") +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log");
        std::error_code ec;
        fs::remove(temp_file, ec);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(temp_file, ec);
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "cli", "file sink test"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[cli] file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "cli", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "cli", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "codec", "error occurred"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"error occurred\""), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& records) : records_(records) {}

    void write(const LogRecord& record) override {
        records_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& records_;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }

    std::vector<CaptureSink::Entry> records;
};

TEST_F(LoggerTest, MacrosFormatStreamExpressions) {
    BINTAG_LOG_INFO("cli", "wrote " << 42 << " bytes");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].module, "cli");
    EXPECT_EQ(records[0].message, "wrote 42 bytes");
}

TEST_F(LoggerTest, LevelGatesMessages) {
    Logger::instance().set_level(LogLevel::Warn);
    BINTAG_LOG_DEBUG("cli", "hidden");
    BINTAG_LOG_WARN("cli", "shown");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "shown");
}

TEST_F(LoggerTest, FilterSelectsModules) {
    Logger::instance().set_filter("codec=trace,*=off");
    BINTAG_LOG_ERROR("cli", "hidden");
    BINTAG_LOG_TRACE("codec", "shown");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "codec");
}

TEST_F(LoggerTest, CodecTracesEncodeAndDecode) {
    bintag::tag::BinaryTag tag;
    ASSERT_TRUE(bintag::is_ok(tag.set_int("n", 1)));
    auto bytes = bintag::tag::encode_to_bytes(tag);
    ASSERT_TRUE(bintag::is_ok(bytes));
    auto decoded = bintag::tag::decode_root_bytes(bintag::unwrap(bytes));
    ASSERT_TRUE(bintag::is_ok(decoded));

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].module, "codec");
    EXPECT_EQ(records[0].level, LogLevel::Trace);
    EXPECT_NE(records[0].message.find("encoded TAG"), std::string::npos);
    EXPECT_NE(records[1].message.find("decoded TAG"), std::string::npos);
}

TEST_F(LoggerTest, CodecReportsFailuresAtDebug) {
    std::vector<uint8_t> bytes{0x10};
    auto decoded = bintag::tag::decode_bytes(bytes);
    ASSERT_TRUE(bintag::is_err(decoded));

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Debug);
    EXPECT_NE(records[0].message.find("UnknownDiscriminant"), std::string::npos);
}

TEST_F(LoggerTest, NoSinksMeansNothingLogs) {
    Logger::instance().clear_sinks();
    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Fatal, "cli"));
    BINTAG_LOG_FATAL("cli", "dropped");
    EXPECT_TRUE(records.empty());
}

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                BINTAG_LOG_INFO("cli", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records.size()), num_threads * messages_per_thread);
}

TEST_F(LoggerTest, LevelReadsWhileReconfiguring) {
    Logger::instance().set_level(LogLevel::Debug);
    std::atomic<bool> done{false};
    std::atomic<int> unexpected{0};

    std::thread reader([&]() {
        while (!done.load()) {
            auto level = Logger::instance().level();
            if (level != LogLevel::Debug && level != LogLevel::Warn) {
                unexpected++;
            }
        }
    });

    for (int i = 0; i < 1000; i++) {
        Logger::instance().set_level(i % 2 == 0 ? LogLevel::Warn : LogLevel::Debug);
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(unexpected.load(), 0);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("BINTAG_LOG");
    }

    void TearDown() override {
        unsetenv("BINTAG_LOG");
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    Args args{"bintag", "dump", "file.bin"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    Args args{"bintag", "--log-level=debug", "--log-filter=codec=trace",
              "--log-file=/tmp/bintag.log", "--log-format=json", "demo", "x.bin"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "codec=trace");
    EXPECT_EQ(config.log_file, "/tmp/bintag.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    Args one{"bintag", "-v"};
    EXPECT_EQ(parse_log_options(one.argc(), one.argv()).level, LogLevel::Info);

    Args two{"bintag", "-vv"};
    EXPECT_EQ(parse_log_options(two.argc(), two.argv()).level, LogLevel::Debug);

    Args three{"bintag", "-vvv"};
    EXPECT_EQ(parse_log_options(three.argc(), three.argv()).level, LogLevel::Trace);

    Args verbose{"bintag", "--verbose"};
    EXPECT_EQ(parse_log_options(verbose.argc(), verbose.argv()).level, LogLevel::Info);

    Args quiet{"bintag", "-q"};
    EXPECT_EQ(parse_log_options(quiet.argc(), quiet.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    Args args{"bintag", "-vvv", "--log-level=error"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("BINTAG_LOG", "debug", 1);
    Args args{"bintag"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("BINTAG_LOG", "codec=trace,*=warn", 1);
    Args args{"bintag"};
    auto config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.filter_spec, "codec=trace,*=warn");
}

TEST_F(LogOptionsTest, CommandLineBeatsEnvironment) {
    setenv("BINTAG_LOG", "trace", 1);
    Args args{"bintag", "-q"};
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Error);
}

TEST(IsLogOptionTest, RecognizesLoggingArguments) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("--log-filter=codec"));
    EXPECT_TRUE(is_log_option("--log-file=x.log"));
    EXPECT_TRUE(is_log_option("--log-format=json"));
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--verbose"));

    EXPECT_FALSE(is_log_option("demo"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("-h"));
    EXPECT_FALSE(is_log_option("-vx"));
    EXPECT_FALSE(is_log_option("file.bin"));
}
