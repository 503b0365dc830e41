// =============================================================================
//  HTTP Wire Codec - Utils Module
//  文件: test_utils.cpp
//  描述: Utils模块单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "utils/error.hpp"
#include "utils/time.hpp"
#include "utils/buffer.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"

using namespace http_wire::utils;

namespace {

// 生成唯一的临时文件路径，析构时删除
class TempPath {
public:
    explicit TempPath(const std::string& suffix) {
        static int counter = 0;
        path_ = "/tmp/http_wire_test_" + std::to_string(getpid()) + "_" +
                std::to_string(counter++) + suffix;
    }

    ~TempPath() {
        unlink(path_.c_str());
    }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::string& path() const { return path_; }

    std::string read_all() const {
        std::ifstream file(path_);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

private:
    std::string path_;
};

} // namespace

// =============================================================================
// Error模块测试用例
// =============================================================================

TEST(ErrorTest, ErrorCodeToString) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_STREQ(error_code_to_string(ErrorCode::HTTP_MALFORMED_START_LINE), "HTTP_MALFORMED_START_LINE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::HTTP_MALFORMED_HEADER), "HTTP_MALFORMED_HEADER");
    EXPECT_STREQ(error_code_to_string(ErrorCode::HTTP_INVALID_CONTENT_LENGTH), "HTTP_INVALID_CONTENT_LENGTH");
    EXPECT_STREQ(error_code_to_string(ErrorCode::HTTP_UNEXPECTED_EOF), "HTTP_UNEXPECTED_EOF");
    EXPECT_STREQ(error_code_to_string(ErrorCode::HTTP_WRITE_FAILED), "HTTP_WRITE_FAILED");
    EXPECT_STREQ(error_code_to_string(ErrorCode::CONFIG_PARSE_ERROR), "CONFIG_PARSE_ERROR");
}

TEST(ErrorTest, ErrorCodeToDescription) {
    EXPECT_STREQ(error_code_to_description(ErrorCode::HTTP_UNEXPECTED_EOF),
                 "Stream closed before message was complete");
    EXPECT_NE(error_code_to_description(ErrorCode::UNKNOWN_ERROR), nullptr);
}

TEST(ErrorTest, IsSuccess) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::HTTP_MALFORMED_HEADER));
}

TEST(ErrorTest, IsError) {
    EXPECT_FALSE(is_error(ErrorCode::SUCCESS));
    EXPECT_TRUE(is_error(ErrorCode::HTTP_WRITE_FAILED));
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> r = make_ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.error_code(), ErrorCode::SUCCESS);
}

TEST(ErrorTest, ResultFromLvalue) {
    std::string text = "hello";
    Result<std::string> r = make_ok(text);
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "hello");
    EXPECT_EQ(text, "hello");
}

TEST(ErrorTest, ResultFailure) {
    Result<int> r = make_err<int>(ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(r.is_ok());
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(r.error_message(), "Invalid argument");
}

TEST(ErrorTest, ResultValueOr) {
    Result<int> r1 = make_ok(42);
    EXPECT_EQ(r1.value_or(100), 42);

    Result<int> r2 = make_err<int>(ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(r2.value_or(100), 100);
}

TEST(ErrorTest, ResultVoid) {
    Result<void> ok = make_ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> err = make_err(ErrorCode::HTTP_WRITE_FAILED, "broken pipe");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error_code(), ErrorCode::HTTP_WRITE_FAILED);
    EXPECT_EQ(err.error_message(), "broken pipe");
}

TEST(ErrorTest, ForwardErrKeepsCodeAndMessage) {
    Result<size_t> inner = make_err<size_t>(ErrorCode::HTTP_INVALID_CONTENT_LENGTH, "bad length");
    Result<std::string> outer = forward_err<std::string>(inner);
    EXPECT_TRUE(outer.is_err());
    EXPECT_EQ(outer.error_code(), ErrorCode::HTTP_INVALID_CONTENT_LENGTH);
    EXPECT_EQ(outer.error_message(), "bad length");

    Result<void> as_void = forward_err<void>(inner);
    EXPECT_EQ(as_void.error_code(), ErrorCode::HTTP_INVALID_CONTENT_LENGTH);
}

// =============================================================================
// Time模块测试用例
// =============================================================================

TEST(TimeTest, GetCurrentTimeMs) {
    uint64_t t1 = get_current_time_ms();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    uint64_t t2 = get_current_time_ms();
    EXPECT_GE(t2, t1 + 10);
}

TEST(TimeTest, GetMonotonicTimeMs) {
    uint64_t t1 = get_monotonic_time_ms();
    uint64_t t2 = get_monotonic_time_ms();
    EXPECT_GE(t2, t1);
}

TEST(TimeTest, StopWatchElapsed) {
    StopWatch sw;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_GE(sw.elapsed_ms(), 20u);
    EXPECT_GE(sw.elapsed_us(), 20000u);
}

TEST(TimeTest, StopWatchReset) {
    StopWatch sw;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sw.reset();
    EXPECT_LT(sw.elapsed_ms(), 20u);
}

TEST(TimeTest, FormatCurrentTime) {
    std::string s = format_current_time("%Y");
    EXPECT_EQ(s.size(), 4u);
}

TEST(TimeTest, FormatTime) {
    // 格式与时区无关的部分
    std::string s = format_time(get_current_time_ms(), "%Y-%m-%d");
    EXPECT_EQ(s.size(), 10u);
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[7], '-');
}

// =============================================================================
// Buffer模块测试用例
// =============================================================================

TEST(BufferTest, CreateDefault) {
    Buffer buf;
    EXPECT_EQ(buf.readable_bytes(), 0u);
    EXPECT_EQ(buf.capacity(), Buffer::DEFAULT_INITIAL_CAPACITY);
}

TEST(BufferTest, CreateMinCapacity) {
    Buffer buf(10);
    EXPECT_EQ(buf.capacity(), Buffer::MIN_CAPACITY);
}

TEST(BufferTest, WriteReadBytes) {
    Buffer buf;
    const char* data = "hello";
    EXPECT_EQ(buf.write(data, 5), 5u);
    EXPECT_EQ(buf.readable_bytes(), 5u);

    uint8_t out[5];
    EXPECT_EQ(buf.read(out, 5), 5u);
    EXPECT_EQ(std::memcmp(out, "hello", 5), 0);
    EXPECT_EQ(buf.readable_bytes(), 0u);
}

TEST(BufferTest, PeekDoesNotMovePointer) {
    Buffer buf;
    buf.write(std::string("abc"));

    uint8_t out[3];
    EXPECT_EQ(buf.peek(out, 3), 3u);
    EXPECT_EQ(buf.readable_bytes(), 3u);
}

TEST(BufferTest, ReadToString) {
    Buffer buf;
    buf.write(std::string("GET / HTTP/1.1"));

    std::string out;
    EXPECT_EQ(buf.read_to_string(&out, 3), 3u);
    EXPECT_EQ(out, "GET");
    EXPECT_EQ(buf.read_to_string(&out), 11u);
    EXPECT_EQ(out, " / HTTP/1.1");
}

TEST(BufferTest, FindCrlf) {
    Buffer buf;
    buf.write(std::string("abc\r\ndef\r\n"));
    EXPECT_EQ(buf.find_crlf(), 3u);
    EXPECT_EQ(buf.find_crlf(4), 8u);
    buf.skip(5);
    EXPECT_EQ(buf.find_crlf(), 3u);
}

TEST(BufferTest, FindCrlfMissing) {
    Buffer buf;
    buf.write(std::string("abc\r"));
    EXPECT_EQ(buf.find_crlf(), Buffer::npos);
    buf.write(std::string("\n"));
    EXPECT_EQ(buf.find_crlf(3), 3u);
}

TEST(BufferTest, SkipAll) {
    Buffer buf;
    buf.write(std::string("data"));
    buf.skip(100);
    EXPECT_EQ(buf.readable_bytes(), 0u);
}

TEST(BufferTest, Compact) {
    Buffer buf(Buffer::MIN_CAPACITY);
    std::string chunk(600, 'x');
    buf.write(chunk);
    buf.skip(500);
    // 压缩后空间足够，无需扩容
    buf.write(chunk);
    EXPECT_EQ(buf.readable_bytes(), 700u);
    EXPECT_EQ(buf.capacity(), Buffer::MIN_CAPACITY);
}

TEST(BufferTest, GrowsWhenFull) {
    Buffer buf(Buffer::MIN_CAPACITY);
    std::string chunk(Buffer::MIN_CAPACITY + 1, 'y');
    EXPECT_EQ(buf.write(chunk), chunk.size());
    EXPECT_GE(buf.capacity(), chunk.size());
}

TEST(BufferTest, ReserveCommit) {
    Buffer buf;
    uint8_t* p = buf.reserve(4);
    ASSERT_NE(p, nullptr);
    std::memcpy(p, "wire", 4);
    buf.commit(4);

    std::string out;
    buf.read_to_string(&out);
    EXPECT_EQ(out, "wire");
}

TEST(BufferTest, ReserveBeyondMaxFails) {
    Buffer buf;
    EXPECT_EQ(buf.reserve(Buffer::MAX_CAPACITY + 1), nullptr);
}

TEST(BufferTest, MoveConstruct) {
    Buffer a;
    a.write(std::string("xyz"));
    Buffer b(std::move(a));
    EXPECT_EQ(b.readable_bytes(), 3u);
    EXPECT_EQ(a.readable_bytes(), 0u);
}

// =============================================================================
// Logger模块测试用例
// =============================================================================

TEST(LoggerTest, Init) {
    Logger& logger = Logger::instance();
    EXPECT_EQ(logger.init(LogLevel::INFO, ""), 0);
    EXPECT_EQ(logger.get_level(), LogLevel::INFO);
}

TEST(LoggerTest, SetLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    EXPECT_FALSE(logger.is_level_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_level_enabled(LogLevel::ERROR));
    logger.set_level(LogLevel::INFO);
}

TEST(LoggerTest, StringToLogLevel) {
    EXPECT_EQ(string_to_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(string_to_log_level("WARN"), LogLevel::WARN);
    EXPECT_EQ(string_to_log_level("verbose"), LogLevel::INFO);
}

TEST(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("ERROR", &level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("error", &level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST(LoggerTest, LogLevelToString) {
    EXPECT_STREQ(log_level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LogLevel::ERROR), "ERROR");
}

TEST(LoggerTest, WritesFormattedLineToFile) {
    TempPath log_file(".log");
    Logger& logger = Logger::instance();
    ASSERT_EQ(logger.init(LogLevel::DEBUG, log_file.path()), 0);
    logger.set_console_output(false);
    logger.set_format("[%level] [%module] %message");

    LOG_INFO("Reader", "parsed %d headers", 3);
    LOG_DEBUG("Reader", "%s", "debug line");
    logger.flush();

    std::string content = log_file.read_all();
    EXPECT_NE(content.find("[INFO] [Reader] parsed 3 headers\n"), std::string::npos);
    EXPECT_NE(content.find("[DEBUG] [Reader] debug line\n"), std::string::npos);

    logger.shutdown();
    logger.set_format("[%time] [%level] [%module] %message");
    logger.set_console_output(true);
    logger.set_level(LogLevel::INFO);
}

TEST(LoggerTest, FiltersBelowLevel) {
    TempPath log_file(".log");
    Logger& logger = Logger::instance();
    ASSERT_EQ(logger.init(LogLevel::WARN, log_file.path()), 0);
    logger.set_console_output(false);

    LOG_INFO("Reader", "hidden");
    LOG_ERROR("Reader", "visible");
    logger.flush();

    std::string content = log_file.read_all();
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible"), std::string::npos);

    logger.shutdown();
    logger.set_console_output(true);
    logger.set_level(LogLevel::INFO);
}

TEST(LoggerTest, InitWithUnwritableFileFails) {
    Logger& logger = Logger::instance();
    EXPECT_EQ(logger.init(LogLevel::INFO, "/nonexistent_dir_http_wire/x.log"), -1);
    logger.shutdown();
}

// =============================================================================
// Config模块测试用例
// =============================================================================

TEST(ConfigTest, CreateDefault) {
    Config config;
    EXPECT_EQ(config.get_codec().max_line_length, 8192u);
    EXPECT_EQ(config.get_codec().max_headers, 100u);
    EXPECT_EQ(config.get_codec().max_body_size, 64u * 1024 * 1024);
    EXPECT_EQ(config.get_logging().level, "INFO");
    EXPECT_TRUE(config.get_logging().console_output);
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(ConfigTest, LoadFromStringValid) {
    Config config;
    auto ret = config.load_from_string(R"({
        "codec": {"max_line_length": 1024, "max_headers": 8, "max_body_size": 4096},
        "logging": {"level": "DEBUG", "file": "/tmp/wire.log", "console_output": false}
    })");
    ASSERT_TRUE(ret.is_ok()) << ret.error_message();
    EXPECT_EQ(config.get_codec().max_line_length, 1024u);
    EXPECT_EQ(config.get_codec().max_headers, 8u);
    EXPECT_EQ(config.get_codec().max_body_size, 4096u);
    EXPECT_EQ(config.get_logging().level, "DEBUG");
    EXPECT_EQ(config.get_logging().file, "/tmp/wire.log");
    EXPECT_FALSE(config.get_logging().console_output);
}

TEST(ConfigTest, LoadFromStringPartialKeepsDefaults) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"codec": {"max_headers": 5}})").is_ok());
    EXPECT_EQ(config.get_codec().max_headers, 5u);
    EXPECT_EQ(config.get_codec().max_line_length, 8192u);
    EXPECT_EQ(config.get_logging().level, "INFO");
}

TEST(ConfigTest, LoadFromStringInvalidJson) {
    Config config;
    auto ret = config.load_from_string("{ not json");
    EXPECT_TRUE(ret.is_err());
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST(ConfigTest, LoadFromStringWrongType) {
    Config config;
    auto ret = config.load_from_string(R"({"codec": {"max_headers": "many"}})");
    EXPECT_TRUE(ret.is_err());
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    // 失败时不修改原配置
    EXPECT_EQ(config.get_codec().max_headers, 100u);
}

TEST(ConfigTest, LoadFromStringNegativeLimit) {
    Config config;
    auto ret = config.load_from_string(R"({"codec": {"max_line_length": 64, "max_headers": -1}})");
    EXPECT_TRUE(ret.is_err());
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(config.get_codec().max_line_length, 8192u);
    EXPECT_EQ(config.get_codec().max_headers, 100u);

    ret = config.load_from_string(R"({"codec": {"max_body_size": -4096}})");
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(config.get_codec().max_body_size, 64u * 1024 * 1024);
}

TEST(ConfigTest, LoadFromStringLimitOutOfRange) {
    Config config;
    auto ret = config.load_from_string(R"({"codec": {"max_line_length": 4294967296}})");
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(config.get_codec().max_line_length, 8192u);

    ret = config.load_from_string(R"({"codec": {"max_headers": 2.5}})");
    EXPECT_EQ(ret.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(ConfigTest, LoadFromFile) {
    TempPath config_file(".json");
    {
        std::ofstream out(config_file.path());
        out << R"({"logging": {"level": "WARN"}})";
    }

    Config config;
    ASSERT_TRUE(config.load_from_file(config_file.path()).is_ok());
    EXPECT_EQ(config.get_logging().level, "WARN");
}

TEST(ConfigTest, LoadFromMissingFile) {
    Config config;
    auto ret = config.load_from_file("/nonexistent/http_wire.json");
    EXPECT_EQ(ret.error_code(), ErrorCode::FILE_NOT_FOUND);
}

TEST(ConfigTest, ValidateZeroLimit) {
    Config config;
    CodecConfig codec;
    codec.max_line_length = 0;
    config.set_codec(codec);
    EXPECT_EQ(config.validate().error_code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST(ConfigTest, ValidateInvalidLogLevel) {
    Config config;
    LoggingConfig logging;
    logging.level = "TRACE";
    config.set_logging(logging);
    EXPECT_EQ(config.validate().error_code(), ErrorCode::CONFIG_INVALID_LOG_LEVEL);
}

TEST(ConfigTest, ToJsonStringRoundTrip) {
    Config config;
    CodecConfig codec;
    codec.max_headers = 42;
    config.set_codec(codec);

    auto json = config.to_json_string();
    ASSERT_TRUE(json.is_ok());

    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_string(json.value()).is_ok());
    EXPECT_EQ(reloaded.get_codec().max_headers, 42u);
    EXPECT_EQ(reloaded.get_logging().level, "INFO");
}

TEST(ConfigTest, ApplyLoggingConfig) {
    TempPath log_file(".log");
    LoggingConfig logging;
    logging.level = "ERROR";
    logging.file = log_file.path();
    logging.console_output = false;

    ASSERT_TRUE(apply_logging_config(logging).is_ok());
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::ERROR);

    LOG_ERROR("Config", "applied");
    Logger::instance().flush();
    EXPECT_NE(log_file.read_all().find("applied"), std::string::npos);

    Logger::instance().shutdown();
    Logger::instance().set_console_output(true);
    Logger::instance().set_level(LogLevel::INFO);
}

TEST(ConfigTest, ApplyLoggingConfigRejectsUnknownLevel) {
    LoggingConfig logging;
    logging.level = "LOUD";
    EXPECT_EQ(apply_logging_config(logging).error_code(), ErrorCode::CONFIG_INVALID_LOG_LEVEL);
}
