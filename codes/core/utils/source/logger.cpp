#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cstdio>
#include <iostream>
#include <sstream>
#include <thread>

namespace http_wire {
namespace utils {

namespace {

constexpr size_t LOG_MESSAGE_MAX_LEN = 4096;

// 替换第一个占位符
void replace_placeholder(std::string* text, const char* placeholder, const std::string& value) {
    size_t pos = text->find(placeholder);
    if (pos != std::string::npos) {
        text->replace(pos, std::char_traits<char>::length(placeholder), value);
    }
}

} // namespace

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& str, LogLevel* level) {
    if (str == "DEBUG") { *level = LogLevel::DEBUG; return true; }
    if (str == "INFO")  { *level = LogLevel::INFO;  return true; }
    if (str == "WARN")  { *level = LogLevel::WARN;  return true; }
    if (str == "ERROR") { *level = LogLevel::ERROR; return true; }
    return false;
}

LogLevel string_to_log_level(const std::string& str) {
    LogLevel level = LogLevel::INFO;  // 默认INFO
    parse_log_level(str, &level);
    return level;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , console_enabled_(true)
    , format_("[%time] [%level] [%module] %message")
{
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

int Logger::init(const std::string& level, const std::string& file) {
    return init(string_to_log_level(level), file);
}

int Logger::init(LogLevel level, const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    close_file_locked();
    level_ = level;

    if (!file.empty()) {
        file_.open(file, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            return -1;
        }
    }

    return 0;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

int Logger::set_file(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    close_file_locked();
    if (file.empty()) {
        return 0;
    }

    file_.open(file, std::ios::out | std::ios::app);
    return file_.is_open() ? 0 : -1;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::set_format(const std::string& format) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

bool Logger::is_level_enabled(LogLevel level) const {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load());
}

void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
    if (!is_level_enabled(level)) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    logv(level, module, fmt, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* module, const char* fmt, va_list args) {
    char buffer[LOG_MESSAGE_MAX_LEN];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::lock_guard<std::mutex> lock(mutex_);
    format_and_write(level, module, buffer);
}

void Logger::format_and_write(LogLevel level, const char* module, const char* message) {
    std::string result = format_;

    replace_placeholder(&result, "%time", format_current_time("%Y-%m-%d %H:%M:%S"));
    replace_placeholder(&result, "%level", log_level_to_string(level));
    replace_placeholder(&result, "%module", module ? module : "unknown");
    if (result.find("%thread") != std::string::npos) {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        replace_placeholder(&result, "%thread", oss.str());
    }
    // %message最后替换，避免消息内容中的占位符被再次展开
    replace_placeholder(&result, "%message", message);

    result += "\n";

    if (console_enabled_) {
        if (level >= LogLevel::WARN) {
            std::cerr << result;
        } else {
            std::cout << result;
        }
    }

    if (file_.is_open()) {
        file_ << result;
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_file_locked();
}

void Logger::close_file_locked() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace utils
} // namespace http_wire
