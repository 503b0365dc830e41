#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstdarg>

namespace http_wire {
namespace utils {

// 日志级别枚举
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// 日志级别转字符串
const char* log_level_to_string(LogLevel level);

// 字符串转日志级别（未知字符串返回INFO）
LogLevel string_to_log_level(const std::string& str);

// 严格解析日志级别
// return: true-识别成功，false-未知级别（level不变）
bool parse_log_level(const std::string& str, LogLevel* level);

class Logger {
public:
    // 获取单例
    static Logger& instance();

    // ========== 初始化与配置 ==========

    // 初始化日志系统
    // level: 日志级别字符串（DEBUG/INFO/WARN/ERROR）
    // file: 日志文件路径，为空则只输出到控制台
    // return: 0-成功，-1-打开文件失败
    int init(const std::string& level, const std::string& file = "");

    int init(LogLevel level, const std::string& file = "");

    void set_level(LogLevel level);
    LogLevel get_level() const;

    // 设置日志文件
    // file: 文件路径，为空关闭文件输出
    // return: 0-成功，-1-打开文件失败
    int set_file(const std::string& file);

    // 启用/禁用控制台输出
    void set_console_output(bool enabled);

    // 设置日志格式
    // format: 格式字符串，支持以下占位符:
    //   %time - 时间
    //   %level - 日志级别
    //   %module - 模块名
    //   %message - 日志消息
    //   %thread - 线程ID
    // 默认格式: "[%time] [%level] [%module] %message"
    void set_format(const std::string& format);

    // ========== 日志输出 ==========

    // 输出日志
    // level: 日志级别
    // module: 模块名
    // fmt: printf风格格式字符串
    void log(LogLevel level, const char* module, const char* fmt, ...);

    // 检查某级别是否启用
    bool is_level_enabled(LogLevel level) const;

    // ========== 刷新与关闭 ==========

    void flush();

    // 关闭文件输出，恢复未初始化状态
    void shutdown();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* module, const char* fmt, va_list args);
    void format_and_write(LogLevel level, const char* module, const char* message);
    void close_file_locked();

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ofstream file_;
    bool console_enabled_;
    std::string format_;
};

} // namespace utils
} // namespace http_wire

// ========== 便捷宏 ==========

#define HTTP_WIRE_LOG(level, module, fmt, ...) \
    do { \
        auto& logger_ = ::http_wire::utils::Logger::instance(); \
        if (logger_.is_level_enabled(level)) { \
            logger_.log(level, module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(module, fmt, ...) \
    HTTP_WIRE_LOG(::http_wire::utils::LogLevel::DEBUG, module, fmt, ##__VA_ARGS__)

#define LOG_INFO(module, fmt, ...) \
    HTTP_WIRE_LOG(::http_wire::utils::LogLevel::INFO, module, fmt, ##__VA_ARGS__)

#define LOG_WARN(module, fmt, ...) \
    HTTP_WIRE_LOG(::http_wire::utils::LogLevel::WARN, module, fmt, ##__VA_ARGS__)

#define LOG_ERROR(module, fmt, ...) \
    HTTP_WIRE_LOG(::http_wire::utils::LogLevel::ERROR, module, fmt, ##__VA_ARGS__)
