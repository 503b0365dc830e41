#pragma once

#include <cstdint>
#include <string>
#include <chrono>

namespace http_wire {
namespace utils {

// ========== 时间获取函数 ==========

// 获取当前时间戳（毫秒）
// return: 自Unix纪元以来的毫秒数
uint64_t get_current_time_ms();

// 获取单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// ========== 时间格式化 ==========

// 格式化当前时间为字符串
// format: strftime格式字符串，默认 "%Y-%m-%d %H:%M:%S"
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// 格式化指定时间戳为字符串（本地时区）
// timestamp_ms: 毫秒时间戳
std::string format_time(uint64_t timestamp_ms, const char* format = "%Y-%m-%d %H:%M:%S");

// ========== 时间工具类 ==========

// 计时器类，用于测量耗时
class StopWatch {
public:
    StopWatch();
    ~StopWatch() = default;

    void reset();

    uint64_t elapsed_ms() const;
    uint64_t elapsed_us() const;

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace utils
} // namespace http_wire
