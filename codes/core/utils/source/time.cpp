#include "utils/time.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace http_wire {
namespace utils {

namespace {

std::string format_time_t(std::time_t time, const char* format) {
    std::tm tm;
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace

uint64_t get_current_time_ms() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

uint64_t get_monotonic_time_ms() {
    auto duration = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_current_time(const char* format) {
    return format_time_t(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()),
                         format);
}

std::string format_time(uint64_t timestamp_ms, const char* format) {
    return format_time_t(static_cast<std::time_t>(timestamp_ms / 1000), format);
}

// StopWatch implementation
StopWatch::StopWatch() {
    reset();
}

void StopWatch::reset() {
    start_ = std::chrono::steady_clock::now();
}

uint64_t StopWatch::elapsed_ms() const {
    auto duration = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

uint64_t StopWatch::elapsed_us() const {
    auto duration = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration_cast<std::chrono::microseconds>(duration).count();
}

} // namespace utils
} // namespace http_wire
