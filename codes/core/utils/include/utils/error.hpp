// =============================================================================
//  HTTP Wire Codec - Utils Module
//  文件: error.hpp
//  描述: 统一错误码定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace http_wire {
namespace utils {

// 统一错误码定义
enum class ErrorCode : int32_t {
    // 通用错误 (0-999)
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NULL_POINTER = 3,
    OUT_OF_MEMORY = 4,
    OPERATION_FAILED = 8,

    // 文件IO错误 (1000-1999)
    FILE_NOT_FOUND = 1000,
    FILE_WRITE_ERROR = 1003,

    // 配置错误 (2000-2999)
    CONFIG_PARSE_ERROR = 2000,
    CONFIG_INVALID_VALUE = 2002,
    CONFIG_INVALID_LOG_LEVEL = 2005,

    // 字节流错误 (3000-3999)
    STREAM_READ_ERROR = 3005,
    STREAM_WRITE_ERROR = 3006,
    STREAM_CLOSED = 3007,

    // HTTP编解码错误 (5000-5999)
    HTTP_MALFORMED_START_LINE = 5000,
    HTTP_MALFORMED_HEADER = 5001,
    HTTP_INVALID_CONTENT_LENGTH = 5002,
    HTTP_UNEXPECTED_EOF = 5003,
    HTTP_WRITE_FAILED = 5004,
    HTTP_LINE_TOO_LONG = 5010,
    HTTP_TOO_MANY_HEADERS = 5011,
    HTTP_BODY_TOO_LARGE = 5012,

    // Buffer错误 (6000-6999)
    BUFFER_CAPACITY_EXCEEDED = 6001,
};

// 错误码转字符串
const char* error_code_to_string(ErrorCode code);

// 错误码转描述
const char* error_code_to_description(ErrorCode code);

// 判断是否成功
inline bool is_success(ErrorCode code) {
    return code == ErrorCode::SUCCESS;
}

// 判断是否失败
inline bool is_error(ErrorCode code) {
    return code != ErrorCode::SUCCESS;
}

// 错误结果类（带错误码的返回值包装）
// 失败时value_保持默认构造状态，不会返回部分结果
template<typename T>
class Result {
public:
    // 成功构造
    explicit Result(const T& value)
        : code_(ErrorCode::SUCCESS)
        , value_(value)
        , has_value_(true)
    {}

    explicit Result(T&& value)
        : code_(ErrorCode::SUCCESS)
        , value_(std::move(value))
        , has_value_(true)
    {}

    // 失败构造
    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
        , value_()
        , has_value_(false)
    {}

    Result(ErrorCode code, const std::string& message)
        : code_(code)
        , message_(message)
        , value_()
        , has_value_(false)
    {}

    Result(ErrorCode code, std::string&& message)
        : code_(code)
        , message_(std::move(message))
        , value_()
        , has_value_(false)
    {}

    // 是否成功 - 两套命名风格都支持
    bool is_ok() const { return has_value_; }
    bool is_err() const { return !has_value_; }
    bool is_success() const { return has_value_; }
    bool is_error() const { return !has_value_; }

    // 获取值（必须确保成功）
    const T& value() const { return value_; }
    T& value() { return value_; }

    // 获取值，带默认值
    const T& value_or(const T& default_value) const {
        return has_value_ ? value_ : default_value;
    }

    // 获取错误码
    ErrorCode error_code() const { return code_; }

    // 获取错误消息
    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    T value_;
    bool has_value_;
};

// 特化void版本
template<>
class Result<void> {
public:
    Result() : code_(ErrorCode::SUCCESS) {}

    explicit Result(ErrorCode code)
        : code_(code)
        , message_(error_code_to_description(code))
    {}

    Result(ErrorCode code, const std::string& message)
        : code_(code)
        , message_(message)
    {}

    Result(ErrorCode code, std::string&& message)
        : code_(code)
        , message_(std::move(message))
    {}

    // 是否成功 - 两套命名风格都支持
    bool is_ok() const { return code_ == ErrorCode::SUCCESS; }
    bool is_err() const { return code_ != ErrorCode::SUCCESS; }
    bool is_success() const { return code_ == ErrorCode::SUCCESS; }
    bool is_error() const { return code_ != ErrorCode::SUCCESS; }

    ErrorCode error_code() const { return code_; }

    const std::string& error_message() const {
        return message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// 辅助函数创建成功结果
template<typename T>
Result<typename std::decay<T>::type> make_ok(T&& value) {
    return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

inline Result<void> make_ok() {
    return Result<void>();
}

// 辅助函数创建错误结果
template<typename T>
Result<T> make_err(ErrorCode code) {
    return Result<T>(code);
}

template<typename T>
Result<T> make_err(ErrorCode code, const std::string& message) {
    return Result<T>(code, message);
}

template<typename T>
Result<T> make_err(ErrorCode code, std::string&& message) {
    return Result<T>(code, std::move(message));
}

inline Result<void> make_err(ErrorCode code) {
    return Result<void>(code);
}

inline Result<void> make_err(ErrorCode code, const std::string& message) {
    return Result<void>(code, message);
}

inline Result<void> make_err(ErrorCode code, std::string&& message) {
    return Result<void>(code, std::move(message));
}

// 错误透传：将一个失败结果转换为另一种值类型的失败结果
template<typename T, typename U>
Result<T> forward_err(const Result<U>& other) {
    return Result<T>(other.error_code(), other.error_message());
}

} // namespace utils
} // namespace http_wire
