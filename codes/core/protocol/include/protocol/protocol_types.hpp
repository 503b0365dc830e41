// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: protocol_types.hpp
//  描述: Protocol模块类型定义、枚举、常量
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>

namespace http_wire {
namespace protocol {

// ==================== HTTP解析相关常量 ====================
constexpr size_t MAX_LINE_LEN = 8192;
constexpr size_t MAX_HEADERS = 100;
constexpr size_t MAX_BODY_SIZE = 64 * 1024 * 1024;

// ==================== 报文格式常量 ====================
constexpr char CRLF[] = "\r\n";
constexpr char HEADER_SEPARATOR[] = ": ";
constexpr char HTTP_VERSION_PREFIX[] = "HTTP/";
constexpr char HEADER_CONTENT_LENGTH[] = "content-length";

// ==================== HTTP/1.x解析状态枚举 ====================
enum class Http1ParseState {
    EXPECT_START_LINE = 0,
    EXPECT_HEADERS = 1,
    EXPECT_BODY = 2,
    EXPECT_COMPLETE = 3
};

const char* parse_state_to_string(Http1ParseState state);

// ==================== 解析资源限制 ====================
struct CodecLimits {
    size_t max_line_length;   // 单行最大长度（不含CRLF）
    size_t max_headers;       // 单个报文最大头部数
    size_t max_body_size;     // 最大body字节数

    CodecLimits()
        : max_line_length(MAX_LINE_LEN)
        , max_headers(MAX_HEADERS)
        , max_body_size(MAX_BODY_SIZE)
    {
    }
};

} // namespace protocol
} // namespace http_wire

// 文件结束
