// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: http_parser.hpp
//  描述: HTTP/1.x行与头部分词工具（无状态，不涉及字节流）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "utils/error.hpp"
#include <string>

namespace http_wire {
namespace protocol {

/**
 * @brief 解析HTTP请求行（不含CRLF）
 *        按单个空格严格拆分为method/target/version三段
 * @param line 请求行
 * @param method 输出方法
 * @param target 输出请求目标
 * @param version 输出版本
 * @return 成功，或HTTP_MALFORMED_START_LINE
 */
utils::Result<void> parse_request_line(const std::string& line,
                                       std::string* method,
                                       std::string* target,
                                       std::string* version);

/**
 * @brief 解析HTTP状态行（不含CRLF）
 *        前两个空格严格拆分，剩余部分整体作为原因短语（可含空格，可为空）
 * @param line 状态行
 * @param version 输出版本
 * @param status_code 输出三位状态码
 * @param reason 输出原因短语
 * @return 成功，或HTTP_MALFORMED_START_LINE
 */
utils::Result<void> parse_status_line(const std::string& line,
                                      std::string* version,
                                      int* status_code,
                                      std::string* reason);

/**
 * @brief 解析单条头部行（不含CRLF），在第一个':'处拆分
 *        名称必须是token（不含空白），值两端的SP/HTAB被去除，大小写保持原样
 * @param line 头部行
 * @param header 输出头部
 * @return 成功，或HTTP_MALFORMED_HEADER（无':'、名称为空或含非token字符）
 */
utils::Result<void> parse_header(const std::string& line, HttpHeader* header);

/**
 * @brief 校验版本格式 HTTP/<digit>.<digit>
 */
bool is_valid_http_version(const std::string& version);

/**
 * @brief 解析content-length的值：非负十进制整数，不允许符号和空白，不允许溢出
 * @return 长度，或HTTP_INVALID_CONTENT_LENGTH
 */
utils::Result<size_t> parse_content_length(const std::string& value);

/**
 * @brief 根据头部决定body长度
 *        无content-length时为0；多个content-length取值必须一致
 * @return 长度，或HTTP_INVALID_CONTENT_LENGTH
 */
utils::Result<size_t> resolve_body_length(const HttpHeaders& headers);

} // namespace protocol
} // namespace http_wire

// 文件结束
