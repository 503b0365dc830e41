// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: http_message.hpp
//  描述: HttpHeader、HttpRequest和HttpResponse类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace http_wire {
namespace protocol {

// ==================== HTTP头部 ====================
// 名称大小写不敏感，但按原样保存
struct HttpHeader {
    std::string name;
    std::string value;

    HttpHeader() = default;
    HttpHeader(const std::string& header_name, const std::string& header_value)
        : name(header_name)
        , value(header_value)
    {
    }
};

bool operator==(const HttpHeader& a, const HttpHeader& b);
bool operator!=(const HttpHeader& a, const HttpHeader& b);

// 按到达顺序保存，允许重复名称，不做合并
using HttpHeaders = std::vector<HttpHeader>;

/**
 * @brief 查找第一个同名头部（大小写不敏感）
 * @param headers 头部集合
 * @param name 头部名称
 * @param value 输出头部值（可为nullptr）
 * @return true找到，false未找到
 */
bool find_header(const HttpHeaders& headers, const std::string& name, std::string* value);

/**
 * @brief 统计同名头部个数（大小写不敏感）
 */
size_t count_headers(const HttpHeaders& headers, const std::string& name);

// ==================== HTTP请求类 ====================
class HttpRequest {
public:
    HttpRequest();

    /**
     * @brief 重置请求对象到初始状态
     */
    void reset();

    /**
     * @brief 追加请求头（不覆盖已有同名头部）
     */
    void add_header(const std::string& name, const std::string& value);

    void set_body(const uint8_t* data, size_t len);
    void set_body(const std::string& data);

    std::string body_string() const;

    // 公开属性
    std::string method;
    std::string target;
    std::string version;
    HttpHeaders headers;
    std::vector<uint8_t> body;
};

bool operator==(const HttpRequest& a, const HttpRequest& b);
bool operator!=(const HttpRequest& a, const HttpRequest& b);

// ==================== HTTP响应类 ====================
class HttpResponse {
public:
    HttpResponse();

    void reset();

    /**
     * @brief 设置状态码和原因短语
     * @param code HTTP状态码（三位数字）
     * @param reason 原因短语，可包含空格
     */
    void set_status(int code, const std::string& reason);

    void add_header(const std::string& name, const std::string& value);

    void set_body(const uint8_t* data, size_t len);
    void set_body(const std::string& data);

    std::string body_string() const;

    // 公开属性
    std::string version;
    int status_code;
    std::string reason;
    HttpHeaders headers;
    std::vector<uint8_t> body;
};

bool operator==(const HttpResponse& a, const HttpResponse& b);
bool operator!=(const HttpResponse& a, const HttpResponse& b);

} // namespace protocol
} // namespace http_wire

// 文件结束
