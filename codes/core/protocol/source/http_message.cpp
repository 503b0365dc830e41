// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: http_message.cpp
//  描述: HttpHeader、HttpRequest和HttpResponse实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_message.hpp"
#include "protocol/protocol_utils.hpp"
#include <algorithm>

namespace http_wire {
namespace protocol {

// ==================== HttpHeader实现 ====================

bool operator==(const HttpHeader& a, const HttpHeader& b) {
    return a.name == b.name && a.value == b.value;
}

bool operator!=(const HttpHeader& a, const HttpHeader& b) {
    return !(a == b);
}

bool find_header(const HttpHeaders& headers, const std::string& name, std::string* value) {
    for (const auto& header : headers) {
        if (EqualsIgnoreCase(header.name, name)) {
            if (value) {
                *value = header.value;
            }
            return true;
        }
    }
    return false;
}

size_t count_headers(const HttpHeaders& headers, const std::string& name) {
    return static_cast<size_t>(std::count_if(headers.begin(), headers.end(),
        [&name](const HttpHeader& header) { return EqualsIgnoreCase(header.name, name); }));
}

// ==================== HttpRequest实现 ====================

HttpRequest::HttpRequest()
    : method()
    , target()
    , version("HTTP/1.1")
    , headers()
    , body()
{
}

void HttpRequest::reset() {
    method.clear();
    target.clear();
    version = "HTTP/1.1";
    headers.clear();
    body.clear();
}

void HttpRequest::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
}

void HttpRequest::set_body(const uint8_t* data, size_t len) {
    if (data == nullptr) {
        body.clear();
        return;
    }
    body.assign(data, data + len);
}

void HttpRequest::set_body(const std::string& data) {
    body.assign(data.begin(), data.end());
}

std::string HttpRequest::body_string() const {
    return std::string(body.begin(), body.end());
}

bool operator==(const HttpRequest& a, const HttpRequest& b) {
    return a.method == b.method &&
           a.target == b.target &&
           a.version == b.version &&
           a.headers == b.headers &&
           a.body == b.body;
}

bool operator!=(const HttpRequest& a, const HttpRequest& b) {
    return !(a == b);
}

// ==================== HttpResponse实现 ====================

HttpResponse::HttpResponse()
    : version("HTTP/1.1")
    , status_code(200)
    , reason("OK")
    , headers()
    , body()
{
}

void HttpResponse::reset() {
    version = "HTTP/1.1";
    status_code = 200;
    reason = "OK";
    headers.clear();
    body.clear();
}

void HttpResponse::set_status(int code, const std::string& text) {
    status_code = code;
    reason = text;
}

void HttpResponse::add_header(const std::string& name, const std::string& value) {
    headers.emplace_back(name, value);
}

void HttpResponse::set_body(const uint8_t* data, size_t len) {
    if (data == nullptr) {
        body.clear();
        return;
    }
    body.assign(data, data + len);
}

void HttpResponse::set_body(const std::string& data) {
    body.assign(data.begin(), data.end());
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

bool operator==(const HttpResponse& a, const HttpResponse& b) {
    return a.version == b.version &&
           a.status_code == b.status_code &&
           a.reason == b.reason &&
           a.headers == b.headers &&
           a.body == b.body;
}

bool operator!=(const HttpResponse& a, const HttpResponse& b) {
    return !(a == b);
}

} // namespace protocol
} // namespace http_wire

// 文件结束
