// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: http_parser.cpp
//  描述: HTTP/1.x行与头部分词实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_parser.hpp"
#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"
#include <cstring>
#include <limits>

namespace http_wire {
namespace protocol {

namespace {

bool is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

// RFC 7230 tchar
bool is_token_char(char ch) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || is_digit(ch)) {
        return true;
    }
    return ch != '\0' && std::strchr("!#$%&'*+-.^_`|~", ch) != nullptr;
}

utils::Result<void> malformed_start_line(const std::string& reason, const std::string& line) {
    return utils::make_err(utils::ErrorCode::HTTP_MALFORMED_START_LINE,
                           reason + ": \"" + line + "\"");
}

} // namespace

bool is_valid_http_version(const std::string& version) {
    const size_t prefix_len = std::strlen(HTTP_VERSION_PREFIX);
    // HTTP/x.y
    if (version.size() != prefix_len + 3) {
        return false;
    }
    if (version.compare(0, prefix_len, HTTP_VERSION_PREFIX) != 0) {
        return false;
    }
    return is_digit(version[prefix_len]) &&
           version[prefix_len + 1] == '.' &&
           is_digit(version[prefix_len + 2]);
}

utils::Result<void> parse_request_line(const std::string& line,
                                       std::string* method,
                                       std::string* target,
                                       std::string* version) {
    // 第一部分: method
    size_t first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return malformed_start_line("Request line has fewer than 3 tokens", line);
    }

    // 第二部分: target
    size_t second_space = line.find(' ', first_space + 1);
    if (second_space == std::string::npos) {
        return malformed_start_line("Request line has fewer than 3 tokens", line);
    }

    std::string method_token = line.substr(0, first_space);
    std::string target_token = line.substr(first_space + 1, second_space - first_space - 1);
    std::string version_token = line.substr(second_space + 1);

    // 连续空格会产生空token
    if (method_token.empty() || target_token.empty() || version_token.empty()) {
        return malformed_start_line("Request line has an empty token", line);
    }
    if (version_token.find(' ') != std::string::npos) {
        return malformed_start_line("Request line has more than 3 tokens", line);
    }
    if (!is_valid_http_version(version_token)) {
        return malformed_start_line("Unsupported protocol version", line);
    }

    *method = std::move(method_token);
    *target = std::move(target_token);
    *version = std::move(version_token);
    return utils::make_ok();
}

utils::Result<void> parse_status_line(const std::string& line,
                                      std::string* version,
                                      int* status_code,
                                      std::string* reason) {
    size_t first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return malformed_start_line("Status line has fewer than 3 tokens", line);
    }
    size_t second_space = line.find(' ', first_space + 1);
    if (second_space == std::string::npos) {
        return malformed_start_line("Status line has fewer than 3 tokens", line);
    }

    std::string version_token = line.substr(0, first_space);
    std::string code_token = line.substr(first_space + 1, second_space - first_space - 1);

    if (!is_valid_http_version(version_token)) {
        return malformed_start_line("Unsupported protocol version", line);
    }
    if (code_token.size() != 3 ||
        !is_digit(code_token[0]) || !is_digit(code_token[1]) || !is_digit(code_token[2])) {
        return malformed_start_line("Status code is not a 3-digit number", line);
    }

    *version = std::move(version_token);
    *status_code = (code_token[0] - '0') * 100 + (code_token[1] - '0') * 10 + (code_token[2] - '0');
    *reason = line.substr(second_space + 1);
    return utils::make_ok();
}

utils::Result<void> parse_header(const std::string& line, HttpHeader* header) {
    // 查找冒号分隔符
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return utils::make_err(utils::ErrorCode::HTTP_MALFORMED_HEADER,
                               "Header line has no ':' separator: \"" + line + "\"");
    }

    std::string name = line.substr(0, colon);
    if (name.empty()) {
        return utils::make_err(utils::ErrorCode::HTTP_MALFORMED_HEADER,
                               "Empty header name: \"" + line + "\"");
    }
    // 名称中不允许空白，"host 10.0.2.2:8080"这类缺少分隔符的行在此被拒绝
    for (char ch : name) {
        if (!is_token_char(ch)) {
            return utils::make_err(utils::ErrorCode::HTTP_MALFORMED_HEADER,
                                   "Invalid character in header name: \"" + line + "\"");
        }
    }

    header->name = std::move(name);
    header->value = TrimHttpWhitespace(line.substr(colon + 1));
    return utils::make_ok();
}

utils::Result<size_t> parse_content_length(const std::string& value) {
    if (value.empty()) {
        return utils::make_err<size_t>(utils::ErrorCode::HTTP_INVALID_CONTENT_LENGTH,
                                       "Empty content-length value");
    }

    const size_t max_value = std::numeric_limits<size_t>::max();
    size_t length = 0;
    for (char ch : value) {
        if (!is_digit(ch)) {
            return utils::make_err<size_t>(utils::ErrorCode::HTTP_INVALID_CONTENT_LENGTH,
                                           "content-length is not a non-negative integer: \"" + value + "\"");
        }
        size_t digit = static_cast<size_t>(ch - '0');
        if (length > (max_value - digit) / 10) {
            return utils::make_err<size_t>(utils::ErrorCode::HTTP_INVALID_CONTENT_LENGTH,
                                           "content-length overflows: \"" + value + "\"");
        }
        length = length * 10 + digit;
    }
    return utils::make_ok(length);
}

utils::Result<size_t> resolve_body_length(const HttpHeaders& headers) {
    bool found = false;
    size_t length = 0;

    for (const auto& header : headers) {
        if (!EqualsIgnoreCase(header.name, HEADER_CONTENT_LENGTH)) {
            continue;
        }
        auto parsed = parse_content_length(header.value);
        if (parsed.is_err()) {
            return parsed;
        }
        if (found && parsed.value() != length) {
            return utils::make_err<size_t>(utils::ErrorCode::HTTP_INVALID_CONTENT_LENGTH,
                                           "Conflicting content-length headers");
        }
        found = true;
        length = parsed.value();
    }

    // 无content-length：body为空，不做chunked回退
    return utils::make_ok(length);
}

const char* parse_state_to_string(Http1ParseState state) {
    switch (state) {
        case Http1ParseState::EXPECT_START_LINE: return "start line";
        case Http1ParseState::EXPECT_HEADERS: return "header block";
        case Http1ParseState::EXPECT_BODY: return "body";
        case Http1ParseState::EXPECT_COMPLETE: return "complete";
        default: return "unknown";
    }
}

} // namespace protocol
} // namespace http_wire

// 文件结束
