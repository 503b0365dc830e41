// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: protocol_utils.hpp
//  描述: Protocol模块公共工具函数
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <strings.h>
#include <string>

namespace http_wire {
namespace protocol {

// 大小写不敏感字符串比较（仅ASCII）
inline int StrCaseCmp(const char* a, const char* b) {
    return strcasecmp(a, b);
}

inline bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && strncasecmp(a.data(), b.data(), a.size()) == 0;
}

// HTTP空白字符（SP / HTAB）
inline bool IsHttpWhitespace(char ch) {
    return ch == ' ' || ch == '\t';
}

// 去除两端SP/HTAB
inline std::string TrimHttpWhitespace(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && IsHttpWhitespace(s[start])) {
        start++;
    }
    while (end > start && IsHttpWhitespace(s[end - 1])) {
        end--;
    }
    return s.substr(start, end - start);
}

} // namespace protocol
} // namespace http_wire

// 文件结束
