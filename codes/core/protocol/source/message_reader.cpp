// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: message_reader.cpp
//  描述: MessageReader类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/message_reader.hpp"
#include "protocol/http_parser.hpp"
#include "stream/memory_stream.hpp"

namespace http_wire {
namespace protocol {

namespace {

utils::Result<void> unexpected_eof(Http1ParseState state) {
    return utils::make_err(utils::ErrorCode::HTTP_UNEXPECTED_EOF,
                           std::string("Stream closed while reading ") + parse_state_to_string(state));
}

} // namespace

// ==================== MessageReader实现 ====================

MessageReader::MessageReader(stream::ByteSource* source, const CodecLimits& limits)
    : source_(source)
    , limits_(limits)
{
}

MessageReader::~MessageReader() = default;

utils::Result<HttpRequest> MessageReader::read_request() {
    // 1. 请求行
    auto line = read_line(Http1ParseState::EXPECT_START_LINE);
    if (line.is_err()) {
        return utils::forward_err<HttpRequest>(line);
    }

    HttpRequest request;
    auto ret = parse_request_line(line.value(), &request.method, &request.target, &request.version);
    if (ret.is_err()) {
        return utils::forward_err<HttpRequest>(ret);
    }

    // 2. 头部
    ret = read_headers(&request.headers);
    if (ret.is_err()) {
        return utils::forward_err<HttpRequest>(ret);
    }

    // 3. body
    ret = read_body(request.headers, &request.body);
    if (ret.is_err()) {
        return utils::forward_err<HttpRequest>(ret);
    }

    return utils::make_ok(std::move(request));
}

utils::Result<HttpResponse> MessageReader::read_response() {
    // 1. 状态行
    auto line = read_line(Http1ParseState::EXPECT_START_LINE);
    if (line.is_err()) {
        return utils::forward_err<HttpResponse>(line);
    }

    HttpResponse response;
    auto ret = parse_status_line(line.value(), &response.version, &response.status_code, &response.reason);
    if (ret.is_err()) {
        return utils::forward_err<HttpResponse>(ret);
    }

    // 2. 头部
    ret = read_headers(&response.headers);
    if (ret.is_err()) {
        return utils::forward_err<HttpResponse>(ret);
    }

    // 3. body
    ret = read_body(response.headers, &response.body);
    if (ret.is_err()) {
        return utils::forward_err<HttpResponse>(ret);
    }

    return utils::make_ok(std::move(response));
}

const CodecLimits& MessageReader::get_limits() const {
    return limits_;
}

utils::Result<std::string> MessageReader::read_line(Http1ParseState state) {
    if (!source_) {
        return utils::make_err<std::string>(utils::ErrorCode::NULL_POINTER, "Byte source not set");
    }

    std::string line;
    uint8_t byte = 0;

    while (true) {
        auto n = source_->read(&byte, 1);
        if (n.is_err()) {
            return utils::forward_err<std::string>(n);
        }
        if (n.value() == 0) {
            return utils::forward_err<std::string>(unexpected_eof(state));
        }

        line.push_back(static_cast<char>(byte));

        size_t size = line.size();
        if (size >= 2 && line[size - 2] == '\r' && line[size - 1] == '\n') {
            line.resize(size - 2);
            return utils::make_ok(std::move(line));
        }

        // 末尾的'\r'可能与下一个'\n'组成CRLF，不计入行长度
        size_t content = (line.back() == '\r') ? size - 1 : size;
        if (content > limits_.max_line_length) {
            return utils::make_err<std::string>(utils::ErrorCode::HTTP_LINE_TOO_LONG,
                                                "Line exceeds " + std::to_string(limits_.max_line_length) + " bytes");
        }
    }
}

utils::Result<void> MessageReader::read_headers(HttpHeaders* headers) {
    headers->clear();

    while (true) {
        auto line = read_line(Http1ParseState::EXPECT_HEADERS);
        if (line.is_err()) {
            return utils::forward_err<void>(line);
        }

        // 空行表示头部结束
        if (line.value().empty()) {
            return utils::make_ok();
        }

        if (headers->size() >= limits_.max_headers) {
            return utils::make_err(utils::ErrorCode::HTTP_TOO_MANY_HEADERS,
                                   "More than " + std::to_string(limits_.max_headers) + " headers");
        }

        HttpHeader header;
        auto ret = parse_header(line.value(), &header);
        if (ret.is_err()) {
            return ret;
        }
        headers->push_back(std::move(header));
    }
}

utils::Result<void> MessageReader::read_body(const HttpHeaders& headers, std::vector<uint8_t>* body) {
    body->clear();

    auto length = resolve_body_length(headers);
    if (length.is_err()) {
        return utils::forward_err<void>(length);
    }
    if (length.value() > limits_.max_body_size) {
        return utils::make_err(utils::ErrorCode::HTTP_BODY_TOO_LARGE,
                               "Body of " + std::to_string(length.value()) + " bytes exceeds limit of " +
                               std::to_string(limits_.max_body_size));
    }

    const size_t total = length.value();
    body->resize(total);

    // 只请求body剩余的字节数
    size_t filled = 0;
    while (filled < total) {
        auto n = source_->read(body->data() + filled, total - filled);
        if (n.is_err()) {
            body->clear();
            return utils::forward_err<void>(n);
        }
        if (n.value() == 0) {
            body->clear();
            return unexpected_eof(Http1ParseState::EXPECT_BODY);
        }
        filled += n.value();
    }

    return utils::make_ok();
}

// ==================== 内存报文解析 ====================

utils::Result<HttpRequest> parse_request(const std::string& data, const CodecLimits& limits) {
    stream::MemoryStream source(data);
    MessageReader reader(&source, limits);
    return reader.read_request();
}

utils::Result<HttpResponse> parse_response(const std::string& data, const CodecLimits& limits) {
    stream::MemoryStream source(data);
    MessageReader reader(&source, limits);
    return reader.read_response();
}

} // namespace protocol
} // namespace http_wire

// 文件结束
