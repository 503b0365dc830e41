// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: message_writer.cpp
//  描述: MessageWriter类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/message_writer.hpp"
#include "protocol/protocol_types.hpp"
#include <cstring>
#include <string>

namespace http_wire {
namespace protocol {

namespace {

void append(std::vector<uint8_t>* out, const std::string& text) {
    out->insert(out->end(), text.begin(), text.end());
}

void append(std::vector<uint8_t>* out, const char* text) {
    out->insert(out->end(), text, text + std::strlen(text));
}

// 头部块 + 空行 + body
void append_headers_and_body(std::vector<uint8_t>* out,
                             const HttpHeaders& headers,
                             const std::vector<uint8_t>& body) {
    for (const auto& header : headers) {
        append(out, header.name);
        append(out, HEADER_SEPARATOR);
        append(out, header.value);
        append(out, CRLF);
    }
    append(out, CRLF);
    out->insert(out->end(), body.begin(), body.end());
}

size_t estimate_size(const HttpHeaders& headers, const std::vector<uint8_t>& body) {
    size_t size = 64 + body.size();
    for (const auto& header : headers) {
        size += header.name.size() + header.value.size() + 4;
    }
    return size;
}

} // namespace

// ==================== MessageWriter实现 ====================

MessageWriter::MessageWriter(stream::ByteSink* sink)
    : sink_(sink)
{
}

MessageWriter::~MessageWriter() = default;

std::vector<uint8_t> MessageWriter::serialize_request(const HttpRequest& request) {
    std::vector<uint8_t> out;
    out.reserve(estimate_size(request.headers, request.body));

    // 1. 请求行
    append(&out, request.method);
    append(&out, " ");
    append(&out, request.target);
    append(&out, " ");
    append(&out, request.version);
    append(&out, CRLF);

    // 2~4. 头部、空行、body
    append_headers_and_body(&out, request.headers, request.body);
    return out;
}

std::vector<uint8_t> MessageWriter::serialize_response(const HttpResponse& response) {
    std::vector<uint8_t> out;
    out.reserve(estimate_size(response.headers, response.body));

    // 1. 状态行
    append(&out, response.version);
    append(&out, " ");
    append(&out, std::to_string(response.status_code));
    append(&out, " ");
    append(&out, response.reason);
    append(&out, CRLF);

    // 2~4. 头部、空行、body
    append_headers_and_body(&out, response.headers, response.body);
    return out;
}

utils::Result<void> MessageWriter::write_request(const HttpRequest& request) {
    return write_all(serialize_request(request));
}

utils::Result<void> MessageWriter::write_response(const HttpResponse& response) {
    return write_all(serialize_response(response));
}

utils::Result<void> MessageWriter::write_all(const std::vector<uint8_t>& data) {
    if (!sink_) {
        return utils::make_err(utils::ErrorCode::HTTP_WRITE_FAILED, "Byte sink not set");
    }

    size_t offset = 0;
    while (offset < data.size()) {
        auto n = sink_->write(data.data() + offset, data.size() - offset);
        if (n.is_err()) {
            return utils::make_err(utils::ErrorCode::HTTP_WRITE_FAILED,
                                   "Write failed after " + std::to_string(offset) + " bytes: " +
                                   n.error_message());
        }
        if (n.value() == 0) {
            return utils::make_err(utils::ErrorCode::HTTP_WRITE_FAILED,
                                   "Sink accepted no bytes after " + std::to_string(offset) + " bytes");
        }
        offset += n.value();
    }

    auto ret = sink_->flush();
    if (ret.is_err()) {
        return utils::make_err(utils::ErrorCode::HTTP_WRITE_FAILED, "Flush failed: " + ret.error_message());
    }
    return utils::make_ok();
}

} // namespace protocol
} // namespace http_wire

// 文件结束
