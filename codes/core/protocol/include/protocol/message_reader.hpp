// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: message_reader.hpp
//  描述: MessageReader类定义 - 从阻塞字节源读取完整HTTP/1.x报文
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/http_message.hpp"
#include "stream/byte_stream.hpp"
#include "utils/error.hpp"
#include <string>
#include <vector>

namespace http_wire {
namespace protocol {

// ==================== 报文读取器 ====================
// 绑定一个字节源，每次调用读取一个完整报文（起始行 + 头部 + body）。
// 读取器本身不做预读：成功返回后字节源恰好停在报文末尾之后，
// 后续字节可由任意读取者继续读取。需要批量读取时由调用方传入stream::BufferedSource。
// 失败时不返回部分报文，字节源位置不再可靠，调用方应关闭连接。
class MessageReader {
public:
    /**
     * @brief 构造函数
     * @param source 字节源（不持有所有权，生命周期须长于MessageReader）
     * @param limits 解析资源限制
     */
    explicit MessageReader(stream::ByteSource* source, const CodecLimits& limits = CodecLimits());

    ~MessageReader();

    MessageReader(const MessageReader&) = delete;
    MessageReader& operator=(const MessageReader&) = delete;

    /**
     * @brief 读取一个HTTP请求
     * @return 请求，或HTTP_MALFORMED_START_LINE / HTTP_MALFORMED_HEADER /
     *         HTTP_INVALID_CONTENT_LENGTH / HTTP_UNEXPECTED_EOF / 限制类错误 / STREAM_READ_ERROR
     */
    utils::Result<HttpRequest> read_request();

    /**
     * @brief 读取一个HTTP响应，错误同read_request
     */
    utils::Result<HttpResponse> read_response();

    const CodecLimits& get_limits() const;

private:
    /**
     * @brief 逐字节读取一行（以\r\n结尾，不含\r\n）
     * @param state 当前解析阶段，用于错误信息
     */
    utils::Result<std::string> read_line(Http1ParseState state);

    /**
     * @brief 读取所有头部直到空行
     */
    utils::Result<void> read_headers(HttpHeaders* headers);

    /**
     * @brief 按content-length读取body
     */
    utils::Result<void> read_body(const HttpHeaders& headers, std::vector<uint8_t>* body);

    stream::ByteSource* source_;
    CodecLimits limits_;
};

/**
 * @brief 解析内存中的完整请求报文（多余的尾部字节被忽略）
 */
utils::Result<HttpRequest> parse_request(const std::string& data, const CodecLimits& limits = CodecLimits());

/**
 * @brief 解析内存中的完整响应报文（多余的尾部字节被忽略）
 */
utils::Result<HttpResponse> parse_response(const std::string& data, const CodecLimits& limits = CodecLimits());

} // namespace protocol
} // namespace http_wire

// 文件结束
