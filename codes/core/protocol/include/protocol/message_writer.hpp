// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: message_writer.hpp
//  描述: MessageWriter类定义 - HTTP/1.x报文序列化与写出
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/http_message.hpp"
#include "stream/byte_stream.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <vector>

namespace http_wire {
namespace protocol {

// ==================== 报文写出器 ====================
// 按字节精确序列化：起始行、按存储顺序的头部、空行、原样body。
// 不自动添加任何头部，也不校验body与content-length是否一致。
class MessageWriter {
public:
    /**
     * @brief 构造函数
     * @param sink 字节汇（不持有所有权）
     */
    explicit MessageWriter(stream::ByteSink* sink);

    ~MessageWriter();

    MessageWriter(const MessageWriter&) = delete;
    MessageWriter& operator=(const MessageWriter&) = delete;

    /**
     * @brief 序列化请求并完整写出，随后flush
     * @return 成功，或HTTP_WRITE_FAILED（不重试）
     */
    utils::Result<void> write_request(const HttpRequest& request);

    /**
     * @brief 序列化响应并完整写出，随后flush
     * @return 成功，或HTTP_WRITE_FAILED（不重试）
     */
    utils::Result<void> write_response(const HttpResponse& response);

    /**
     * @brief 请求序列化：METHOD SP TARGET SP VERSION CRLF *(NAME: VALUE CRLF) CRLF BODY
     */
    static std::vector<uint8_t> serialize_request(const HttpRequest& request);

    /**
     * @brief 响应序列化：VERSION SP CODE SP REASON CRLF *(NAME: VALUE CRLF) CRLF BODY
     */
    static std::vector<uint8_t> serialize_response(const HttpResponse& response);

private:
    utils::Result<void> write_all(const std::vector<uint8_t>& data);

    stream::ByteSink* sink_;
};

} // namespace protocol
} // namespace http_wire

// 文件结束
