// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: http_exchange.hpp
//  描述: HttpExchange类定义 - 一条已接受连接上的请求读取与响应写回
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/message_reader.hpp"
#include "protocol/message_writer.hpp"
#include "stream/buffered_source.hpp"
#include "stream/byte_stream.hpp"
#include <memory>

namespace http_wire {
namespace protocol {

class HttpExchange {
public:
    /**
     * @brief 构造函数，接管连接流的所有权
     * @param stream 已建立的双向字节流（不可为nullptr）
     * @param limits 解析资源限制
     */
    explicit HttpExchange(std::unique_ptr<stream::ByteStream> stream,
                          const CodecLimits& limits = CodecLimits());

    ~HttpExchange();

    HttpExchange(const HttpExchange&) = delete;
    HttpExchange& operator=(const HttpExchange&) = delete;

    /**
     * @brief 读取下一个请求，成功后可通过request()访问
     * @return 成功，或MessageReader::read_request的错误
     */
    utils::Result<void> receive();

    bool has_request() const;

    /**
     * @brief 最近一次成功读取的请求（仅has_request()为true时有意义）
     */
    const HttpRequest& request() const;
    HttpRequest& request();

    /**
     * @brief 写回响应
     *        响应不含content-length头部（大小写不敏感）时，追加
     *        "content-length: <body长度>"
     * @param response 响应对象
     * @return 成功，或HTTP_WRITE_FAILED
     */
    utils::Result<void> respond(HttpResponse response);

    // 底层连接流；请求读取经过内部预读缓冲，直接从该流读取会跳过已缓冲的字节
    stream::ByteStream* get_stream() const;

private:
    std::unique_ptr<stream::ByteStream> stream_;
    stream::BufferedSource input_;
    MessageReader reader_;
    MessageWriter writer_;
    HttpRequest request_;
    bool has_request_;
};

} // namespace protocol
} // namespace http_wire

// 文件结束
