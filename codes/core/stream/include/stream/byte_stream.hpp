// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: byte_stream.hpp
//  描述: 阻塞字节流接口（编解码器的输入/输出边界）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/error.hpp"
#include <cstdint>
#include <cstddef>

namespace http_wire {
namespace stream {

// ==================== 字节源接口 ====================
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief 阻塞读取，直到至少有1字节可读或流结束
     * @param data 输出缓冲区
     * @param len 最多读取的字节数（必须大于0）
     * @return 实际读取字节数，0表示流已结束（EOF）；失败返回STREAM_READ_ERROR
     */
    virtual utils::Result<size_t> read(uint8_t* data, size_t len) = 0;
};

// ==================== 字节汇接口 ====================
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief 阻塞写入
     * @param data 数据指针
     * @param len 数据长度
     * @return 实际写入字节数（可能少于len）；失败返回STREAM_WRITE_ERROR
     */
    virtual utils::Result<size_t> write(const uint8_t* data, size_t len) = 0;

    /**
     * @brief 刷新底层缓冲（无缓冲的实现直接返回成功）
     */
    virtual utils::Result<void> flush() = 0;
};

// ==================== 双向字节流 ====================
// 一条已建立的连接：既可读也可写
class ByteStream : public ByteSource, public ByteSink {
public:
    ~ByteStream() override = default;
};

} // namespace stream
} // namespace http_wire

// 文件结束
