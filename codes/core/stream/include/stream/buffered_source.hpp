// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: buffered_source.hpp
//  描述: BufferedSource类定义 - 带预读缓冲的字节源装饰器
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "stream/byte_stream.hpp"
#include "utils/buffer.hpp"

namespace http_wire {
namespace stream {

// 包装一个字节源，按块预读并逐次分发。
// 预读的字节只存在于本对象中：同一底层连接上的后续读取必须继续经过同一个
// BufferedSource，否则这些字节会丢失。
class BufferedSource : public ByteSource {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

    /**
     * @brief 构造函数
     * @param inner 底层字节源（不持有所有权）
     * @param chunk_size 单次从底层读取的块大小
     */
    explicit BufferedSource(ByteSource* inner, size_t chunk_size = DEFAULT_CHUNK_SIZE);

    ~BufferedSource() override;

    BufferedSource(const BufferedSource&) = delete;
    BufferedSource& operator=(const BufferedSource&) = delete;

    /**
     * @brief 优先返回缓冲数据；缓冲为空时从底层读取一块
     *        请求长度不小于块大小时直接读入调用方缓冲区
     */
    utils::Result<size_t> read(uint8_t* data, size_t len) override;

    // 已预读但尚未分发的字节数
    size_t buffered_bytes() const;

private:
    ByteSource* inner_;
    size_t chunk_size_;
    utils::Buffer buffer_;
};

} // namespace stream
} // namespace http_wire

// 文件结束
