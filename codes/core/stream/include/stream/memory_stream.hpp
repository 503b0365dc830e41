// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: memory_stream.hpp
//  描述: MemoryStream类定义 - 内存字节流（输入数据 + 捕获输出）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "stream/byte_stream.hpp"
#include <string>
#include <vector>

namespace http_wire {
namespace stream {

class MemoryStream : public ByteStream {
public:
    MemoryStream();

    /**
     * @brief 以给定输入数据构造
     * @param input 可读数据，读完后read返回0（EOF）
     */
    explicit MemoryStream(std::vector<uint8_t> input);
    explicit MemoryStream(const std::string& input);

    utils::Result<size_t> read(uint8_t* data, size_t len) override;
    utils::Result<size_t> write(const uint8_t* data, size_t len) override;
    utils::Result<void> flush() override;

    /**
     * @brief 限制单次read返回的最大字节数，模拟网络分片到达
     * @param chunk_size 0表示不限制
     */
    void set_read_chunk_size(size_t chunk_size);

    // 追加输入数据
    void append_input(const std::string& data);

    // 尚未被读取的输入字节数
    size_t remaining() const;

    // 已被读取的输入字节数
    size_t consumed() const;

    // 写入的全部数据
    const std::vector<uint8_t>& output() const;
    std::string output_string() const;

    size_t flush_count() const;

private:
    std::vector<uint8_t> input_;
    size_t read_pos_;
    size_t chunk_size_;
    std::vector<uint8_t> output_;
    size_t flush_count_;
};

} // namespace stream
} // namespace http_wire

// 文件结束
