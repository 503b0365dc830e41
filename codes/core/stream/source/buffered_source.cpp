// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: buffered_source.cpp
//  描述: BufferedSource类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "stream/buffered_source.hpp"

namespace http_wire {
namespace stream {

BufferedSource::BufferedSource(ByteSource* inner, size_t chunk_size)
    : inner_(inner)
    , chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE)
    , buffer_()
{
}

BufferedSource::~BufferedSource() = default;

utils::Result<size_t> BufferedSource::read(uint8_t* data, size_t len) {
    if (data == nullptr && len > 0) {
        return utils::make_err<size_t>(utils::ErrorCode::NULL_POINTER, "Null read buffer");
    }
    if (len == 0) {
        return utils::make_ok(static_cast<size_t>(0));
    }

    if (buffer_.readable_bytes() == 0) {
        if (!inner_) {
            return utils::make_err<size_t>(utils::ErrorCode::NULL_POINTER, "Byte source not set");
        }

        // 大块读取绕过缓冲
        if (len >= chunk_size_) {
            return inner_->read(data, len);
        }

        uint8_t* dest = buffer_.reserve(chunk_size_);
        if (dest == nullptr) {
            return utils::make_err<size_t>(utils::ErrorCode::BUFFER_CAPACITY_EXCEEDED,
                                           "Read-ahead buffer capacity exceeded");
        }

        auto n = inner_->read(dest, chunk_size_);
        if (n.is_err() || n.value() == 0) {
            return n;
        }
        buffer_.commit(n.value());
    }

    return utils::make_ok(buffer_.read(data, len));
}

size_t BufferedSource::buffered_bytes() const {
    return buffer_.readable_bytes();
}

} // namespace stream
} // namespace http_wire

// 文件结束
