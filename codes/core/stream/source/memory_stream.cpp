// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: memory_stream.cpp
//  描述: MemoryStream类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "stream/memory_stream.hpp"
#include <algorithm>
#include <cstring>

namespace http_wire {
namespace stream {

MemoryStream::MemoryStream()
    : input_()
    , read_pos_(0)
    , chunk_size_(0)
    , output_()
    , flush_count_(0)
{
}

MemoryStream::MemoryStream(std::vector<uint8_t> input)
    : input_(std::move(input))
    , read_pos_(0)
    , chunk_size_(0)
    , output_()
    , flush_count_(0)
{
}

MemoryStream::MemoryStream(const std::string& input)
    : MemoryStream(std::vector<uint8_t>(input.begin(), input.end()))
{
}

utils::Result<size_t> MemoryStream::read(uint8_t* data, size_t len) {
    if (data == nullptr && len > 0) {
        return utils::make_err<size_t>(utils::ErrorCode::NULL_POINTER, "Null read buffer");
    }

    size_t to_read = std::min(len, remaining());
    if (chunk_size_ > 0) {
        to_read = std::min(to_read, chunk_size_);
    }
    if (to_read > 0) {
        std::memcpy(data, input_.data() + read_pos_, to_read);
        read_pos_ += to_read;
    }
    return utils::make_ok(to_read);
}

utils::Result<size_t> MemoryStream::write(const uint8_t* data, size_t len) {
    if (data == nullptr && len > 0) {
        return utils::make_err<size_t>(utils::ErrorCode::NULL_POINTER, "Null write buffer");
    }
    output_.insert(output_.end(), data, data + len);
    return utils::make_ok(len);
}

utils::Result<void> MemoryStream::flush() {
    flush_count_++;
    return utils::make_ok();
}

void MemoryStream::set_read_chunk_size(size_t chunk_size) {
    chunk_size_ = chunk_size;
}

void MemoryStream::append_input(const std::string& data) {
    input_.insert(input_.end(), data.begin(), data.end());
}

size_t MemoryStream::remaining() const {
    return input_.size() - read_pos_;
}

size_t MemoryStream::consumed() const {
    return read_pos_;
}

const std::vector<uint8_t>& MemoryStream::output() const {
    return output_;
}

std::string MemoryStream::output_string() const {
    return std::string(output_.begin(), output_.end());
}

size_t MemoryStream::flush_count() const {
    return flush_count_;
}

} // namespace stream
} // namespace http_wire

// 文件结束
