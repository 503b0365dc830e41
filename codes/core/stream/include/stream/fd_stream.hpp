// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: fd_stream.hpp
//  描述: FdStream类定义 - 基于文件描述符（socket/pipe/文件）的阻塞字节流
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "stream/byte_stream.hpp"

namespace http_wire {
namespace stream {

// 文件描述符所有权
enum class FdOwnership {
    OWNED = 0,     // 析构时关闭fd
    BORROWED = 1   // 由调用方负责关闭
};

class FdStream : public ByteStream {
public:
    /**
     * @brief 构造函数
     * @param fd 已打开的阻塞文件描述符
     * @param ownership fd所有权
     */
    explicit FdStream(int fd, FdOwnership ownership = FdOwnership::OWNED);

    ~FdStream() override;

    // 禁止拷贝
    FdStream(const FdStream&) = delete;
    FdStream& operator=(const FdStream&) = delete;

    utils::Result<size_t> read(uint8_t* data, size_t len) override;
    utils::Result<size_t> write(const uint8_t* data, size_t len) override;
    utils::Result<void> flush() override;

    /**
     * @brief 关闭写方向（socket为shutdown(SHUT_WR)，其他fd无操作）
     *        对端随后读到EOF
     */
    utils::Result<void> shutdown_write();

    int get_fd() const;
    bool is_socket() const;

private:
    int fd_;
    FdOwnership ownership_;
    bool is_socket_;
};

} // namespace stream
} // namespace http_wire

// 文件结束
