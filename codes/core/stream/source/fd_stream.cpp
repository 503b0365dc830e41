// =============================================================================
//  HTTP Wire Codec - Stream Module
//  文件: fd_stream.cpp
//  描述: FdStream类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "stream/fd_stream.hpp"
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace http_wire {
namespace stream {

namespace {

std::string errno_message(const char* op, int err) {
    return std::string(op) + " failed: " + std::strerror(err);
}

bool detect_socket(int fd) {
    struct stat st;
    if (fd < 0 || ::fstat(fd, &st) != 0) {
        return false;
    }
    return S_ISSOCK(st.st_mode);
}

} // namespace

FdStream::FdStream(int fd, FdOwnership ownership)
    : fd_(fd)
    , ownership_(ownership)
    , is_socket_(detect_socket(fd))
{
}

FdStream::~FdStream() {
    if (ownership_ == FdOwnership::OWNED && fd_ >= 0) {
        ::close(fd_);
    }
}

utils::Result<size_t> FdStream::read(uint8_t* data, size_t len) {
    if (fd_ < 0) {
        return utils::make_err<size_t>(utils::ErrorCode::STREAM_CLOSED, "Invalid file descriptor");
    }

    while (true) {
        ssize_t n = ::read(fd_, data, len);
        if (n >= 0) {
            return utils::make_ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        // 对端复位视为流错误而非EOF
        return utils::make_err<size_t>(utils::ErrorCode::STREAM_READ_ERROR, errno_message("read", errno));
    }
}

utils::Result<size_t> FdStream::write(const uint8_t* data, size_t len) {
    if (fd_ < 0) {
        return utils::make_err<size_t>(utils::ErrorCode::STREAM_CLOSED, "Invalid file descriptor");
    }

    while (true) {
        // socket使用MSG_NOSIGNAL，对端关闭时返回EPIPE而不是触发SIGPIPE
        ssize_t n = is_socket_ ? ::send(fd_, data, len, MSG_NOSIGNAL)
                               : ::write(fd_, data, len);
        if (n >= 0) {
            return utils::make_ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        return utils::make_err<size_t>(utils::ErrorCode::STREAM_WRITE_ERROR, errno_message("write", errno));
    }
}

utils::Result<void> FdStream::flush() {
    // 无用户态缓冲，内核缓冲由write直接提交
    if (fd_ < 0) {
        return utils::make_err(utils::ErrorCode::STREAM_CLOSED, "Invalid file descriptor");
    }
    return utils::make_ok();
}

utils::Result<void> FdStream::shutdown_write() {
    if (fd_ < 0) {
        return utils::make_err(utils::ErrorCode::STREAM_CLOSED, "Invalid file descriptor");
    }
    if (!is_socket_) {
        return utils::make_ok();
    }
    if (::shutdown(fd_, SHUT_WR) != 0) {
        return utils::make_err(utils::ErrorCode::STREAM_WRITE_ERROR, errno_message("shutdown", errno));
    }
    return utils::make_ok();
}

int FdStream::get_fd() const {
    return fd_;
}

bool FdStream::is_socket() const {
    return is_socket_;
}

} // namespace stream
} // namespace http_wire

// 文件结束
