// =============================================================================
//  HTTP Wire Codec - Utils Module
//  文件: buffer.hpp
//  描述: 动态缓冲区类定义（读写指针 + 自动扩容）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace http_wire {
namespace utils {

/**
 * @brief 动态缓冲区类
 * @note 线程安全说明：Buffer 类不是线程安全的。如果需要在多线程环境中使用，
 *       调用方必须负责使用外部同步机制（如 mutex）来保护对 Buffer 的访问。
 */
class Buffer {
public:
    static constexpr size_t DEFAULT_INITIAL_CAPACITY = 8192;  // 默认初始容量
    static constexpr size_t MIN_CAPACITY = 1024;              // 最小容量
    static constexpr size_t MAX_CAPACITY = 64 * 1024 * 1024;  // 最大容量
    static constexpr size_t GROWTH_THRESHOLD_DOUBLE = 64 * 1024;  // 翻倍扩容阈值
    static constexpr size_t GROWTH_THRESHOLD_15X = 1024 * 1024;   // 1.5倍扩容阈值
    static constexpr size_t GROWTH_LINEAR_INCREMENT = 256 * 1024;  // 线性扩容增量
    static constexpr size_t npos = static_cast<size_t>(-1);

    // initial_capacity: 初始容量，默认8KB
    explicit Buffer(size_t initial_capacity = DEFAULT_INITIAL_CAPACITY);
    ~Buffer();

    // 禁止拷贝
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    // 支持移动
    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    // ========== 写入方法 ==========

    // 写入数据，返回实际写入的字节数
    // 会自动扩容，超过MAX_CAPACITY时返回0
    size_t write(const uint8_t* data, size_t len);
    size_t write(const char* data, size_t len);

    size_t write(const std::string& str) {
        return write(str.data(), str.size());
    }

    // 预留可写空间，返回指向该空间的指针，失败返回nullptr
    // 用于直接写入（如read/recv）
    uint8_t* reserve(size_t len);

    // 提交已写入的数据（配合reserve使用）
    void commit(size_t len);

    // ========== 读取方法 ==========

    // 读取数据，返回实际读取的字节数，移动读指针
    size_t read(uint8_t* data, size_t len);

    // 读取len字节到std::string，移动读指针
    // len: 要读取的字节数，0表示读取所有可读数据
    size_t read_to_string(std::string* out, size_t len = 0);

    // 查看数据（不移动读指针）
    size_t peek(uint8_t* data, size_t len) const;

    // 从可读区域offset处开始查找"\r\n"
    // return: 相对读指针的位置，未找到返回npos
    size_t find_crlf(size_t offset = 0) const;

    // ========== 指针操作 ==========

    const uint8_t* read_ptr() const;
    uint8_t* write_ptr();

    // 跳过数据（移动读指针）
    void skip(size_t len);

    // ========== 容量管理 ==========

    size_t readable_bytes() const;

    // 获取可写字节数（不扩容情况下）
    size_t writable_bytes() const;

    size_t capacity() const;

    // 确保有足够的可写空间，必要时压缩或扩容
    // return: true-成功，false-失败（超过MAX_CAPACITY）
    bool ensure_writable(size_t len);

    // ========== 清理操作 ==========

    // 清空缓冲区（不释放内存）
    void clear();

    // 压缩空间（将可读数据移到开头，回收空间）
    void compact();

private:
    // 计算扩容后的容量，不超过MAX_CAPACITY
    size_t calculate_growth(size_t required) const;

    bool resize(size_t new_capacity);

    std::vector<uint8_t> data_;
    size_t read_idx_;
    size_t write_idx_;
};

} // namespace utils
} // namespace http_wire
