#pragma once

#include <cstdint>
#include <string>
#include "utils/error.hpp"

namespace http_wire {
namespace utils {

// ========== 配置数据结构 ==========

// 编解码资源限制
struct CodecConfig {
    uint32_t max_line_length = 8192;
    uint32_t max_headers = 100;
    uint64_t max_body_size = 64 * 1024 * 1024;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    bool console_output = true;
};

// ========== Config主类（防腐层） ==========
// 注意：头文件不包含nlohmann/json.hpp，完全隔离外部依赖

class Config {
public:
    Config();
    ~Config();

    // 禁止拷贝
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // 支持移动
    Config(Config&& other) noexcept;
    Config& operator=(Config&& other) noexcept;

    // ========== 从JSON文件/字符串加载 ==========
    // 缺省的键保留当前值

    // file_path: JSON配置文件路径
    // return: 成功返回SUCCESS，文件不存在返回FILE_NOT_FOUND，格式错误返回CONFIG_*
    Result<void> load_from_file(const std::string& file_path);

    Result<void> load_from_string(const std::string& json_str);

    // 验证配置合法性
    Result<void> validate() const;

    // ========== 获取/设置配置项 ==========

    const CodecConfig& get_codec() const { return codec_; }
    const LoggingConfig& get_logging() const { return logging_; }

    void set_codec(const CodecConfig& cfg) { codec_ = cfg; }
    void set_logging(const LoggingConfig& cfg) { logging_ = cfg; }

    // ========== 导出配置 ==========

    // 导出为JSON字符串（缩进4空格）
    Result<std::string> to_json_string() const;

private:
    CodecConfig codec_;
    LoggingConfig logging_;
};

// 按logging配置初始化Logger单例
// return: 日志级别非法返回CONFIG_INVALID_LOG_LEVEL，日志文件无法打开返回FILE_WRITE_ERROR
Result<void> apply_logging_config(const LoggingConfig& logging);

} // namespace utils
} // namespace http_wire
