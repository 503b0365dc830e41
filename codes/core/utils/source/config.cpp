#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <iterator>
#include <limits>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace http_wire {
namespace utils {

using json = nlohmann::json;

namespace details {

// 读取非负整数字段，负数、小数或超出目标类型范围时报错
template <typename T>
Result<void> read_unsigned(const json& obj, const char* key, T* out) {
    if (!obj.contains(key)) {
        return make_ok();
    }
    const auto& v = obj[key];
    if (!v.is_number_unsigned()) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        std::string("codec.") + key + " must be a non-negative integer");
    }
    auto raw = v.get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("codec.") + key + " is out of range");
    }
    *out = static_cast<T>(raw);
    return make_ok();
}

// 解析json到配置结构体
Result<void> parse_json_to_config(const json& j,
                                  CodecConfig& codec,
                                  LoggingConfig& logging) {
    if (!j.is_object()) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, "Config root must be a JSON object");
    }

    // 先解析到副本，失败时不修改原配置
    CodecConfig new_codec = codec;
    LoggingConfig new_logging = logging;

    try {
        if (j.contains("codec")) {
            const auto& c = j["codec"];
            if (!c.is_object()) {
                return make_err(ErrorCode::CONFIG_INVALID_VALUE, "codec must be a JSON object");
            }
            auto ret = read_unsigned(c, "max_line_length", &new_codec.max_line_length);
            if (ret.is_ok()) ret = read_unsigned(c, "max_headers", &new_codec.max_headers);
            if (ret.is_ok()) ret = read_unsigned(c, "max_body_size", &new_codec.max_body_size);
            if (ret.is_err()) {
                return ret;
            }
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            if (l.contains("level")) new_logging.level = l["level"].get<std::string>();
            if (l.contains("file")) new_logging.file = l["file"].get<std::string>();
            if (l.contains("console_output")) new_logging.console_output = l["console_output"].get<bool>();
        }
    } catch (const json::type_error& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const json::exception& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("Failed to parse config: ") + e.what());
    }

    codec = new_codec;
    logging = new_logging;
    return make_ok();
}

Result<void> parse_text(const std::string& text, CodecConfig& codec, LoggingConfig& logging) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, "JSON parse error");
    }
    return parse_json_to_config(j, codec, logging);
}

} // namespace details

Config::Config() = default;
Config::~Config() = default;

Config::Config(Config&& other) noexcept
    : codec_(std::move(other.codec_))
    , logging_(std::move(other.logging_))
{
}

Config& Config::operator=(Config&& other) noexcept {
    if (this != &other) {
        codec_ = std::move(other.codec_);
        logging_ = std::move(other.logging_);
    }
    return *this;
}

Result<void> Config::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path);
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return details::parse_text(text, codec_, logging_);
}

Result<void> Config::load_from_string(const std::string& json_str) {
    return details::parse_text(json_str, codec_, logging_);
}

Result<void> Config::validate() const {
    if (codec_.max_line_length == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "codec.max_line_length must be positive");
    }
    if (codec_.max_headers == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "codec.max_headers must be positive");
    }
    if (codec_.max_body_size == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "codec.max_body_size must be positive");
    }

    LogLevel level;
    if (!parse_log_level(logging_.level, &level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    return make_ok();
}

Result<std::string> Config::to_json_string() const {
    json j;
    j["codec"]["max_line_length"] = codec_.max_line_length;
    j["codec"]["max_headers"] = codec_.max_headers;
    j["codec"]["max_body_size"] = codec_.max_body_size;

    j["logging"]["level"] = logging_.level;
    j["logging"]["file"] = logging_.file;
    j["logging"]["console_output"] = logging_.console_output;

    try {
        return make_ok(j.dump(4));
    } catch (const json::type_error& e) {
        // 非UTF-8字符串会导致dump失败
        return make_err<std::string>(ErrorCode::OPERATION_FAILED,
                                     std::string("Failed to serialize config to JSON: ") + e.what());
    }
}

Result<void> apply_logging_config(const LoggingConfig& logging) {
    LogLevel level;
    if (!parse_log_level(logging.level, &level)) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging.level);
    }

    Logger& logger = Logger::instance();
    if (logger.init(level, logging.file) != 0) {
        return make_err(ErrorCode::FILE_WRITE_ERROR, "Cannot open log file: " + logging.file);
    }
    logger.set_console_output(logging.console_output);
    return make_ok();
}

} // namespace utils
} // namespace http_wire
