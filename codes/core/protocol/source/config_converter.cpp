// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: config_converter.cpp
//  描述: ConfigConverter类实现 - 配置转换器
//  版权: Copyright (c) 2026
// =============================================================================

#include "protocol/config_converter.hpp"
#include <limits>

namespace http_wire {
namespace protocol {

void ConfigConverter::convert_codec_limits(
    const utils::CodecConfig& src,
    CodecLimits& dst)
{
    dst.max_line_length = src.max_line_length;
    dst.max_headers = src.max_headers;

    // 32位平台上按size_t上限截断
    if (src.max_body_size > std::numeric_limits<size_t>::max()) {
        dst.max_body_size = std::numeric_limits<size_t>::max();
    } else {
        dst.max_body_size = static_cast<size_t>(src.max_body_size);
    }
}

CodecLimits ConfigConverter::to_codec_limits(const utils::Config& config)
{
    CodecLimits limits;
    convert_codec_limits(config.get_codec(), limits);
    return limits;
}

} // namespace protocol
} // namespace http_wire

// 文件结束
