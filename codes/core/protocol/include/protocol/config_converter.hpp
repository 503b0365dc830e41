// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: config_converter.hpp
//  描述: ConfigConverter类定义 - 配置转换器（Adaptor层）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "utils/config.hpp"
#include "protocol/protocol_types.hpp"

namespace http_wire {
namespace protocol {

/**
 * @brief 配置转换器（Adaptor层）：utils::Config → Protocol模块配置
 *
 * 职责：仅做字段映射，不包含任何解析逻辑
 */
class ConfigConverter {
public:
    /**
     * @brief 将CodecConfig转换为CodecLimits
     * @param src 配置中的codec段
     * @param dst 解析资源限制（输出）
     */
    static void convert_codec_limits(
        const utils::CodecConfig& src,
        CodecLimits& dst);

    /**
     * @brief 从Config构造CodecLimits
     */
    static CodecLimits to_codec_limits(const utils::Config& config);
};

} // namespace protocol
} // namespace http_wire

// 文件结束
