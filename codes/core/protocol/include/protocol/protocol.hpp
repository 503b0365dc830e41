// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: protocol.hpp
//  描述: Protocol模块统一头文件
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "protocol/protocol_types.hpp"
#include "protocol/protocol_utils.hpp"
#include "protocol/http_message.hpp"
#include "protocol/http_parser.hpp"
#include "protocol/message_reader.hpp"
#include "protocol/message_writer.hpp"
#include "protocol/http_exchange.hpp"
#include "protocol/config_converter.hpp"

// 文件结束
