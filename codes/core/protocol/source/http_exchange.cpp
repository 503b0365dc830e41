// =============================================================================
//  HTTP Wire Codec - Protocol Module
//  文件: http_exchange.cpp
//  描述: HttpExchange类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "protocol/http_exchange.hpp"
#include "protocol/protocol_types.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"

namespace http_wire {
namespace protocol {

namespace {
constexpr const char* kLogModule = "HttpExchange";
} // namespace

HttpExchange::HttpExchange(std::unique_ptr<stream::ByteStream> stream, const CodecLimits& limits)
    : stream_(std::move(stream))
    , input_(stream_.get())
    , reader_(&input_, limits)
    , writer_(stream_.get())
    , request_()
    , has_request_(false)
{
}

HttpExchange::~HttpExchange() = default;

utils::Result<void> HttpExchange::receive() {
    utils::StopWatch watch;

    auto result = reader_.read_request();
    if (result.is_err()) {
        has_request_ = false;
        LOG_WARN(kLogModule, "Failed to read request: %s (%s)",
                 utils::error_code_to_string(result.error_code()),
                 result.error_message().c_str());
        return utils::forward_err<void>(result);
    }

    request_ = std::move(result.value());
    has_request_ = true;

    LOG_DEBUG(kLogModule, "Received %s %s %s, %zu headers, %zu body bytes in %llu us",
              request_.method.c_str(), request_.target.c_str(), request_.version.c_str(),
              request_.headers.size(), request_.body.size(),
              static_cast<unsigned long long>(watch.elapsed_us()));
    return utils::make_ok();
}

bool HttpExchange::has_request() const {
    return has_request_;
}

const HttpRequest& HttpExchange::request() const {
    return request_;
}

HttpRequest& HttpExchange::request() {
    return request_;
}

utils::Result<void> HttpExchange::respond(HttpResponse response) {
    if (!find_header(response.headers, HEADER_CONTENT_LENGTH, nullptr)) {
        response.add_header(HEADER_CONTENT_LENGTH, std::to_string(response.body.size()));
    }

    auto ret = writer_.write_response(response);
    if (ret.is_err()) {
        LOG_WARN(kLogModule, "Failed to write %d response: %s",
                 response.status_code, ret.error_message().c_str());
        return ret;
    }

    LOG_DEBUG(kLogModule, "Sent %d %s, %zu body bytes",
              response.status_code, response.reason.c_str(), response.body.size());
    return utils::make_ok();
}

stream::ByteStream* HttpExchange::get_stream() const {
    return stream_.get();
}

} // namespace protocol
} // namespace http_wire

// 文件结束
