#include <examforge/container/tool_connection.hpp>
#include <examforge/logging.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <memory>

namespace examforge {

HttpToolConnection::HttpToolConnection(std::uint16_t host_port)
    : endpoint_{fmt::format("http://localhost:{}/mcp", host_port)} {}

void HttpToolConnection::close() {
    if (!open_) {
        return;
    }

    LOG_DEBUG("Closing tool connection to {}", endpoint_);
    open_ = false;
}

ConnectionFactory make_http_connection_factory() {
    return [](std::uint16_t host_port) { return std::make_unique<HttpToolConnection>(host_port); };
}

} // namespace examforge
