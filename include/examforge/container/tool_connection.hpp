#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace examforge {

/// Live handle an agent uses to invoke tools inside a container session
class ToolConnection
{
public:
    virtual ~ToolConnection() = default;

    /// Address of the tool server, e.g. ``http://localhost:49483/mcp``
    virtual const std::string& endpoint() const = 0;

    /// Release the connection. May throw; callers doing cleanup must catch.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/// Connection to the agent server's MCP endpoint over HTTP
class HttpToolConnection final : public ToolConnection
{
public:
    explicit HttpToolConnection(std::uint16_t host_port);

    const std::string& endpoint() const override { return endpoint_; }

    void close() override;

    bool is_open() const override { return open_; }

private:
    std::string endpoint_;
    bool open_ = true;
};

/// Produces the connection handle once a container is healthy on ``host_port``
using ConnectionFactory = std::function<std::unique_ptr<ToolConnection>(std::uint16_t host_port)>;

ConnectionFactory make_http_connection_factory();

} // namespace examforge
