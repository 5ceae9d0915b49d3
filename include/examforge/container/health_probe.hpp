#pragma once

#include <examforge/common/class_traits.hpp>

#include <chrono>
#include <string>

namespace examforge {

/// Single-shot HTTP health check
class HealthProbe
{
public:
    virtual ~HealthProbe() = default;

    /// Whether a GET of ``url`` answered HTTP 200 within ``timeout``.
    /// Connection failures are a plain ``false``, never an exception.
    virtual bool check(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

/// libcurl-backed probe
class CurlHealthProbe final : public HealthProbe, NonCopyable
{
public:
    CurlHealthProbe();

    bool check(const std::string& url, std::chrono::milliseconds timeout) override;
};

} // namespace examforge
