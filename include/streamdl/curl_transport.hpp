#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <string>

namespace streamdl {

struct CurlTransportOptions {
    std::chrono::seconds connect_timeout{30};
    // Zero disables the stall check.
    std::chrono::seconds idle_timeout{60};
    std::string user_agent{"streamdl/1.0"};
    bool verify_tls{true};
};

class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportOptions options = {});

    [[nodiscard]] HttpResponsePtr get(const std::string& url) override;

private:
    CurlTransportOptions options_;
};

} // namespace streamdl
