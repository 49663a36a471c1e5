#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace streamdl {

class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, bool aborted)
        : std::runtime_error(message), aborted_(aborted) {}

    // True when the peer closed the connection before the body was complete.
    [[nodiscard]] bool aborted() const { return aborted_; }

private:
    bool aborted_;
};

// A response whose headers have arrived. Destroying it abandons the body.
class HttpResponse {
public:
    virtual ~HttpResponse() = default;

    [[nodiscard]] virtual long status() const = 0;
    // Case-insensitive header lookup.
    [[nodiscard]] virtual std::optional<std::string> header(std::string_view name) const = 0;
    // Blocks for the next body chunk. Returns false at end of stream.
    virtual bool read(std::string& chunk) = 0;
};

using HttpResponsePtr = std::unique_ptr<HttpResponse>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Issues a GET and blocks until the response headers are in.
    // Redirects are not followed.
    [[nodiscard]] virtual HttpResponsePtr get(const std::string& url) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace streamdl
