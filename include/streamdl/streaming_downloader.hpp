#pragma once

#include "console.hpp"
#include "http_transport.hpp"
#include "output_sink.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace streamdl {

class DownloadError : public std::runtime_error {
public:
    enum class Kind {
        Network,
        UnexpectedStatus,
        Aborted,
        Sink,
        TooManyRedirects,
    };

    DownloadError(Kind kind, const std::string& message, std::string url = {}, long status = 0)
        : std::runtime_error(message), kind_(kind), url_(std::move(url)), status_(status) {}

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& url() const { return url_; }
    // HTTP status for UnexpectedStatus, 0 otherwise.
    [[nodiscard]] long status() const { return status_; }

private:
    Kind kind_;
    std::string url_;
    long status_;
};

[[nodiscard]] const char* toString(DownloadError::Kind kind);

struct DownloaderOptions {
    unsigned unit_budget{100};
    bool show_progress{true};
    // Unset follows redirects without limit.
    std::optional<unsigned> max_redirects;
};

struct TransferSummary {
    std::string final_url;
    std::uint64_t bytes_received{0};
    std::uint64_t declared_bytes{0};
    unsigned redirects{0};
    std::chrono::steady_clock::duration elapsed{};
};

class StreamingDownloader {
public:
    StreamingDownloader(HttpTransportPtr transport, const Console& console, DownloaderOptions options = {});

    // Follows redirects from `url`, streams the terminal 200 body into `sink`
    // and closes it. Throws DownloadError.
    TransferSummary download(const std::string& url, OutputSink& sink);

private:
    HttpResponsePtr resolve(const std::string& url, std::string& final_url, unsigned& hops);
    HttpResponsePtr open(const std::string& url);

    HttpTransportPtr transport_;
    const Console& console_;
    DownloaderOptions options_;
};

} // namespace streamdl
