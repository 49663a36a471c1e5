#include "streamdl/streaming_downloader.hpp"

#include "streamdl/format.hpp"
#include "streamdl/progress.hpp"
#include "streamdl/url.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace streamdl {

namespace {

constexpr long kHttpOk = 200;

} // namespace

const char* toString(DownloadError::Kind kind) {
    switch (kind) {
        case DownloadError::Kind::Network:
            return "network";
        case DownloadError::Kind::UnexpectedStatus:
            return "unexpected status";
        case DownloadError::Kind::Aborted:
            return "aborted";
        case DownloadError::Kind::Sink:
            return "sink";
        case DownloadError::Kind::TooManyRedirects:
            return "too many redirects";
    }
    return "unknown";
}

StreamingDownloader::StreamingDownloader(HttpTransportPtr transport, const Console& console, DownloaderOptions options)
    : transport_(std::move(transport)), console_(console), options_(options) {
    if (!transport_) {
        throw std::invalid_argument("StreamingDownloader needs a transport");
    }
}

HttpResponsePtr StreamingDownloader::open(const std::string& url) {
    try {
        return transport_->get(url);
    } catch (const TransportError& e) {
        console_.warn(fmt::format("Got error: {}", e.what()));
        throw DownloadError(DownloadError::Kind::Network, e.what(), url);
    }
}

HttpResponsePtr StreamingDownloader::resolve(const std::string& url, std::string& final_url, unsigned& hops) {
    std::string current = url;
    hops = 0;

    auto response = open(current);
    while (auto location = response->header("location")) {
        if (options_.max_redirects && hops >= *options_.max_redirects) {
            throw DownloadError(DownloadError::Kind::TooManyRedirects,
                                fmt::format("Gave up after {} redirects at {}", hops, current), current);
        }

        std::string next;
        try {
            next = resolveUrl(current, *location);
        } catch (const std::invalid_argument& e) {
            throw DownloadError(DownloadError::Kind::Network, e.what(), current);
        }
        console_.debug(fmt::format("Redirected to {}", color::yellow(hostOf(next))));

        // Drop the redirect body unread before opening the next hop.
        response.reset();
        current = std::move(next);
        ++hops;
        response = open(current);
    }

    final_url = std::move(current);
    return response;
}

TransferSummary StreamingDownloader::download(const std::string& url, OutputSink& sink) {
    TransferSummary summary;
    auto response = resolve(url, summary.final_url, summary.redirects);

    if (response->status() != kHttpOk) {
        throw DownloadError(DownloadError::Kind::UnexpectedStatus,
                            fmt::format("Got HTTP {} for {}", response->status(), summary.final_url),
                            summary.final_url, response->status());
    }

    const auto length = response->header("content-length");
    Transfer transfer(summary.final_url, length ? parseContentLength(*length) : 0, options_.unit_budget);
    summary.declared_bytes = transfer.totalBytes();

    ProgressBar bar(console_.out());
    const auto start = std::chrono::steady_clock::now();
    if (options_.show_progress) {
        bar.render(transfer);
    }

    std::string chunk;
    while (true) {
        bool more = false;
        try {
            more = response->read(chunk);
        } catch (const TransportError& e) {
            bar.clear();
            if (!e.aborted()) {
                console_.warn(fmt::format("Got error: {}", e.what()));
                throw DownloadError(DownloadError::Kind::Network, e.what(), summary.final_url);
            }

            console_.warn("Request aborted!");
            // The body ended early; hand over what arrived without rolling back.
            try {
                sink.close();
            } catch (const std::exception& close_error) {
                console_.warn(fmt::format("I/O error: {}", close_error.what()));
            }
            throw DownloadError(DownloadError::Kind::Aborted,
                                fmt::format("Request aborted after {} bytes: {}", transfer.downloadedBytes(), e.what()),
                                summary.final_url);
        }
        if (!more) {
            break;
        }

        if (transfer.advance(chunk.size()) && options_.show_progress) {
            bar.render(transfer);
        }

        try {
            sink.write(chunk.data(), chunk.size());
        } catch (const std::exception& e) {
            bar.clear();
            console_.warn(fmt::format("I/O error: {}", e.what()));
            throw DownloadError(DownloadError::Kind::Sink, e.what(), summary.final_url);
        }
    }
    response.reset();

    try {
        sink.close();
    } catch (const std::exception& e) {
        bar.clear();
        console_.warn(fmt::format("I/O error: {}", e.what()));
        throw DownloadError(DownloadError::Kind::Sink, e.what(), summary.final_url);
    }

    bar.clear();
    summary.elapsed = std::chrono::steady_clock::now() - start;
    summary.bytes_received = transfer.downloadedBytes();

    const double seconds = std::max(std::chrono::duration<double>(summary.elapsed).count(), 0.001);
    const auto received = static_cast<double>(summary.bytes_received);
    console_.debug(fmt::format("Downloaded {} in {}, average DL speed {}",
                               color::yellow(formatSize(received)),
                               color::yellow(formatSeconds(seconds)),
                               color::yellow(formatSize(received / seconds) + "/s")));
    return summary;
}

} // namespace streamdl
