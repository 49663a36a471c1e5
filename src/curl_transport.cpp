#include "streamdl/curl_transport.hpp"

#include "streamdl/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace streamdl {

namespace {

// libcurl global state is set up once per process and torn down at exit.
void initializeCurl() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw TransportError(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(rc), false);
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

// The peer hung up in the middle of the body.
bool isPrematureClose(CURLcode code) {
    return code == CURLE_PARTIAL_FILE || code == CURLE_RECV_ERROR;
}

// One GET driven through a private multi handle so that body bytes can be
// pulled chunk by chunk. The write callback holds at most one chunk and pauses
// the transfer until read() takes it.
class CurlResponse final : public HttpResponse {
public:
    CurlResponse(const std::string& url, const CurlTransportOptions& options)
        : easy_{curl_easy_init(), &curl_easy_cleanup},
          multi_{curl_multi_init(), &curl_multi_cleanup} {
        if (!easy_ || !multi_) {
            throw TransportError("Failed to allocate curl handle", false);
        }

        CURL* curl = easy_.get();
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
        if (options.idle_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.idle_timeout.count()));
        }
        if (!options.verify_tls) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlResponse::headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlResponse::writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);

        const CURLMcode rc = curl_multi_add_handle(multi_.get(), curl);
        if (rc != CURLM_OK) {
            throw TransportError(std::string{"curl multi error: "} + curl_multi_strerror(rc), false);
        }
        attached_ = true;
    }

    ~CurlResponse() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlResponse(const CurlResponse&) = delete;
    CurlResponse& operator=(const CurlResponse&) = delete;

    void waitForHeaders() {
        pumpUntil([this] { return headers_done_; });

        if (!headers_done_) {
            if (result_ != CURLE_OK) {
                throw TransportError(std::string{"curl error: "} + curl_easy_strerror(result_), false);
            }
            headers_done_ = true;
        }
        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status_);
    }

    [[nodiscard]] long status() const override { return status_; }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const override {
        const auto it = headers_.find(toLower(name));
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool read(std::string& chunk) override {
        if (pending_.empty()) {
            pumpUntil([this] { return !pending_.empty(); });
        }

        if (!pending_.empty()) {
            chunk.swap(pending_);
            pending_.clear();
            if (paused_) {
                paused_ = false;
                const CURLcode rc = curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
                if (rc != CURLE_OK) {
                    throw TransportError(std::string{"curl error: "} + curl_easy_strerror(rc), false);
                }
            }
            return true;
        }

        chunk.clear();
        if (result_ == CURLE_OK) {
            return false;
        }
        throw TransportError(std::string{"curl error: "} + curl_easy_strerror(result_), isPrematureClose(result_));
    }

private:
    template <typename Ready>
    void pumpUntil(Ready ready) {
        while (!finished_ && !ready()) {
            int running = 0;
            CURLMcode rc = curl_multi_perform(multi_.get(), &running);
            if (rc != CURLM_OK) {
                throw TransportError(std::string{"curl multi error: "} + curl_multi_strerror(rc), false);
            }
            drainMessages();
            if (finished_ || ready()) {
                break;
            }

            rc = curl_multi_poll(multi_.get(), nullptr, 0, 1000, nullptr);
            if (rc != CURLM_OK) {
                throw TransportError(std::string{"curl multi error: "} + curl_multi_strerror(rc), false);
            }
        }
    }

    void drainMessages() {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlResponse*>(userdata);
        const size_t total = size * nitems;
        if (!self) {
            return 0;
        }

        const std::string_view line = trim(std::string_view(buffer, total));
        if (line.rfind("HTTP/", 0) == 0) {
            // New status line: interim responses and their headers are dropped.
            self->headers_.clear();
            self->headers_done_ = false;
            return total;
        }

        if (line.empty()) {
            long code = 0;
            curl_easy_getinfo(self->easy_.get(), CURLINFO_RESPONSE_CODE, &code);
            if (code < 100 || code >= 200) {
                self->headers_done_ = true;
            }
            return total;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return total;
        }
        self->headers_.emplace(toLower(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponse*>(userdata);
        const size_t total = size * nmemb;
        if (!self) {
            return 0;
        }

        self->headers_done_ = true;
        if (!self->pending_.empty()) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->pending_.assign(ptr, total);
        return total;
    }

    detail::CurlHandle easy_;
    detail::CurlMultiHandle multi_;
    bool attached_{false};

    std::map<std::string, std::string> headers_;
    bool headers_done_{false};
    long status_{0};

    std::string pending_;
    bool paused_{false};
    bool finished_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace

CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options)) {
    initializeCurl();
}

HttpResponsePtr CurlTransport::get(const std::string& url) {
    auto response = std::make_unique<CurlResponse>(url, options_);
    response->waitForHeaders();
    return response;
}

} // namespace streamdl
