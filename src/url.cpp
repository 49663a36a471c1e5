#include "streamdl/url.hpp"

#include "streamdl/detail/curl_utils.hpp"

#include <stdexcept>

namespace streamdl {

namespace {

detail::CurlUrlHandle makeUrl() {
    detail::CurlUrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl URL handle");
    }
    return handle;
}

std::string takePart(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    const CURLUcode rc = curl_url_get(handle, part, &raw, 0);
    if (rc != CURLUE_OK || !raw) {
        throw std::invalid_argument(std::string{"Cannot extract URL part: "} + curl_url_strerror(rc));
    }
    std::string value{raw};
    curl_free(raw);
    return value;
}

} // namespace

std::string resolveUrl(const std::string& base, const std::string& reference) {
    auto handle = makeUrl();

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, base.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw std::invalid_argument("Malformed URL '" + base + "': " + curl_url_strerror(rc));
    }
    // A second set resolves relative references against the stored URL.
    rc = curl_url_set(handle.get(), CURLUPART_URL, reference.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw std::invalid_argument("Malformed redirect target '" + reference + "': " + curl_url_strerror(rc));
    }
    return takePart(handle.get(), CURLUPART_URL);
}

std::string hostOf(const std::string& url) {
    auto handle = makeUrl();
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return url;
    }

    char* raw = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_HOST, &raw, 0) != CURLUE_OK || !raw) {
        return url;
    }
    std::string host{raw};
    curl_free(raw);
    return host;
}

} // namespace streamdl
