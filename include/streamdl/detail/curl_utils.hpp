#pragma once

#include <curl/curl.h>

#include <memory>

namespace streamdl::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

} // namespace streamdl::detail
