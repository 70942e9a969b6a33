#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace blobfetch::detail {

void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Throws std::runtime_error when libcurl cannot allocate a handle.
[[nodiscard]] CurlHandle makeCurlHandle();

// Last path segment of url, or an empty string if it has none.
[[nodiscard]] std::string urlFileName(const std::string& url);

} // namespace blobfetch::detail
