#include "blobfetch/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace blobfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw std::runtime_error("Failed to allocate curl handle");
    }
    return curl;
}

std::string urlFileName(const std::string& url) {
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw std::runtime_error("Failed to allocate curl URL handle");
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {};
    }

    char* raw_path = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &raw_path, CURLU_URLDECODE) != CURLUE_OK || !raw_path) {
        return {};
    }
    std::string path{raw_path};
    curl_free(raw_path);

    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace blobfetch::detail
