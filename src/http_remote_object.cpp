#include "blobfetch/http_remote_object.hpp"

#include "blobfetch/detail/curl_utils.hpp"
#include "blobfetch/errors.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace blobfetch {

namespace {

struct RangeContext {
    CURL* curl{nullptr};
    const RangeConsumer* consumer{nullptr};
    std::int64_t offset{0};
    std::int64_t expected{0};
    std::int64_t received{0};
    bool status_checked{false};
    bool cancelled{false};
    std::exception_ptr error;
};

size_t rangeWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<RangeContext*>(userdata);
    if (!ctx || !ctx->consumer) {
        return 0;
    }

    const size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }

    try {
        if (!ctx->status_checked) {
            long code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
            if (code != 206) {
                throw RemoteRangeError(fmt::format(
                    "Server answered range request at offset {} with HTTP {} instead of 206",
                    ctx->offset, code));
            }
            ctx->status_checked = true;
        }

        if (ctx->received + static_cast<std::int64_t>(total) > ctx->expected) {
            throw RemoteRangeError(fmt::format(
                "Server sent more than the {} bytes requested at offset {}", ctx->expected, ctx->offset));
        }

        if (!(*ctx->consumer)(ptr, total)) {
            ctx->cancelled = true;
            return 0;
        }
    } catch (...) {
        // Exceptions must not unwind through libcurl; rethrown after curl_easy_perform.
        ctx->error = std::current_exception();
        return 0;
    }

    ctx->received += static_cast<std::int64_t>(total);
    return total;
}

detail::CurlHeaderList buildHeaders(const std::optional<std::string>& bearer_token) {
    detail::CurlHeaderList headers;
    if (bearer_token) {
        const std::string line = "Authorization: Bearer " + *bearer_token;
        headers.reset(curl_slist_append(nullptr, line.c_str()));
        if (!headers) {
            throw std::runtime_error("Failed to allocate curl header list");
        }
    }
    return headers;
}

} // namespace

HttpRemoteObject::HttpRemoteObject(std::string url, std::optional<std::string> bearer_token)
    : url_(std::move(url)), bearer_token_(std::move(bearer_token)) {}

std::int64_t HttpRemoteObject::length() {
    auto curl = detail::makeCurlHandle();
    const auto headers = buildHeaders(bearer_token_);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    spdlog::debug("HEAD {}", url_);
    const CURLcode res = curl_easy_perform(curl.get());

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (res != CURLE_OK) {
        if (code == 401 || code == 403 || code == 404) {
            throw RemoteMetadataError(
                fmt::format("Remote object not found or access denied (HTTP {})", code), code);
        }
        throw RemoteMetadataError(
            fmt::format("Cannot fetch remote object properties: {}", curl_easy_strerror(res)), code);
    }

    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length < 0) {
        throw RemoteMetadataError("Server did not report the object length", code);
    }
    return static_cast<std::int64_t>(length);
}

void HttpRemoteObject::fetchRange(std::int64_t offset, std::int64_t length, const RangeConsumer& consumer) {
    if (length <= 0) {
        return;
    }

    auto curl = detail::makeCurlHandle();
    const auto headers = buildHeaders(bearer_token_);

    RangeContext ctx;
    ctx.curl = curl.get();
    ctx.consumer = &consumer;
    ctx.offset = offset;
    ctx.expected = length;

    const std::string range = fmt::format("{}-{}", offset, offset + length - 1);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &rangeWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(kHttpReadBufferSize));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    spdlog::debug("GET {} range {}", url_, range);
    const CURLcode res = curl_easy_perform(curl.get());

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    if (ctx.cancelled) {
        return;
    }
    if (res != CURLE_OK) {
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        throw RemoteRangeError(fmt::format("Range {} failed: {} (HTTP {})", range, curl_easy_strerror(res), code));
    }
}

} // namespace blobfetch
