#pragma once

#include "remote_object.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace blobfetch {

inline constexpr std::size_t kHttpReadBufferSize = 80 * 1024;

// RemoteObject backed by HTTP HEAD and ranged GET requests through libcurl.
// Every call uses its own easy handle, so fetchRange() may run concurrently.
class HttpRemoteObject final : public RemoteObject {
public:
    explicit HttpRemoteObject(std::string url, std::optional<std::string> bearer_token = std::nullopt);

    [[nodiscard]] std::int64_t length() override;
    void fetchRange(std::int64_t offset, std::int64_t length, const RangeConsumer& consumer) override;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    std::optional<std::string> bearer_token_;
};

} // namespace blobfetch
