#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace blobfetch {

struct ProgressSample {
    std::int64_t total_bytes{0};
    std::int64_t downloaded_bytes{0};
    std::chrono::duration<double> elapsed{0.0};
    double percent{0.0};
    double throughput_bps{0.0};
    std::optional<std::chrono::seconds> eta;
};

// resumed_bytes were present before the run started and do not count towards
// throughput.
[[nodiscard]] ProgressSample makeProgressSample(std::int64_t total_bytes,
                                                std::int64_t resumed_bytes,
                                                std::int64_t downloaded_bytes,
                                                std::chrono::duration<double> elapsed);

// "512.00 B", "1.50 KB", ... up to TB, always two decimals.
[[nodiscard]] std::string formatBytes(double bytes);

// HH:MM:SS, or D:HH:MM:SS from one day on.
[[nodiscard]] std::string formatDuration(std::chrono::seconds duration);

[[nodiscard]] std::string formatStatusLine(const ProgressSample& sample);

} // namespace blobfetch
