#include "blobfetch/progress.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include <fmt/format.h>

namespace blobfetch {

ProgressSample makeProgressSample(std::int64_t total_bytes,
                                  std::int64_t resumed_bytes,
                                  std::int64_t downloaded_bytes,
                                  std::chrono::duration<double> elapsed) {
    ProgressSample sample;
    sample.total_bytes = total_bytes;
    sample.downloaded_bytes = std::min(downloaded_bytes, total_bytes);
    sample.elapsed = elapsed;

    if (total_bytes > 0) {
        sample.percent = static_cast<double>(sample.downloaded_bytes) / static_cast<double>(total_bytes) * 100.0;
    } else {
        sample.percent = 100.0;
    }

    const double seconds = elapsed.count();
    const std::int64_t fresh = std::max<std::int64_t>(0, sample.downloaded_bytes - resumed_bytes);
    if (seconds > 0.0) {
        sample.throughput_bps = static_cast<double>(fresh) / seconds;
    }

    if (sample.throughput_bps > 0.0) {
        const double remaining = static_cast<double>(total_bytes - sample.downloaded_bytes);
        sample.eta = std::chrono::seconds(static_cast<std::int64_t>(std::llround(remaining / sample.throughput_bps)));
    }
    return sample;
}

std::string formatBytes(double bytes) {
    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};

    std::size_t unit = 0;
    while (unit < units.size() - 1 && bytes >= 1024.0) {
        bytes /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", bytes, units[unit]);
}

std::string formatDuration(std::chrono::seconds duration) {
    const std::int64_t total = std::max<std::int64_t>(0, duration.count());
    const std::int64_t days = total / 86400;
    const std::int64_t hours = (total % 86400) / 3600;
    const std::int64_t minutes = (total % 3600) / 60;
    const std::int64_t seconds = total % 60;

    if (days > 0) {
        return fmt::format("{}:{:02}:{:02}:{:02}", days, hours, minutes, seconds);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
}

std::string formatStatusLine(const ProgressSample& sample) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(sample.elapsed);
    const std::string eta = sample.eta ? formatDuration(*sample.eta) : std::string{"--:--:--"};

    return fmt::format("Downloaded: {}/{} | {:.2f}% | Speed: {}/s | Elapsed: {} | ETA: {}",
                       formatBytes(static_cast<double>(sample.downloaded_bytes)),
                       formatBytes(static_cast<double>(sample.total_bytes)),
                       sample.percent,
                       formatBytes(sample.throughput_bps),
                       formatDuration(elapsed),
                       eta);
}

} // namespace blobfetch
