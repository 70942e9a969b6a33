#pragma once

#include "progress.hpp"
#include "transfer_state.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace blobfetch {

inline constexpr std::chrono::milliseconds kDefaultTickInterval{500};

// Periodically renders a one-line status for a TransferState on its own
// thread. Purely observational: it only reads the state.
class ProgressReporter {
public:
    ProgressReporter(const TransferState& state, std::ostream& out,
                     std::chrono::milliseconds interval = kDefaultTickInterval);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void start();

    // Stops the thread after a successful transfer and renders a last line
    // showing completion.
    void finish();

    // Stops the thread without rendering again; used when the transfer failed.
    void stop();

    [[nodiscard]] ProgressSample sample() const;
    // Lines rendered so far; safe to read while the reporter thread runs.
    [[nodiscard]] std::size_t renderCount() const noexcept { return render_count_.load(std::memory_order_acquire); }

private:
    void renderLoop();
    bool tick();
    void redrawLine(const std::string& line);
    void shutdown(bool render_final);

    const TransferState& state_;
    std::ostream& out_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point start_time_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};

    std::size_t previous_width_{0};
    std::atomic<std::size_t> render_count_{0};
    bool completion_rendered_{false};
};

} // namespace blobfetch
