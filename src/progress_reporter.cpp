#include "blobfetch/progress_reporter.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace blobfetch {

ProgressReporter::ProgressReporter(const TransferState& state, std::ostream& out, std::chrono::milliseconds interval)
    : state_(state), out_(out), interval_(interval), start_time_(std::chrono::steady_clock::now()) {}

ProgressReporter::~ProgressReporter() {
    if (thread_.joinable()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        wake_.notify_all();
        thread_.join();
    }
}

void ProgressReporter::start() {
    if (thread_.joinable()) {
        return;
    }
    start_time_ = std::chrono::steady_clock::now();
    stop_requested_ = false;
    thread_ = std::thread([this] { renderLoop(); });
}

void ProgressReporter::finish() { shutdown(true); }

void ProgressReporter::stop() { shutdown(false); }

ProgressSample ProgressReporter::sample() const {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
    return makeProgressSample(state_.totalLength(), state_.resumedBytes(), state_.downloadedBytes(), elapsed);
}

void ProgressReporter::renderLoop() {
    while (!tick()) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
    }
}

bool ProgressReporter::tick() {
    try {
        const auto current = sample();
        redrawLine(formatStatusLine(current));
        completion_rendered_ = current.downloaded_bytes >= current.total_bytes;
        return completion_rendered_;
    } catch (const std::exception& ex) {
        spdlog::warn("progress update failed: {}", ex.what());
        return false;
    }
}

void ProgressReporter::redrawLine(const std::string& line) {
    out_ << '\r' << line;
    if (line.size() < previous_width_) {
        out_ << std::string(previous_width_ - line.size(), ' ');
    }
    out_ << std::flush;
    previous_width_ = line.size();
    render_count_.fetch_add(1, std::memory_order_release);
}

void ProgressReporter::shutdown(bool render_final) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    if (render_final && !completion_rendered_) {
        tick();
    }
    if (previous_width_ > 0) {
        out_ << '\n' << std::flush;
        previous_width_ = 0;
    }
}

} // namespace blobfetch
