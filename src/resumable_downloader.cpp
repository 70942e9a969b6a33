#include "blobfetch/resumable_downloader.hpp"

#include "blobfetch/chunk_worker_pool.hpp"
#include "blobfetch/errors.hpp"
#include "blobfetch/file_sink.hpp"
#include "blobfetch/progress.hpp"
#include "blobfetch/progress_reporter.hpp"
#include "blobfetch/range_planner.hpp"
#include "blobfetch/transfer_state.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace blobfetch {

class ResumableDownloader::Impl {
public:
    Impl(TransferOptions options, RemoteObjectPtr remote, std::ostream& status_out)
        : options_(std::move(options)), remote_(std::move(remote)), out_(status_out) {
        if (!remote_) {
            throw std::invalid_argument("ResumableDownloader requires a remote object");
        }
        if (options_.chunk_size <= 0 || options_.chunk_size > kMaxChunkSize) {
            throw ConfigurationError(fmt::format("Chunk size must be between 1 and {} bytes", kMaxChunkSize));
        }
        if (options_.concurrency <= 0) {
            throw ConfigurationError("Thread count must be positive");
        }
    }

    TransferSummary run() {
        TransferSummary summary;

        const std::int64_t existing = localFileLength(options_.destination).value_or(0);
        const std::int64_t total = remote_->length();

        summary.total_length = total;
        summary.bytes_already_present = existing;

        if (existing >= total) {
            if (existing > total) {
                spdlog::warn("'{}' is larger than the remote object ({} > {} bytes)",
                             options_.destination.string(), existing, total);
            }
            out_ << "File already fully downloaded." << std::endl;
            summary.outcome = TransferOutcome::AlreadyComplete;
            summary.chunks_total = static_cast<std::size_t>(chunkCount(total, options_.chunk_size));
            return summary;
        }

        TransferState state{total, options_.chunk_size, planChunks(total, existing, options_.chunk_size), existing};
        summary.chunks_total = state.chunks().size();
        summary.chunks_downloaded = state.pendingChunkCount();

        if (existing > 0) {
            spdlog::info("Resuming '{}': {} of {} already present, {} of {} chunks complete",
                         options_.destination.string(), formatBytes(static_cast<double>(existing)),
                         formatBytes(static_cast<double>(total)),
                         summary.chunks_total - summary.chunks_downloaded, summary.chunks_total);
        }
        spdlog::info("Downloading {} chunks of {} with {} concurrent worker(s)", summary.chunks_downloaded,
                     formatBytes(static_cast<double>(options_.chunk_size)), options_.concurrency);

        FileSink sink{options_.destination};
        ProgressReporter reporter{state, out_, options_.tick_interval};
        ChunkWorkerPool pool{options_.concurrency};

        reporter.start();
        try {
            pool.run(state, *remote_, sink);
            sink.sync();
        } catch (...) {
            reporter.stop();
            salvage(state, sink);
            throw;
        }
        reporter.finish();

        summary.outcome = TransferOutcome::Completed;
        summary.bytes_transferred = state.transferredBytes();
        out_ << "Download complete." << std::endl;
        return summary;
    }

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

private:
    // Drops whatever lies past the first gap so the next run's length-based
    // resume check only trusts bytes that were actually written.
    static void salvage(const TransferState& state, FileSink& sink) {
        try {
            const std::int64_t safe_length = state.safeResumeLength();
            if (sink.size() > safe_length) {
                spdlog::info("Truncating '{}' to {} bytes for a later resume", sink.path().string(), safe_length);
                sink.truncate(safe_length);
            }
            sink.sync();
        } catch (const std::exception& ex) {
            spdlog::error("Could not prepare '{}' for resume: {}", sink.path().string(), ex.what());
        }
    }

    TransferOptions options_;
    RemoteObjectPtr remote_;
    std::ostream& out_;
};

ResumableDownloader::ResumableDownloader(TransferOptions options, RemoteObjectPtr remote, std::ostream& status_out)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(remote), status_out)) {}

ResumableDownloader::~ResumableDownloader() = default;

TransferSummary ResumableDownloader::run() { return impl_->run(); }

const TransferOptions& ResumableDownloader::options() const noexcept { return impl_->options(); }

} // namespace blobfetch
