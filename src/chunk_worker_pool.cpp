#include "blobfetch/chunk_worker_pool.hpp"

#include "blobfetch/errors.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace blobfetch {

ChunkWorkerPool::ChunkWorkerPool(int max_concurrency, ThreadLauncher launcher)
    : max_concurrency_(std::max(1, max_concurrency)),
      launcher_(std::move(launcher)),
      gate_(static_cast<std::size_t>(max_concurrency_)) {
    if (!launcher_) {
        launcher_ = [](std::function<void()> body) { return std::thread(std::move(body)); };
    }
}

void ChunkWorkerPool::run(TransferState& state, RemoteObject& remote, FileSink& sink) {
    aborted_.store(false, std::memory_order_release);
    first_error_ = nullptr;
    cursor_ = 0;

    std::vector<std::size_t> pending;
    pending.reserve(state.pendingChunkCount());
    for (const auto& chunk : state.chunks()) {
        if (!chunk.done) {
            pending.push_back(chunk.index);
        }
    }

    const std::size_t worker_count = std::min(pending.size(), static_cast<std::size_t>(max_concurrency_));
    std::vector<std::thread> workers;
    workers.reserve(worker_count);

    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            workers.push_back(launcher_([this, &pending, &state, &remote, &sink] {
                workerLoop(pending, state, remote, sink);
            }));
        } catch (const std::system_error& ex) {
            registerError(std::make_exception_ptr(LocalIOError(
                fmt::format("Cannot start chunk worker {} of {}: {}", i + 1, worker_count, ex.what()))));
            break;
        }
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (first_error_) {
        std::rethrow_exception(first_error_);
    }
}

void ChunkWorkerPool::workerLoop(const std::vector<std::size_t>& pending, TransferState& state,
                                 RemoteObject& remote, FileSink& sink) {
    std::size_t position = 0;
    while (!aborted() && nextPending(pending.size(), position)) {
        gate_.acquire();
        ConcurrencyGate::Slot slot{gate_};
        if (aborted()) {
            return;
        }

        try {
            downloadChunk(state.chunks()[pending[position]], state, remote, sink);
        } catch (...) {
            registerError(std::current_exception());
        }
    }
}

bool ChunkWorkerPool::nextPending(std::size_t pending_count, std::size_t& position) {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    if (cursor_ >= pending_count) {
        return false;
    }
    position = cursor_++;
    return true;
}

void ChunkWorkerPool::downloadChunk(const Chunk& chunk, TransferState& state, RemoteObject& remote, FileSink& sink) {
    spdlog::debug("chunk {} started: offset {} length {}", chunk.index, chunk.offset, chunk.length);

    std::int64_t written = 0;
    remote.fetchRange(chunk.offset, chunk.length, [&](const char* data, std::size_t size) {
        if (aborted()) {
            return false;
        }
        if (written + static_cast<std::int64_t>(size) > chunk.length) {
            throw RemoteRangeError(fmt::format("Chunk {} received more than its {} bytes", chunk.index, chunk.length));
        }

        sink.writeAt(chunk.offset + written, data, size);
        written += static_cast<std::int64_t>(size);
        state.publish(chunk.index, written);
        return true;
    });

    if (aborted()) {
        spdlog::debug("chunk {} cancelled after {} bytes", chunk.index, written);
        return;
    }
    if (written != chunk.length) {
        throw RemoteRangeError(fmt::format("Chunk {} incomplete: received {} of {} bytes",
                                           chunk.index, written, chunk.length));
    }

    spdlog::debug("chunk {} finished", chunk.index);
}

void ChunkWorkerPool::registerError(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!first_error_) {
        first_error_ = std::move(error);
    }
    aborted_.store(true, std::memory_order_release);
}

} // namespace blobfetch
