#pragma once

#include "chunk.hpp"
#include "concurrency_gate.hpp"
#include "file_sink.hpp"
#include "remote_object.hpp"
#include "transfer_state.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace blobfetch {

inline constexpr int kMaxAutoConcurrency = 8;

// Starts one worker thread. The default launcher constructs a std::thread.
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

// Downloads every pending chunk of a TransferState on at most max_concurrency
// worker threads. Workers take pending chunks in index order from a shared
// cursor. The first failure stops admission, cancels in-flight chunks at their
// next buffer and is rethrown by run().
class ChunkWorkerPool {
public:
    explicit ChunkWorkerPool(int max_concurrency, ThreadLauncher launcher = {});

    void run(TransferState& state, RemoteObject& remote, FileSink& sink);

    [[nodiscard]] int maxConcurrency() const noexcept { return max_concurrency_; }

private:
    void workerLoop(const std::vector<std::size_t>& pending, TransferState& state, RemoteObject& remote,
                    FileSink& sink);
    [[nodiscard]] bool nextPending(std::size_t pending_count, std::size_t& position);
    void downloadChunk(const Chunk& chunk, TransferState& state, RemoteObject& remote, FileSink& sink);
    void registerError(std::exception_ptr error);
    [[nodiscard]] bool aborted() const noexcept { return aborted_.load(std::memory_order_acquire); }

    int max_concurrency_;
    ThreadLauncher launcher_;
    ConcurrencyGate gate_;
    std::atomic<bool> aborted_{false};

    std::mutex cursor_mutex_;
    std::size_t cursor_{0};

    std::mutex error_mutex_;
    std::exception_ptr first_error_;
};

} // namespace blobfetch
