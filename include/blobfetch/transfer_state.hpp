#pragma once

#include "chunk.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace blobfetch {

// Shared view of one transfer. The chunk list is fixed at construction; each
// chunk's live counter has exactly one writer (the worker owning that index)
// and any number of readers that tolerate stale values.
class TransferState {
public:
    TransferState(std::int64_t total_length,
                  std::int64_t chunk_size,
                  std::vector<Chunk> chunks,
                  std::int64_t bytes_already_present);

    TransferState(const TransferState&) = delete;
    TransferState& operator=(const TransferState&) = delete;

    [[nodiscard]] std::int64_t totalLength() const noexcept { return total_length_; }
    [[nodiscard]] std::int64_t chunkSize() const noexcept { return chunk_size_; }
    [[nodiscard]] const std::vector<Chunk>& chunks() const noexcept { return chunks_; }
    [[nodiscard]] std::int64_t bytesAlreadyPresent() const noexcept { return bytes_already_present_; }

    // Sum of the lengths of chunks that were complete before this run.
    [[nodiscard]] std::int64_t resumedBytes() const noexcept { return resumed_bytes_; }

    void publish(std::size_t index, std::int64_t bytes_written) noexcept;

    [[nodiscard]] std::int64_t bytesWritten(std::size_t index) const noexcept;
    [[nodiscard]] bool isChunkDone(std::size_t index) const noexcept;

    // Bytes written by this run across all chunks.
    [[nodiscard]] std::int64_t transferredBytes() const noexcept;

    // resumedBytes() + transferredBytes(), never above totalLength().
    [[nodiscard]] std::int64_t downloadedBytes() const noexcept;

    [[nodiscard]] bool isComplete() const noexcept;

    [[nodiscard]] std::size_t pendingChunkCount() const noexcept;

    // Length of the file prefix known to be contiguous and written. Truncating
    // to it after a failure keeps the length-based resume check valid.
    [[nodiscard]] std::int64_t safeResumeLength() const noexcept;

private:
    std::int64_t total_length_;
    std::int64_t chunk_size_;
    std::vector<Chunk> chunks_;
    std::int64_t bytes_already_present_;
    std::int64_t resumed_bytes_{0};
    std::vector<std::atomic<std::int64_t>> counters_;
};

} // namespace blobfetch
