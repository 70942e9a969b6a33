#include "blobfetch/transfer_state.hpp"

#include <algorithm>
#include <utility>

namespace blobfetch {

TransferState::TransferState(std::int64_t total_length,
                             std::int64_t chunk_size,
                             std::vector<Chunk> chunks,
                             std::int64_t bytes_already_present)
    : total_length_(total_length),
      chunk_size_(chunk_size),
      chunks_(std::move(chunks)),
      bytes_already_present_(bytes_already_present),
      counters_(chunks_.size()) {
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        counters_[i].store(0, std::memory_order_relaxed);
        if (chunks_[i].done) {
            resumed_bytes_ += chunks_[i].length;
        }
    }
}

void TransferState::publish(std::size_t index, std::int64_t bytes_written) noexcept {
    if (index < counters_.size()) {
        counters_[index].store(bytes_written, std::memory_order_release);
    }
}

std::int64_t TransferState::bytesWritten(std::size_t index) const noexcept {
    if (index >= counters_.size()) {
        return 0;
    }
    return counters_[index].load(std::memory_order_acquire);
}

bool TransferState::isChunkDone(std::size_t index) const noexcept {
    if (index >= chunks_.size()) {
        return false;
    }
    return chunks_[index].done || bytesWritten(index) >= chunks_[index].length;
}

std::int64_t TransferState::transferredBytes() const noexcept {
    std::int64_t sum = 0;
    for (const auto& counter : counters_) {
        sum += counter.load(std::memory_order_relaxed);
    }
    return sum;
}

std::int64_t TransferState::downloadedBytes() const noexcept {
    return std::min(total_length_, resumed_bytes_ + transferredBytes());
}

bool TransferState::isComplete() const noexcept {
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        if (!isChunkDone(i)) {
            return false;
        }
    }
    return true;
}

std::size_t TransferState::pendingChunkCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(chunks_.begin(), chunks_.end(), [](const Chunk& c) { return !c.done; }));
}

std::int64_t TransferState::safeResumeLength() const noexcept {
    std::int64_t prefix = 0;
    for (const auto& chunk : chunks_) {
        if (isChunkDone(chunk.index)) {
            prefix = chunk.end();
            continue;
        }
        prefix = chunk.offset + bytesWritten(chunk.index);
        break;
    }
    return std::max(prefix, std::min(bytes_already_present_, total_length_));
}

} // namespace blobfetch
