#include "blobfetch/concurrency_gate.hpp"

#include <algorithm>

namespace blobfetch {

ConcurrencyGate::ConcurrencyGate(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;
}

void ConcurrencyGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    available_.notify_one();
}

std::size_t ConcurrencyGate::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

} // namespace blobfetch
