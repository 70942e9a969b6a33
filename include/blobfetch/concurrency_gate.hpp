#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace blobfetch {

// Counting admission gate: at most `capacity` holders at a time.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(std::size_t capacity);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    void acquire();
    void release();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t inUse() const;

    // Releases one already-acquired slot when it goes out of scope.
    class Slot {
    public:
        explicit Slot(ConcurrencyGate& gate) noexcept : gate_(&gate) {}
        ~Slot() {
            if (gate_) {
                gate_->release();
            }
        }
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot& operator=(Slot&&) = delete;

    private:
        ConcurrencyGate* gate_;
    };

private:
    const std::size_t capacity_;
    std::size_t in_use_{0};
    mutable std::mutex mutex_;
    std::condition_variable available_;
};

} // namespace blobfetch
