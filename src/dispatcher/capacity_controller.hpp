#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

#include "sandbox/cancellation.hpp"

namespace sandgrade::dispatcher {

// Counting semaphore bounding the number of live sandboxes.
class CapacityController {
public:
    // Held for the lifetime of one execution; releases on destruction.
    class Slot {
    public:
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;
        ~Slot();

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        friend class CapacityController;
        explicit Slot(CapacityController* owner) : owner_(owner) {}
        void Release();

        CapacityController* owner_ = nullptr;
    };

    explicit CapacityController(std::size_t capacity);

    // Waits up to timeout for a free slot. Returns nullopt on timeout or
    // when cancel fires first.
    std::optional<Slot> Acquire(std::chrono::milliseconds timeout,
                                const sandbox::CancellationToken& cancel);

    std::size_t Capacity() const { return capacity_; }
    std::size_t InUse() const;
    std::size_t Available() const;

private:
    void ReleaseOne();

    const std::size_t capacity_;
    std::size_t in_use_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace sandgrade::dispatcher
