#include "dispatcher/capacity_controller.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace sandgrade::dispatcher {
namespace {

// Cancellation is observed between waits of at most this long.
constexpr std::chrono::milliseconds kWaitSlice{20};

}  // namespace

CapacityController::Slot::Slot(Slot&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
}

CapacityController::Slot& CapacityController::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        Release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

CapacityController::Slot::~Slot() {
    Release();
}

void CapacityController::Slot::Release() {
    if (owner_ != nullptr) {
        owner_->ReleaseOne();
        owner_ = nullptr;
    }
}

CapacityController::CapacityController(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

std::optional<CapacityController::Slot> CapacityController::Acquire(
    std::chrono::milliseconds timeout,
    const sandbox::CancellationToken& cancel) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (in_use_ >= capacity_) {
        if (cancel.IsCancelled()) {
            return std::nullopt;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            utils::LogWarn("capacity", "admission timed out",
                           {{"capacity", std::to_string(capacity_)}});
            return std::nullopt;
        }
        cv_.wait_until(lock, std::min(deadline, now + kWaitSlice));
    }
    if (cancel.IsCancelled()) {
        return std::nullopt;
    }
    ++in_use_;
    return Slot(this);
}

std::size_t CapacityController::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

std::size_t CapacityController::Available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - in_use_;
}

void CapacityController::ReleaseOne() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

}  // namespace sandgrade::dispatcher
