#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace sandgrade::sandbox {

// Shared cancellation flag. Copies observe the same state, so a caller can
// keep one copy and hand another to an execution.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool IsCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    // Returns true when cancelled before the deadline passed.
    bool WaitUntil(std::chrono::steady_clock::time_point deadline) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_until(lock, deadline, [this] { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

}  // namespace sandgrade::sandbox
