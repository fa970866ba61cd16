#include "sandbox/log_channel.hpp"

#include <algorithm>

namespace sandgrade::sandbox {

LogChannel::LogChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool LogChannel::Push(LogChunk chunk) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || chunks_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        chunks_.push_back(std::move(chunk));
    }
    not_empty_.notify_one();
    return true;
}

bool LogChannel::TryPop(LogChunk& chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chunks_.empty()) {
            return false;
        }
        chunk = std::move(chunks_.front());
        chunks_.pop_front();
    }
    not_full_.notify_one();
    return true;
}

bool LogChannel::Pop(LogChunk& chunk, std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !chunks_.empty(); })) {
            return false;
        }
        if (chunks_.empty()) {
            return false;
        }
        chunk = std::move(chunks_.front());
        chunks_.pop_front();
    }
    not_full_.notify_one();
    return true;
}

void LogChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool LogChannel::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool LogChannel::IsDrained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && chunks_.empty();
}

std::size_t LogChannel::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

}  // namespace sandgrade::sandbox
