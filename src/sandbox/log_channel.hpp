#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace sandgrade::sandbox {

enum class LogStream {
    kStdout,
    kStderr
};

struct LogChunk {
    LogStream stream = LogStream::kStdout;
    std::string data;
};

// Bounded queue between a container's log reader and the runner. Producers
// block while it is full; Close() releases them and marks end of stream.
class LogChannel {
public:
    explicit LogChannel(std::size_t capacity = 64);

    bool Push(LogChunk chunk);
    bool TryPop(LogChunk& chunk);
    bool Pop(LogChunk& chunk, std::chrono::milliseconds timeout);
    void Close();

    bool IsClosed() const;
    bool IsDrained() const;
    std::size_t Size() const;
    std::size_t Capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    std::deque<LogChunk> chunks_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

}  // namespace sandgrade::sandbox
