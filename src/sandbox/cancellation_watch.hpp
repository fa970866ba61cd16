#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include "sandbox/cancellation.hpp"

namespace sandgrade::sandbox {

// Owns a per-request token that is cancelled when the parent token is, or
// when the disconnect check reports the caller has gone away. The check is
// polled on a background thread until the watch is destroyed.
class CancellationWatch {
public:
    CancellationWatch(CancellationToken parent,
                      std::function<bool()> disconnect_check,
                      std::chrono::milliseconds interval = std::chrono::milliseconds(50));
    ~CancellationWatch();

    CancellationWatch(const CancellationWatch&) = delete;
    CancellationWatch& operator=(const CancellationWatch&) = delete;

    const CancellationToken& Token() const { return token_; }
    bool Disconnected() const { return disconnected_.load(); }

private:
    void Poll();

    CancellationToken parent_;
    CancellationToken token_;
    CancellationToken stop_;
    std::function<bool()> disconnect_check_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> disconnected_{false};
    std::thread thread_;
};

}  // namespace sandgrade::sandbox
