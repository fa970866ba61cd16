#include "sandbox/cancellation_watch.hpp"

#include <utility>

namespace sandgrade::sandbox {

CancellationWatch::CancellationWatch(CancellationToken parent,
                                     std::function<bool()> disconnect_check,
                                     std::chrono::milliseconds interval)
    : parent_(std::move(parent))
    , disconnect_check_(std::move(disconnect_check))
    , interval_(interval) {
    thread_ = std::thread([this] { Poll(); });
}

CancellationWatch::~CancellationWatch() {
    stop_.Cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void CancellationWatch::Poll() {
    while (!token_.IsCancelled()) {
        if (parent_.IsCancelled()) {
            token_.Cancel();
            return;
        }
        if (disconnect_check_ && disconnect_check_()) {
            disconnected_.store(true);
            token_.Cancel();
            return;
        }
        if (stop_.WaitUntil(std::chrono::steady_clock::now() + interval_)) {
            return;
        }
    }
}

}  // namespace sandgrade::sandbox
