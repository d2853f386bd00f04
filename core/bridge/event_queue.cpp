#include "event_queue.hpp"

#include <chrono>

namespace ccproxy {
namespace bridge {

bool BridgeEventQueue::push(BridgeEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push(std::move(event));
    }

    cv_.notify_one();
    return true;
}

std::optional<BridgeEvent> BridgeEventQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (timeout_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue_.empty() || closed_; });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    std::optional<BridgeEvent> event(std::move(queue_.front()));
    queue_.pop();
    return event;
}

size_t BridgeEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void BridgeEventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    cv_.notify_all();
}

bool BridgeEventQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace bridge
}  // namespace ccproxy
