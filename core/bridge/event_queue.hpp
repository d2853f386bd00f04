#pragma once

/**
 * @file event_queue.hpp
 * @brief Single-consumer event channel feeding the bridge's event thread
 *
 * Producers: worker observer threads (stdout lines, stderr lines, exit) and
 * caller threads (send requests). Consumer: the bridge event thread, which
 * is the only code allowed to touch bridge state.
 *
 * Unlike a telemetry fan-out queue this one is unbounded and never drops:
 * a lost stdout line would corrupt request/reply correlation.
 */

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <variant>

#include "exchange_tracker.hpp"
#include "worker/worker_events.hpp"

namespace ccproxy {
namespace bridge {

// A caller's request entering the event thread
struct SendRequestEvent {
    std::unique_ptr<PendingRequest> request;
};

using BridgeEvent =
    std::variant<worker::WorkerLineEvent, worker::WorkerStderrEvent, worker::WorkerExitEvent, SendRequestEvent>;

class BridgeEventQueue {
public:
    BridgeEventQueue() = default;

    BridgeEventQueue(const BridgeEventQueue &) = delete;
    BridgeEventQueue &operator=(const BridgeEventQueue &) = delete;

    /**
     * @brief Push event (producer side). Never blocks.
     *
     * @return false if the queue is closed; the event is destroyed
     */
    bool push(BridgeEvent event);

    /**
     * @brief Pop next event (consumer side)
     *
     * Blocks until an event is available, the queue is closed or the timeout
     * expires. Events pushed before close() are still delivered.
     *
     * @param timeout_ms Max time to wait (0 = non-blocking)
     * @return Event if available, std::nullopt on timeout or when closed and drained
     */
    std::optional<BridgeEvent> pop(int timeout_ms);

    size_t size() const;

    void close();
    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<BridgeEvent> queue_;
    bool closed_ = false;
};

}  // namespace bridge
}  // namespace ccproxy
