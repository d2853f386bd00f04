#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bridge_types.hpp"
#include "stream_protocol.hpp"

namespace ccproxy {
namespace bridge {

// One caller waiting for a worker reply
struct PendingRequest {
    uint64_t id = 0;
    std::string prompt;
    std::string text;  // Accumulated text blocks, stream order
    std::promise<BridgeReply> promise;
    std::chrono::steady_clock::time_point deadline;
};

/**
 * @brief Correlates the worker's unmarked replies with queued callers
 *
 * The worker protocol carries no request id, so exactly one request is in
 * flight at a time (the "slot"); later callers wait FIFO. Stdout events
 * always belong to the in-flight request, with two exceptions:
 *
 * - Stale replies: when an in-flight request times out, the worker still
 *   owes its reply. The next terminal event (and the text before it) is
 *   discarded so it can never resolve a different caller.
 * - Orphans: when the worker exits, the in-flight request leaves the slot
 *   without being resolved and fails only at its own deadline. The new
 *   worker owes nothing, so the stale count resets.
 *
 * Every promise is fulfilled exactly once. Not thread-safe: owned by the
 * bridge's event thread.
 */
class ExchangeTracker {
public:
    using Clock = std::chrono::steady_clock;

    ExchangeTracker() = default;
    ~ExchangeTracker();

    ExchangeTracker(const ExchangeTracker &) = delete;
    ExchangeTracker &operator=(const ExchangeTracker &) = delete;

    void enqueue(std::unique_ptr<PendingRequest> request);

    // Move the queue head into the free slot. Returns the request to write,
    // or nullptr when the slot is busy or nothing is queued.
    const PendingRequest *dispatch_next();

    // The in-flight request could not be written: orphan it
    void on_dispatch_failed();

    void on_assistant(const AssistantEvent &event);

    // Returns true when a caller was resolved
    bool on_result(const ResultEvent &event);

    // Fail every request whose deadline has passed. Returns how many expired.
    size_t expire(Clock::time_point now);

    // The worker exited: orphan the in-flight request and forget owed replies
    void on_worker_lost();

    // Fail everything still pending
    void fail_all(BridgeStatus status, const std::string &message);

    std::optional<Clock::time_point> next_deadline() const;

    size_t queued() const { return queue_.size(); }
    bool in_flight() const { return in_flight_ != nullptr; }
    size_t orphaned() const { return orphans_.size(); }
    int stale_replies() const { return stale_replies_; }
    uint64_t completed() const { return completed_; }
    uint64_t timed_out() const { return timed_out_; }

private:
    std::deque<std::unique_ptr<PendingRequest>> queue_;
    std::unique_ptr<PendingRequest> in_flight_;
    std::vector<std::unique_ptr<PendingRequest>> orphans_;
    int stale_replies_ = 0;
    uint64_t completed_ = 0;
    uint64_t timed_out_ = 0;

    void fail_timeout(PendingRequest &request);
};

}  // namespace bridge
}  // namespace ccproxy
