#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <thread>

#include "bridge_config.hpp"
#include "event_queue.hpp"
#include "exchange_tracker.hpp"
#include "i_request_bridge.hpp"
#include "worker/worker_config.hpp"
#include "worker/worker_supervisor.hpp"

namespace ccproxy {
namespace bridge {

/**
 * @brief Request/response bridge over one supervised worker process
 *
 * send() turns a prompt into a user message on the worker's stdin and
 * resolves when the worker's next terminal event arrives on stdout, or
 * fails with TIMEOUT at the request deadline.
 *
 * Thread model:
 * - One event thread owns the ExchangeTracker and drives the supervisor
 *   (start, restart, exit and line handling, stdin writes)
 * - Worker observer threads and caller threads only push into the event queue
 * - Deadlines and restart times are evaluated on the event thread
 * - Worker stdin is non-blocking; a prompt the pipe cannot take at once is
 *   finished by later loop iterations, so a worker that stops reading never
 *   stalls deadlines or restarts
 *
 * Lifecycle:
 * - start() spawns the first worker and the event thread; a spawn failure
 *   is not fatal, it enters the normal restart backoff
 * - stop() joins the event thread, shuts the worker down and fails every
 *   outstanding request with SHUTTING_DOWN. A stopped bridge cannot restart.
 */
class RequestBridge : public IRequestBridge {
public:
    RequestBridge(const worker::WorkerConfig &worker_config, const BridgeConfig &config);
    ~RequestBridge() override;

    RequestBridge(const RequestBridge &) = delete;
    RequestBridge &operator=(const RequestBridge &) = delete;

    bool start(std::string &error);
    void stop();

    std::future<BridgeReply> send_async(const std::string &prompt) override;
    BridgeReply send(const std::string &prompt) override;
    HealthStatus health_status() const override;

private:
    using Clock = std::chrono::steady_clock;

    BridgeConfig config_;
    BridgeEventQueue queue_;  // Declared before supervisor_: its sink pushes here
    worker::WorkerSupervisor supervisor_;
    ExchangeTracker tracker_;  // Event thread only

    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> next_request_id_{1};

    // Tracker counters republished for other threads
    std::atomic<size_t> queued_{0};
    std::atomic<bool> in_flight_{false};
    std::atomic<size_t> orphaned_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> timed_out_{0};

    void run_loop();
    void handle_event(BridgeEvent &event);
    void handle_line(const worker::WorkerLineEvent &event);
    void dispatch_pending();
    void flush_worker_stdin();
    int next_wait_ms() const;
    void publish_counters();
};

}  // namespace bridge
}  // namespace ccproxy
