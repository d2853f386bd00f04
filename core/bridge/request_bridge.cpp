#include "request_bridge.hpp"

#include <algorithm>
#include <type_traits>

#include "logging/logger.hpp"
#include "stream_protocol.hpp"

namespace ccproxy {
namespace bridge {

namespace {
constexpr int kIdleTickMs = 1000;
constexpr int kStdinRetryMs = 10;  // Poll interval while the worker's stdin pipe is full

std::future<BridgeReply> ready_reply(BridgeStatus status, const std::string &message) {
    std::promise<BridgeReply> promise;
    promise.set_value(BridgeReply::failure(status, message));
    return promise.get_future();
}
}  // namespace

const char *bridge_status_to_string(BridgeStatus status) {
    switch (status) {
        case BridgeStatus::OK:
            return "OK";
        case BridgeStatus::NOT_READY:
            return "NOT_READY";
        case BridgeStatus::TIMEOUT:
            return "TIMEOUT";
        case BridgeStatus::SHUTTING_DOWN:
            return "SHUTTING_DOWN";
        default:
            return "UNKNOWN";
    }
}

RequestBridge::RequestBridge(const worker::WorkerConfig &worker_config, const BridgeConfig &config)
    : config_(config), supervisor_(worker_config, [this](const worker::WorkerEvent &event) {
          std::visit([this](const auto &e) { queue_.push(BridgeEvent{e}); }, event);
      }) {}

RequestBridge::~RequestBridge() { stop(); }

bool RequestBridge::start(std::string &error) {
    if (stopped_.load()) {
        error = "Bridge was stopped and cannot be restarted";
        return false;
    }
    if (running_.load()) {
        error = "Bridge already running";
        return false;
    }

    LOG_INFO("[Bridge] Starting (request timeout " << config_.request_timeout_ms << "ms)");

    if (!supervisor_.start()) {
        LOG_WARN("[Bridge] Initial worker start failed; retrying with backoff");
    }

    running_.store(true);
    loop_thread_ = std::thread([this]() { run_loop(); });
    return true;
}

void RequestBridge::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    LOG_INFO("[Bridge] Stopping");
    running_.store(false);
    queue_.close();

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    supervisor_.shutdown();

    // Event thread is gone; the tracker is ours now
    tracker_.fail_all(BridgeStatus::SHUTTING_DOWN, "Bridge shutting down");
    publish_counters();
    LOG_INFO("[Bridge] Stopped");
}

std::future<BridgeReply> RequestBridge::send_async(const std::string &prompt) {
    if (stopped_.load()) {
        return ready_reply(BridgeStatus::SHUTTING_DOWN, "Bridge shutting down");
    }
    if (!supervisor_.is_attached()) {
        return ready_reply(BridgeStatus::NOT_READY, "Worker not ready");
    }

    auto request = std::make_unique<PendingRequest>();
    request->id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    request->prompt = prompt;
    request->deadline = Clock::now() + std::chrono::milliseconds(config_.request_timeout_ms);

    std::future<BridgeReply> future = request->promise.get_future();
    if (!queue_.push(SendRequestEvent{std::move(request)})) {
        return ready_reply(BridgeStatus::SHUTTING_DOWN, "Bridge shutting down");
    }
    return future;
}

BridgeReply RequestBridge::send(const std::string &prompt) { return send_async(prompt).get(); }

HealthStatus RequestBridge::health_status() const {
    HealthStatus status;
    status.worker = supervisor_.get_snapshot();
    status.attached = status.worker.attached;
    status.queued_requests = queued_.load();
    status.request_in_flight = in_flight_.load();
    status.orphaned_requests = orphaned_.load();
    status.completed_requests = completed_.load();
    status.timed_out_requests = timed_out_.load();
    return status;
}

void RequestBridge::run_loop() {
    LOG_DEBUG("[Bridge] Event thread started");

    while (true) {
        auto event = queue_.pop(next_wait_ms());
        if (event) {
            handle_event(*event);
        } else if (queue_.is_closed()) {
            break;
        }

        const auto now = Clock::now();
        tracker_.expire(now);

        if (running_.load() && supervisor_.restart_due(now)) {
            LOG_INFO("[Bridge] Restarting worker");
            supervisor_.start();
        }

        flush_worker_stdin();
        dispatch_pending();
        publish_counters();
    }

    LOG_DEBUG("[Bridge] Event thread exiting");
}

void RequestBridge::handle_event(BridgeEvent &event) {
    std::visit(
        [this](auto &e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, worker::WorkerLineEvent>) {
                handle_line(e);
            } else if constexpr (std::is_same_v<T, worker::WorkerStderrEvent>) {
                supervisor_.on_stderr_line(e.generation, e.line);
            } else if constexpr (std::is_same_v<T, worker::WorkerExitEvent>) {
                if (supervisor_.on_exit(e.generation, e.exit_code) >= 0) {
                    tracker_.on_worker_lost();
                }
            } else if constexpr (std::is_same_v<T, SendRequestEvent>) {
                tracker_.enqueue(std::move(e.request));
            }
        },
        event);
}

void RequestBridge::handle_line(const worker::WorkerLineEvent &event) {
    if (!supervisor_.on_stdout_line(event.generation)) {
        return;  // Replaced worker
    }

    auto parsed = parse_stream_line(event.line);
    if (!parsed) {
        LOG_DEBUG("[Bridge] Discarding non-protocol line: " << event.line.substr(0, 120));
        return;
    }

    if (auto *assistant = std::get_if<AssistantEvent>(&*parsed)) {
        tracker_.on_assistant(*assistant);
    } else if (auto *result = std::get_if<ResultEvent>(&*parsed)) {
        tracker_.on_result(*result);
    }
}

void RequestBridge::dispatch_pending() {
    if (!running_.load() || !supervisor_.is_attached()) {
        return;
    }

    const PendingRequest *request = tracker_.dispatch_next();
    if (request == nullptr) {
        return;
    }

    std::string error;
    if (!supervisor_.write_line(encode_user_message(request->prompt), error)) {
        LOG_WARN("[Bridge] Failed to write request " << request->id << " to worker: " << error);
        tracker_.on_dispatch_failed();
        return;
    }
    if (supervisor_.stdin_backlog() > 0) {
        LOG_DEBUG("[Bridge] Request " << request->id << " partially written, " << supervisor_.stdin_backlog()
                                      << " bytes pending");
    } else {
        LOG_DEBUG("[Bridge] Request " << request->id << " sent to worker");
    }
}

void RequestBridge::flush_worker_stdin() {
    // A timed-out request's bytes are still flushed: dropping them would
    // leave a partial line in front of the next prompt
    if (supervisor_.stdin_backlog() == 0) {
        return;
    }
    std::string error;
    if (!supervisor_.flush_stdin(error)) {
        LOG_WARN("[Bridge] Failed to write to worker stdin: " << error);
    }
}

int RequestBridge::next_wait_ms() const {
    auto earliest = tracker_.next_deadline();
    auto restart_at = supervisor_.next_restart_time();
    if (restart_at && (!earliest || *restart_at < *earliest)) {
        earliest = restart_at;
    }

    const int max_wait = supervisor_.stdin_backlog() > 0 ? kStdinRetryMs : kIdleTickMs;
    if (!earliest) {
        return max_wait;
    }

    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(*earliest - Clock::now()).count();
    // +1 so the deadline has passed when we wake
    return static_cast<int>(std::clamp<int64_t>(wait + 1, 1, max_wait));
}

void RequestBridge::publish_counters() {
    queued_.store(tracker_.queued());
    in_flight_.store(tracker_.in_flight());
    orphaned_.store(tracker_.orphaned());
    completed_.store(tracker_.completed());
    timed_out_.store(tracker_.timed_out());
}

}  // namespace bridge
}  // namespace ccproxy
