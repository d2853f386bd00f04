#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "worker_config.hpp"
#include "worker_events.hpp"
#include "worker_process.hpp"

namespace ccproxy {
namespace worker {

// WorkerSupervisor keeps one worker process alive.
// State machine: STARTING -> RUNNING -> EXITED -> (backoff) -> STARTING -> ...
//
// Every unplanned exit (and every failed spawn) schedules a restart after
//   min(base_delay_ms * 2^failure_count, max_delay_ms)
// and increments failure_count. Any stdout line resets failure_count to 0.
// There is no circuit breaker: a worker that can never start is retried forever.
//
// Threading: start(), on_exit(), on_stdout_line(), on_stderr_line(), write_line()
// and shutdown() are called from the owner's single event thread. Observer
// threads only call the event sink. is_attached(), failure_count() and
// get_snapshot() are safe from any thread.
class WorkerSupervisor {
public:
    using EventSink = std::function<void(const WorkerEvent &)>;
    using Clock = std::chrono::steady_clock;

    // Immutable snapshot of supervision state, for health reporting
    struct WorkerSnapshot {
        WorkerState state = WorkerState::STARTING;
        bool attached = false;
        uint64_t generation = 0;
        std::optional<int> pid;
        int failure_count = 0;
        int last_backoff_ms = 0;
        std::optional<int64_t> next_restart_in_ms;  // nullopt unless a restart is scheduled
        std::optional<int> last_exit_code;
        uint64_t restart_count = 0;
        uint64_t exit_count = 0;
        uint64_t spawn_failure_count = 0;
        std::string last_error;
    };

    WorkerSupervisor(const WorkerConfig &config, EventSink sink);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor &) = delete;
    WorkerSupervisor &operator=(const WorkerSupervisor &) = delete;

    // Launch a worker. Refuses (returns false) while the current worker has not
    // been observed as exited, or after shutdown(). A spawn failure also returns
    // false and is reported through the sink as a WorkerExitEvent with code -1.
    bool start();

    // Handle an exit event. Returns the scheduled restart delay in ms,
    // or -1 when the event is stale or the supervisor is stopping.
    int on_exit(uint64_t generation, int exit_code);

    // Liveness evidence. Returns false for a stale generation.
    bool on_stdout_line(uint64_t generation);

    // Diagnostics only
    void on_stderr_line(uint64_t generation, const std::string &line);

    // True when a scheduled restart is due
    bool restart_due(Clock::time_point now) const;
    std::optional<Clock::time_point> next_restart_time() const;

    // Queue one line for the current worker's stdin and write what the pipe
    // accepts now. The rest stays in the backlog for flush_stdin().
    bool write_line(const std::string &line, std::string &error);
    bool flush_stdin(std::string &error);
    size_t stdin_backlog() const;

    bool is_attached() const { return state_.load() == WorkerState::RUNNING; }
    WorkerState state() const { return state_.load(); }
    uint64_t generation() const;
    int failure_count() const;

    // Stop supervising: no more restarts, worker shut down, observers joined
    void shutdown();

    WorkerSnapshot get_snapshot() const;

    // min(base * 2^failure_count, max)
    static int compute_backoff_ms(const RestartPolicyConfig &policy, int failure_count);

private:
    struct Observers {
        std::shared_ptr<std::atomic<bool>> stop;
        std::thread stdout_thread;  // Also reports the exit, after stdout is drained
        std::thread stderr_thread;
    };

    struct RestartState {
        int failure_count = 0;
        int last_backoff_ms = 0;
        bool restart_pending = false;
        Clock::time_point next_restart_time;
    };

    WorkerConfig config_;
    EventSink sink_;

    std::unique_ptr<WorkerProcess> process_;
    Observers observers_;
    std::atomic<WorkerState> state_{WorkerState::STARTING};
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;  // Guards everything below
    uint64_t generation_ = 0;
    RestartState restart_;
    std::optional<int> pid_;
    std::optional<int> last_exit_code_;
    uint64_t restart_count_ = 0;
    uint64_t exit_count_ = 0;
    uint64_t spawn_failure_count_ = 0;
    std::string last_error_;

    void start_observers(uint64_t generation);
    void teardown_current();
};

}  // namespace worker
}  // namespace ccproxy
