#include "worker_supervisor.hpp"

#include <algorithm>
#include <cstdlib>

#include "logging/logger.hpp"

namespace ccproxy {
namespace worker {

namespace {
constexpr int kObserverPollMs = 100;
constexpr int kExitPollMs = 20;
}  // namespace

WorkerSupervisor::WorkerSupervisor(const WorkerConfig &config, EventSink sink)
    : config_(config), sink_(std::move(sink)) {
    for (const auto &name : config_.required_env) {
        if (config_.env.count(name) == 0 && std::getenv(name.c_str()) == nullptr) {
            LOG_WARN("[Supervisor] Required environment variable '" << name << "' is not set for worker '"
                                                                    << config_.id << "'");
        }
    }
}

WorkerSupervisor::~WorkerSupervisor() { shutdown(); }

int WorkerSupervisor::compute_backoff_ms(const RestartPolicyConfig &policy, int failure_count) {
    int64_t delay = std::max(policy.base_delay_ms, 0);
    const int64_t max_delay = std::max(policy.max_delay_ms, 0);
    for (int i = 0; i < failure_count && delay < max_delay; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min(delay, max_delay));
}

bool WorkerSupervisor::start() {
    if (stopping_.load()) {
        LOG_WARN("[Supervisor] start() ignored for '" << config_.id << "': supervisor is shut down");
        return false;
    }

    // Double-start guard: the previous worker must have been observed as exited
    if (state_.load() == WorkerState::RUNNING || (process_ && !process_->poll_exit())) {
        LOG_WARN("[Supervisor] start() ignored for '" << config_.id << "': previous worker still running");
        return false;
    }

    teardown_current();

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ > 0) {
            restart_count_++;
        }
        generation = ++generation_;
        restart_.restart_pending = false;
        pid_.reset();
    }
    state_.store(WorkerState::STARTING);

    auto process = std::make_unique<WorkerProcess>(config_.id, config_.command, config_.args, config_.env,
                                                   config_.shutdown_timeout_ms);
    if (!process->spawn()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            spawn_failure_count_++;
            last_error_ = process->last_error();
        }
        LOG_ERROR("[Supervisor] Failed to start worker '" << config_.id << "' (generation " << generation
                                                          << "): " << process->last_error());
        // Same recovery path as a crash
        sink_(WorkerExitEvent{generation, -1});
        return false;
    }

    process_ = std::move(process);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = static_cast<int>(process_->pid());
    }
    state_.store(WorkerState::RUNNING);

    start_observers(generation);

    LOG_INFO("[Supervisor] Worker '" << config_.id << "' running (generation " << generation
                                     << ", PID=" << process_->pid() << ")");
    return true;
}

void WorkerSupervisor::start_observers(uint64_t generation) {
    observers_.stop = std::make_shared<std::atomic<bool>>(false);
    auto stop = observers_.stop;
    WorkerProcess *process = process_.get();
    const std::string worker_id = config_.id;

    observers_.stdout_thread = std::thread([this, stop, process, generation, worker_id]() {
        LineReader &reader = process->client().stdout_reader();
        std::string line;

        while (!stop->load()) {
            if (reader.read_line(line, kObserverPollMs)) {
                sink_(WorkerLineEvent{generation, line});
                continue;
            }
            if (reader.at_eof()) {
                break;
            }
            if (!reader.last_error().empty()) {
                LOG_WARN("[" << worker_id << "] stdout reader stopped: " << reader.last_error());
                break;
            }
            // Quiet pipe: a dead worker whose stdout is held open elsewhere still counts as exited
            if (process->poll_exit()) {
                break;
            }
        }

        while (!stop->load()) {
            if (process->poll_exit()) {
                sink_(WorkerExitEvent{generation, process->exit_code().value_or(-1)});
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(kExitPollMs));
        }
    });

    observers_.stderr_thread = std::thread([this, stop, process, generation]() {
        LineReader &reader = process->client().stderr_reader();
        std::string line;

        while (!stop->load()) {
            if (reader.read_line(line, kObserverPollMs)) {
                sink_(WorkerStderrEvent{generation, line});
                continue;
            }
            if (reader.at_eof() || !reader.last_error().empty()) {
                return;
            }
        }
    });
}

void WorkerSupervisor::teardown_current() {
    if (observers_.stop) {
        observers_.stop->store(true);
    }
    if (process_) {
        process_->shutdown();
    }
    if (observers_.stdout_thread.joinable()) {
        observers_.stdout_thread.join();
    }
    if (observers_.stderr_thread.joinable()) {
        observers_.stderr_thread.join();
    }
    observers_.stop.reset();

    if (process_) {
        process_->close_handles();
        process_.reset();
    }
}

int WorkerSupervisor::on_exit(uint64_t generation, int exit_code) {
    if (stopping_.load()) {
        return -1;
    }

    int delay_ms = 0;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            LOG_DEBUG("[Supervisor] Ignoring exit of stale generation " << generation);
            return -1;
        }

        state_.store(WorkerState::EXITED);
        exit_count_++;
        last_exit_code_ = exit_code;

        delay_ms = compute_backoff_ms(config_.restart_policy, restart_.failure_count);
        restart_.failure_count++;
        restart_.last_backoff_ms = delay_ms;
        restart_.restart_pending = true;
        restart_.next_restart_time = Clock::now() + std::chrono::milliseconds(delay_ms);
        failures = restart_.failure_count;
    }

    LOG_WARN("[Supervisor] Worker '" << config_.id << "' exited (code=" << exit_code
                                     << ", consecutive failures=" << failures << ", restart in " << delay_ms
                                     << "ms)");
    return delay_ms;
}

bool WorkerSupervisor::on_stdout_line(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        return false;
    }

    if (restart_.failure_count > 0) {
        LOG_INFO("[Supervisor] Worker '" << config_.id << "' producing output again (after "
                                         << restart_.failure_count << " consecutive failures)");
    }
    restart_.failure_count = 0;
    return true;
}

void WorkerSupervisor::on_stderr_line(uint64_t generation, const std::string &line) {
    if (generation != this->generation()) {
        return;
    }
    LOG_WARN("[" << config_.id << "] stderr: " << line);
}

bool WorkerSupervisor::restart_due(Clock::time_point now) const {
    if (stopping_.load() || state_.load() != WorkerState::EXITED) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return restart_.restart_pending && now >= restart_.next_restart_time;
}

std::optional<WorkerSupervisor::Clock::time_point> WorkerSupervisor::next_restart_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!restart_.restart_pending) {
        return std::nullopt;
    }
    return restart_.next_restart_time;
}

bool WorkerSupervisor::write_line(const std::string &line, std::string &error) {
    if (!process_ || !is_attached()) {
        error = "No worker attached";
        return false;
    }
    if (!process_->client().queue_line(line)) {
        error = process_->client().last_error();
        return false;
    }
    return true;
}

bool WorkerSupervisor::flush_stdin(std::string &error) {
    if (!process_ || !is_attached()) {
        return true;
    }
    if (!process_->client().flush()) {
        error = process_->client().last_error();
        return false;
    }
    return true;
}

size_t WorkerSupervisor::stdin_backlog() const {
    return process_ && is_attached() ? process_->client().pending_bytes() : 0;
}

uint64_t WorkerSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

int WorkerSupervisor::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return restart_.failure_count;
}

void WorkerSupervisor::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }

    LOG_INFO("[Supervisor] Shutting down worker '" << config_.id << "'");
    teardown_current();
    state_.store(WorkerState::EXITED);

    std::lock_guard<std::mutex> lock(mutex_);
    restart_.restart_pending = false;
    pid_.reset();
}

WorkerSupervisor::WorkerSnapshot WorkerSupervisor::get_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();

    WorkerSnapshot snap;
    snap.state = state_.load();
    snap.attached = snap.state == WorkerState::RUNNING;
    snap.generation = generation_;
    snap.pid = pid_;
    snap.failure_count = restart_.failure_count;
    snap.last_backoff_ms = restart_.last_backoff_ms;
    snap.last_exit_code = last_exit_code_;
    snap.restart_count = restart_count_;
    snap.exit_count = exit_count_;
    snap.spawn_failure_count = spawn_failure_count_;
    snap.last_error = last_error_;

    if (restart_.restart_pending) {
        if (now >= restart_.next_restart_time) {
            snap.next_restart_in_ms = int64_t{0};
        } else {
            snap.next_restart_in_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(restart_.next_restart_time - now).count();
        }
    }

    return snap;
}

}  // namespace worker
}  // namespace ccproxy
