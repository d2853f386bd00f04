#pragma once

#include <sys/types.h>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "line_stdio_client.hpp"

namespace ccproxy {
namespace worker {

enum class WorkerState { STARTING, RUNNING, EXITED };

const char *worker_state_to_string(WorkerState state);

// Resolve a command to an executable path. Commands containing '/' are used as
// given, others are searched on PATH. Fails when nothing executable is found.
bool resolve_executable(const std::string &command, std::string &resolved, std::string &error);

// WorkerProcess manages the lifecycle of one worker child process
// Responsibilities:
// - Spawn process with redirected stdin/stdout/stderr and an explicit environment
// - Observe exit without blocking (poll_exit), recording the exit code
// - Clean/forced shutdown
class WorkerProcess {
public:
    WorkerProcess(const std::string &worker_id, const std::string &command, const std::vector<std::string> &args = {},
                  const std::map<std::string, std::string> &env = {}, int shutdown_timeout_ms = 2000);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    // Spawn the worker process
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Reap the child if it has exited. Never blocks.
    // Returns true once the process is known to have exited.
    bool poll_exit();

    // Poll until exit or timeout
    bool wait_for_exit(int timeout_ms);

    bool is_running() { return state_.load() == WorkerState::RUNNING && !poll_exit(); }

    WorkerState state() const { return state_.load(); }

    // Exit code: WEXITSTATUS, or 128 + signal number when killed by a signal
    std::optional<int> exit_code() const;

    // Shutdown sequence: EOF -> wait -> kill. Handles stay open until close_handles().
    void shutdown();

    // Close every pipe. Callers must have stopped all readers first.
    void close_handles() { client_.close_all(); }

    LineStdioClient &client() { return client_; }
    const LineStdioClient &client() const { return client_; }

    pid_t pid() const { return pid_; }
    const std::string &worker_id() const { return worker_id_; }
    const std::string &last_error() const { return error_; }

private:
    std::string worker_id_;
    std::string command_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> env_;
    int shutdown_timeout_ms_;
    std::string error_;

    LineStdioClient client_;

    pid_t pid_ = -1;
    std::atomic<WorkerState> state_{WorkerState::STARTING};
    mutable std::mutex reap_mutex_;
    std::optional<int> exit_code_;

    std::vector<std::string> build_environment() const;
    void force_terminate();
};

}  // namespace worker
}  // namespace ccproxy
