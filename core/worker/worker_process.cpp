#include "worker_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include "logging/logger.hpp"

extern char **environ;

namespace ccproxy {
namespace worker {

namespace {

bool is_executable_file(const std::string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = -1;
    fds[1] = -1;
}

}  // namespace

const char *worker_state_to_string(WorkerState state) {
    switch (state) {
        case WorkerState::STARTING:
            return "STARTING";
        case WorkerState::RUNNING:
            return "RUNNING";
        case WorkerState::EXITED:
            return "EXITED";
        default:
            return "UNKNOWN";
    }
}

bool resolve_executable(const std::string &command, std::string &resolved, std::string &error) {
    if (command.empty()) {
        error = "Executable not found: empty command";
        return false;
    }

    if (command.find('/') != std::string::npos) {
        if (access(command.c_str(), F_OK) != 0) {
            error = "Executable not found: " + command;
            return false;
        }
        if (!is_executable_file(command)) {
            error = "Permission denied: " + command;
            return false;
        }
        resolved = command;
        return true;
    }

    const char *path_env = std::getenv("PATH");
    std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + command;
        if (is_executable_file(candidate)) {
            resolved = candidate;
            return true;
        }
    }

    error = "Executable not found: " + command + " (searched PATH)";
    return false;
}

WorkerProcess::WorkerProcess(const std::string &worker_id, const std::string &command,
                             const std::vector<std::string> &args, const std::map<std::string, std::string> &env,
                             int shutdown_timeout_ms)
    : worker_id_(worker_id), command_(command), args_(args), env_(env), shutdown_timeout_ms_(shutdown_timeout_ms) {}

WorkerProcess::~WorkerProcess() {
    shutdown();
    close_handles();
}

std::vector<std::string> WorkerProcess::build_environment() const {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto &[key, value] : env_) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto &[key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

bool WorkerProcess::spawn() {
    error_.clear();
    LOG_INFO("[" << worker_id_ << "] Spawning: " << command_);

    if (pid_ > 0) {
        error_ = "Worker already spawned (PID=" + std::to_string(pid_) + ")";
        return false;
    }

    std::string abs_path;
    if (!resolve_executable(command_, abs_path, error_)) {
        LOG_ERROR("[" << worker_id_ << "] " << error_);
        return false;
    }

    // Prepare argv/envp before fork: the child must not allocate
    std::vector<std::string> env_strings = build_environment();
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<char *> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(abs_path.data());
    for (auto &arg : args_) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // Parent ends are close-on-exec so later workers never inherit them
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close_pipe(stdin_pipe);
        return false;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stderr pipe: " + std::string(strerror(errno));
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return false;
    }

    if (pid == 0) {
        // Child process. dup2 clears FD_CLOEXEC on the targets.
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        // Restore default SIGPIPE for the worker
        signal(SIGPIPE, SIG_DFL);

        execve(argv[0], argv.data(), envp.data());

        // exec failed; the supervisor sees exit code 127
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // The event thread must never park in write() on a worker that stops reading
    int flags = fcntl(stdin_pipe[1], F_GETFL);
    if (flags < 0 || fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN("[" << worker_id_ << "] Could not make stdin non-blocking: " << strerror(errno));
    }

    pid_ = pid;
    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        exit_code_.reset();
    }
    client_.set_handles(stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]);
    state_.store(WorkerState::RUNNING);

    LOG_INFO("[" << worker_id_ << "] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool WorkerProcess::poll_exit() {
    std::lock_guard<std::mutex> lock(reap_mutex_);

    if (state_.load() == WorkerState::EXITED) {
        return true;
    }
    if (pid_ <= 0) {
        return false;  // Never spawned
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            } else {
                exit_code_ = -1;
            }
            state_.store(WorkerState::EXITED);
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: reaped elsewhere; nothing left to wait for
        exit_code_ = -1;
        state_.store(WorkerState::EXITED);
        return true;
    }
}

std::optional<int> WorkerProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return exit_code_;
}

bool WorkerProcess::wait_for_exit(int timeout_ms) {
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (poll_exit()) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void WorkerProcess::shutdown() {
    if (pid_ <= 0 || poll_exit()) {
        client_.close_stdin();
        return;
    }

    LOG_INFO("[" << worker_id_ << "] Initiating shutdown");

    // 1. Send EOF
    client_.close_stdin();

    // 2. Wait with timeout
    if (wait_for_exit(shutdown_timeout_ms_)) {
        LOG_INFO("[" << worker_id_ << "] Clean shutdown");
        return;
    }

    // 3. Forced kill
    LOG_WARN("[" << worker_id_ << "] Timeout - forcing termination");
    force_terminate();
    if (!wait_for_exit(500)) {
        LOG_ERROR("[" << worker_id_ << "] Process " << pid_ << " did not exit after SIGKILL");
    }
}

void WorkerProcess::force_terminate() {
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
}

}  // namespace worker
}  // namespace ccproxy
