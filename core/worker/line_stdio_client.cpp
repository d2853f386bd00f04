#include "line_stdio_client.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

#include "logging/logger.hpp"

namespace ccproxy {
namespace worker {

namespace {
constexpr int kInvalidHandle = -1;
constexpr size_t kReadChunkSize = 4096;

int remaining_ms(std::chrono::steady_clock::time_point start, int timeout_ms) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (elapsed_ms >= timeout_ms) {
        return 0;
    }
    return static_cast<int>(timeout_ms - elapsed_ms);
}
}  // namespace

//=============================================================================
// LineReader
//=============================================================================

LineReader::LineReader() : fd_(kInvalidHandle) {}

void LineReader::set_handle(PipeHandle fd) {
    fd_ = fd;
    buffer_.clear();
    scanned_ = 0;
    eof_ = false;
    discarding_ = false;
    error_.clear();
}

bool LineReader::take_line(std::string &out) {
    while (true) {
        auto pos = buffer_.find('\n', scanned_);
        if (pos == std::string::npos) {
            scanned_ = buffer_.size();
            return false;
        }

        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        scanned_ = 0;

        if (discarding_) {
            // Tail of an oversized line
            discarding_ = false;
            continue;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out = std::move(line);
        return true;
    }
}

bool LineReader::read_line(std::string &out, int timeout_ms) {
    error_.clear();
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (take_line(out)) {
            return true;
        }

        if (eof_) {
            if (!buffer_.empty() && !discarding_) {
                out = std::move(buffer_);
                buffer_.clear();
                scanned_ = 0;
                return true;
            }
            buffer_.clear();
            scanned_ = 0;
            return false;
        }

        if (fd_ < 0) {
            error_ = "Invalid pipe";
            return false;
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            wait_ms = remaining_ms(start, timeout_ms);
            if (wait_ms == 0) {
                return false;
            }
        }

        if (!wait_for_data(wait_ms)) {
            // wait_for_data sets error_ on failure, or just returns false on timeout
            if (!error_.empty()) {
                return false;
            }
            continue;
        }

        char chunk[kReadChunkSize];
        ssize_t r = ::read(fd_, chunk, sizeof(chunk));
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            eof_ = true;
            continue;
        }

        buffer_.append(chunk, static_cast<size_t>(r));

        if (buffer_.size() > kMaxLineSize && buffer_.find('\n', scanned_) == std::string::npos) {
            if (!discarding_) {
                dropped_lines_++;
                LOG_WARN("[LineReader] Dropping line longer than " << kMaxLineSize << " bytes");
            }
            discarding_ = true;
            buffer_.clear();
            scanned_ = 0;
        }
    }
}

bool LineReader::wait_for_data(int timeout_ms) {
    error_.clear();
    if (fd_ < 0) {
        error_ = "Invalid pipe";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }

    // POLLHUP without POLLIN means the writer is gone; read() will report EOF
    if ((pfd.revents & (POLLIN | POLLHUP)) != 0) {
        return true;
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
        error_ = "poll error on pipe";
    }
    return false;
}

void LineReader::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = kInvalidHandle;
    }
}

//=============================================================================
// LineStdioClient
//=============================================================================

LineStdioClient::LineStdioClient() : stdin_write_(kInvalidHandle) {}

LineStdioClient::~LineStdioClient() {
    // Note: Handles closed by WorkerProcess, not here
}

void LineStdioClient::set_handles(PipeHandle stdin_write, PipeHandle stdout_read, PipeHandle stderr_read) {
    stdin_write_ = stdin_write;
    stdout_.set_handle(stdout_read);
    stderr_.set_handle(stderr_read);
    pending_.clear();
    error_.clear();
}

namespace {
std::string frame_line(const std::string &line) {
    std::string framed = line;
    if (framed.empty() || framed.back() != '\n') {
        framed.push_back('\n');
    }
    return framed;
}

std::string write_error_message(int err) {
    if (err == EPIPE) {
        return "Broken pipe (worker terminated)";
    }
    return "Write failed: " + std::string(strerror(err));
}
}  // namespace

bool LineStdioClient::write_line(const std::string &line, int timeout_ms) {
    error_.clear();
    if (stdin_write_ < 0) {
        error_ = "stdin is closed";
        return false;
    }

    std::string framed = frame_line(line);
    return write_exact(reinterpret_cast<const uint8_t *>(framed.data()), framed.size(), timeout_ms);
}

bool LineStdioClient::write_exact(const uint8_t *buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        ssize_t w = ::write(stdin_write_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Non-blocking handle with a full pipe: wait for room
                int wait_ms = timeout_ms < 0 ? -1 : remaining_ms(start_time, timeout_ms);
                if (wait_ms == 0) {
                    error_ = "Timeout writing line";
                    return false;
                }
                struct pollfd pfd;
                pfd.fd = stdin_write_;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int result = poll(&pfd, 1, wait_ms);
                if (result < 0 && errno != EINTR) {
                    error_ = "poll failed: " + std::string(strerror(errno));
                    return false;
                }
                continue;
            }
            error_ = write_error_message(errno);
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool LineStdioClient::queue_line(const std::string &line) {
    error_.clear();
    if (stdin_write_ < 0) {
        error_ = "stdin is closed";
        return false;
    }
    pending_.append(frame_line(line));
    return flush();
}

bool LineStdioClient::flush() {
    error_.clear();
    if (pending_.empty()) {
        return true;
    }
    if (stdin_write_ < 0) {
        error_ = "stdin is closed";
        return false;
    }

    size_t total = 0;
    while (total < pending_.size()) {
        ssize_t w = ::write(stdin_write_, pending_.data() + total, pending_.size() - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;  // Pipe full; the rest goes on a later flush
            }
            error_ = write_error_message(errno);
            pending_.erase(0, total);
            return false;
        }
        total += static_cast<size_t>(w);
    }
    pending_.erase(0, total);
    return true;
}

void LineStdioClient::close_stdin() {
    if (stdin_write_ >= 0) {
        ::close(stdin_write_);
        stdin_write_ = kInvalidHandle;
    }
    pending_.clear();
}

void LineStdioClient::close_all() {
    close_stdin();
    stdout_.close();
    stderr_.close();
}

}  // namespace worker
}  // namespace ccproxy
