#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ccproxy {
namespace worker {

// Longest stdout/stderr line kept. Longer lines are dropped up to their newline.
constexpr size_t kMaxLineSize = 8u * 1024u * 1024u;

// LineReader turns one read-side pipe into a sequence of '\n'-terminated lines.
// A trailing "\r" is stripped. A final unterminated line is returned at EOF.
// Not thread-safe: each reader is driven by exactly one thread.
class LineReader {
public:
    using PipeHandle = int;

    LineReader();

    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;

    void set_handle(PipeHandle fd);

    // Read the next line into out.
    // Returns false on timeout (last_error() empty, at_eof() false), at EOF (at_eof() true)
    // or on a read error (last_error() set). timeout_ms < 0 blocks.
    bool read_line(std::string &out, int timeout_ms = -1);

    // Wait until the pipe is readable or hung up
    // Returns false on timeout or error (sets error_ on error)
    bool wait_for_data(int timeout_ms);

    bool at_eof() const { return eof_; }
    size_t dropped_lines() const { return dropped_lines_; }

    void close();

    const std::string &last_error() const { return error_; }

private:
    PipeHandle fd_;
    std::string buffer_;
    size_t scanned_ = 0;  // Bytes of buffer_ known to contain no newline
    bool eof_ = false;
    bool discarding_ = false;
    size_t dropped_lines_ = 0;
    std::string error_;

    bool take_line(std::string &out);
};

// LineStdioClient manages newline-delimited communication with a child process:
// lines are written to its stdin and read from its stdout and stderr.
class LineStdioClient {
public:
    using PipeHandle = int;

    LineStdioClient();
    ~LineStdioClient();

    // Delete copy/move (manages OS handles)
    LineStdioClient(const LineStdioClient &) = delete;
    LineStdioClient &operator=(const LineStdioClient &) = delete;

    // Initialize with pipe handles from the parent's perspective
    void set_handles(PipeHandle stdin_write, PipeHandle stdout_read, PipeHandle stderr_read);

    // Write one line to the child's stdin; a '\n' is appended when missing
    // Returns true on success, false on error or timeout (sets error_)
    bool write_line(const std::string &line, int timeout_ms = -1);

    // Append one framed line to the output backlog and write as much of the
    // backlog as the pipe accepts right now. Never waits; requires a
    // non-blocking stdin handle. Returns false on a write error (sets error_).
    bool queue_line(const std::string &line);

    // Write more of the backlog without waiting
    bool flush();

    size_t pending_bytes() const { return pending_.size(); }

    LineReader &stdout_reader() { return stdout_; }
    LineReader &stderr_reader() { return stderr_; }

    // Close stdin (signals EOF to the child)
    void close_stdin();

    // Close every handle still open
    void close_all();

    bool stdin_open() const { return stdin_write_ >= 0; }

    // Last write error
    const std::string &last_error() const { return error_; }

private:
    PipeHandle stdin_write_;
    LineReader stdout_;
    LineReader stderr_;
    std::string error_;
    std::string pending_;  // Bytes accepted by queue_line() not yet in the pipe

    // Low-level write exactly n bytes (handles partial writes, EINTR, etc.)
    bool write_exact(const uint8_t *buf, size_t n, int timeout_ms);
};

}  // namespace worker
}  // namespace ccproxy
