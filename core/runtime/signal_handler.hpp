#pragma once

#include <atomic>

namespace ccproxy {
namespace runtime {

// Process-wide shutdown flag set from SIGINT/SIGTERM, polled by the runtime loop
class SignalHandler {
public:
    // Also ignores SIGPIPE: a worker dying mid-write must surface as EPIPE, not kill us
    static void install();

    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace ccproxy
