#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "worker/worker_supervisor.hpp"

namespace ccproxy {
namespace bridge {

enum class BridgeStatus {
    OK,             // Worker replied; text holds the reply
    NOT_READY,      // No worker attached when send() was called
    TIMEOUT,        // No terminal event before the request deadline
    SHUTTING_DOWN   // Bridge stopped before the request completed
};

const char *bridge_status_to_string(BridgeStatus status);

struct BridgeReply {
    BridgeStatus status = BridgeStatus::OK;
    std::string text;
    bool worker_error = false;  // Worker flagged its own reply as an error (status stays OK)
    std::string error;          // Message for non-OK statuses

    bool ok() const { return status == BridgeStatus::OK; }

    static BridgeReply failure(BridgeStatus status, const std::string &message) {
        BridgeReply reply;
        reply.status = status;
        reply.error = message;
        return reply;
    }
};

// Liveness report for health checks
struct HealthStatus {
    bool attached = false;
    worker::WorkerSupervisor::WorkerSnapshot worker;
    size_t queued_requests = 0;
    bool request_in_flight = false;
    size_t orphaned_requests = 0;
    uint64_t completed_requests = 0;
    uint64_t timed_out_requests = 0;
};

}  // namespace bridge
}  // namespace ccproxy
