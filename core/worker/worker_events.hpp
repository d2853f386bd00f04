#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace ccproxy {
namespace worker {

// Events posted by a worker's observer threads. generation identifies the
// spawned process that produced the event; events from a replaced worker
// are dropped by the supervisor.

struct WorkerLineEvent {
    uint64_t generation = 0;
    std::string line;
};

struct WorkerStderrEvent {
    uint64_t generation = 0;
    std::string line;
};

struct WorkerExitEvent {
    uint64_t generation = 0;
    int exit_code = -1;  // -1 when the worker never started
};

using WorkerEvent = std::variant<WorkerLineEvent, WorkerStderrEvent, WorkerExitEvent>;

}  // namespace worker
}  // namespace ccproxy
