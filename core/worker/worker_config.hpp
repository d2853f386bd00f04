#pragma once

#include <map>
#include <string>
#include <vector>

namespace ccproxy {
namespace worker {

struct RestartPolicyConfig {
    int base_delay_ms = 1000;   // Delay before the first restart
    int max_delay_ms = 60000;   // Cap for the doubled delay
};

struct WorkerConfig {
    std::string id = "claude";                  // Log tag
    std::string command = "claude";             // Executable; resolved via PATH when it has no '/'
    std::vector<std::string> args{"-p",
                                  "--input-format",
                                  "stream-json",
                                  "--output-format",
                                  "stream-json",
                                  "--verbose",
                                  "--dangerously-skip-permissions"};
    std::map<std::string, std::string> env;     // Overrides on top of the host environment
    std::vector<std::string> required_env;      // Checked at startup, warning only
    int shutdown_timeout_ms = 2000;             // EOF -> wait window before SIGKILL
    RestartPolicyConfig restart_policy;
};

}  // namespace worker
}  // namespace ccproxy
