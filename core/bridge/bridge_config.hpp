#pragma once

namespace ccproxy {
namespace bridge {

struct BridgeConfig {
    int request_timeout_ms = 180000;  // Measured from send(), queued time included
};

}  // namespace bridge
}  // namespace ccproxy
