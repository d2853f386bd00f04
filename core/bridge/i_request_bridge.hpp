#pragma once

#include <future>
#include <string>

#include "bridge_types.hpp"

namespace ccproxy {
namespace bridge {

// Interface for RequestBridge to enable mocking
class IRequestBridge {
public:
    virtual ~IRequestBridge() = default;

    // Queue a prompt. Resolves immediately with NOT_READY when no worker is attached.
    virtual std::future<BridgeReply> send_async(const std::string &prompt) = 0;

    // Blocking form of send_async
    virtual BridgeReply send(const std::string &prompt) = 0;

    virtual HealthStatus health_status() const = 0;
};

}  // namespace bridge
}  // namespace ccproxy
