#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <string>

#include "bridge/i_request_bridge.hpp"

namespace ccproxy::tests {

using namespace ccproxy;
using namespace testing;

class MockRequestBridge : public bridge::IRequestBridge {
public:
    MOCK_METHOD(std::future<bridge::BridgeReply>, send_async, (const std::string &), (override));
    MOCK_METHOD(bridge::BridgeReply, send, (const std::string &), (override));
    MOCK_METHOD(bridge::HealthStatus, health_status, (), (const, override));
};

inline bridge::BridgeReply make_ok_reply(const std::string &text, bool worker_error = false) {
    bridge::BridgeReply reply;
    reply.status = bridge::BridgeStatus::OK;
    reply.text = text;
    reply.worker_error = worker_error;
    return reply;
}

}  // namespace ccproxy::tests
