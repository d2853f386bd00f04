/**
 * @file runtime_test.cpp
 * @brief Runtime lifecycle tests with a real worker script and HTTP server
 *
 * Tests:
 * - shutdown() answers an HTTP request blocked on a silent worker with 503
 *   promptly instead of waiting for the request deadline
 * - A second shutdown() is a no-op
 */

#include "runtime/runtime.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <future>
#include <nlohmann/json.hpp>
#include <string>

#include "helpers/script_worker.hpp"

// Same ThreadSanitizer exclusion as the HTTP handler tests
#if defined(__SANITIZE_THREAD__)
#define CCPROXY_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define CCPROXY_SKIP_HTTP_TESTS 1
#else
#define CCPROXY_SKIP_HTTP_TESTS 0
#endif
#else
#define CCPROXY_SKIP_HTTP_TESTS 0
#endif

#if !CCPROXY_SKIP_HTTP_TESTS

using namespace ccproxy;
using ccproxy::tests::ScriptWorkerDir;
using ccproxy::tests::wait_until;
using Clock = std::chrono::steady_clock;

namespace {
constexpr int kTestPort = 9998;
}

class RuntimeTest : public ::testing::Test {
protected:
    ScriptWorkerDir scripts{"ccproxy_runtime_test"};

    runtime::RuntimeConfig make_config(const std::string &command) {
        runtime::RuntimeConfig config;
        config.worker.id = "test_worker";
        config.worker.command = command;
        config.worker.args.clear();
        config.worker.shutdown_timeout_ms = 200;
        config.worker.restart_policy.base_delay_ms = 50;
        config.worker.restart_policy.max_delay_ms = 200;
        config.bridge.request_timeout_ms = 30000;
        config.http.enabled = true;
        config.http.bind = "127.0.0.1";
        config.http.port = kTestPort;
        config.http.thread_pool_size = 2;
        return config;
    }

    static bool request_in_flight() {
        httplib::Client client("127.0.0.1", kTestPort);
        client.set_connection_timeout(1, 0);
        auto res = client.Get("/v1/bridge/status");
        if (!res || res->status != 200) {
            return false;
        }
        auto body = nlohmann::json::parse(res->body, nullptr, false);
        return !body.is_discarded() && body["requests"]["in_flight"].get<bool>();
    }
};

TEST_F(RuntimeTest, ShutdownAnswersBlockedRequestPromptly) {
    // Reads prompts but never replies
    std::string script = scripts.write("silent.sh", "while IFS= read -r line; do :; done\n");

    runtime::Runtime rt(make_config(script));
    std::string error;
    ASSERT_TRUE(rt.initialize(error)) << error;

    auto pending = std::async(std::launch::async, []() {
        httplib::Client client("127.0.0.1", kTestPort);
        client.set_connection_timeout(1, 0);
        client.set_read_timeout(20, 0);
        nlohmann::json body = {{"messages", {{{"role", "user"}, {"content", "hello"}}}}};
        return client.Post("/v1/messages", body.dump(), "application/json");
    });

    ASSERT_TRUE(wait_until([] { return request_in_flight(); }, 5000));

    auto start = Clock::now();
    rt.shutdown();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    EXPECT_LT(elapsed, 3000);

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto res = pending.get();
    ASSERT_TRUE(res) << "Request failed";
    EXPECT_EQ(res->status, 503);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ(json["status"]["code"], "UNAVAILABLE");
    EXPECT_EQ(json["error"]["message"], "Bridge shutting down");

    // Destructor shuts down again
    rt.shutdown();
}

#endif  // !CCPROXY_SKIP_HTTP_TESTS
