#include "server.hpp"

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace ccproxy {
namespace http {

namespace {
constexpr int kReadTimeoutSeconds = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;

constexpr const char *kCorsMethods = "GET, POST, OPTIONS";
constexpr const char *kCorsHeaders = "Content-Type, Authorization, x-api-key";

bool origin_matches(const std::string &pattern, const std::string &origin) {
    const auto star = pattern.find('*');
    if (star == std::string::npos) {
        return pattern == origin;
    }

    const std::string head = pattern.substr(0, star);
    const std::string tail = pattern.substr(star + 1);
    return origin.size() >= head.size() + tail.size() && origin.compare(0, head.size(), head) == 0 &&
           origin.compare(origin.size() - tail.size(), tail.size(), tail) == 0;
}
}  // namespace

std::optional<std::string> cors_response_origin(const std::vector<std::string> &allowed_origins,
                                                const std::string &origin) {
    for (const auto &pattern : allowed_origins) {
        if (pattern == "*") {
            return std::string("*");
        }
        if (origin_matches(pattern, origin)) {
            return origin;
        }
    }
    return std::nullopt;
}

HttpServer::HttpServer(const runtime::HttpConfig &config, bridge::IRequestBridge &bridge)
    : config_(config), bridge_(bridge) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    // Replies can take as long as the worker does; only reads are bounded
    server_->set_read_timeout(kReadTimeoutSeconds, 0);

    // Each in-progress /v1/messages call occupies one pool thread
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    install_cors();
    setup_routes();
    install_error_handlers();

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }

    running_.store(true);
    start_time_ = std::chrono::steady_clock::now();
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port << " (" << pool_size
                                           << " threads)");
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    if (server_) {
        server_->stop();
    }
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::install_cors() {
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        if (!req.has_header("Origin")) {
            return;
        }
        auto allowed = cors_response_origin(origins, req.get_header_value("Origin"));
        if (!allowed) {
            return;
        }

        res.set_header("Access-Control-Allow-Origin", *allowed);
        res.set_header("Access-Control-Allow-Methods", kCorsMethods);
        res.set_header("Access-Control-Allow-Headers", kCorsHeaders);
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });
}

void HttpServer::install_error_handlers() {
    // Statuses httplib sets on its own (unknown route, unparsable request) get a JSON body
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        if (res.status == kStatusNotFound) {
            send_error(res, StatusCode::NOT_FOUND, "Route not found: " + req.method + " " + req.path);
        } else if (res.status == kStatusBadRequest) {
            send_error(res, StatusCode::INVALID_ARGUMENT, "Bad request");
        } else {
            const int status = res.status;
            send_error(res, StatusCode::INTERNAL, "Internal server error");
            res.status = status;
        }
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string message;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            message = e.what();
        } catch (...) {
            message = "Unknown exception";
        }

        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " failed: " << message);
        send_error(res, StatusCode::INTERNAL, message);
    });
}

void HttpServer::setup_routes() {
    server_->Post("/v1/messages",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_messages(req, res); });

    server_->Get("/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    server_->Get("/v1/bridge/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_bridge_status(req, res); });

    // CORS preflight for any path
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kCorsMethods);
        res.set_header("Access-Control-Allow-Headers", kCorsHeaders);
    });

    LOG_DEBUG("[HTTP] Routes: POST /v1/messages, GET /health, GET /v1/bridge/status");
}

}  // namespace http
}  // namespace ccproxy
