#include "http/server.hpp"

#include "control/mode_status_service.hpp"
#include "control/response_mailbox.hpp"
#include "http/errors.hpp"
#include "logging/logger.hpp"
#include "runtime/cortex_runtime.hpp"

namespace helm {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, runtime::ModeCortexRuntime &cortex,
                       control::ModeStatusService &mode_status, control::ResponseMailbox &mailbox)
    : config_(config), cortex_(cortex), mode_status_(mode_status), mailbox_(mailbox) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // JSON bodies for errors httplib raises itself (unknown route, bad request)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

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

std::string HttpServer::generate_request_id() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    return "http-" + std::to_string(ms) + "-" + std::to_string(next_request_id_.fetch_add(1));
}

void HttpServer::setup_routes() {
    // POST /v0/mode/request - Submit a mode-status request
    server_->Post("/v0/mode/request", [this](const httplib::Request &req, httplib::Response &res) {
        handle_post_mode_request(req, res);
    });

    // GET /v0/mode/responses/:request_id - Collect the response to a request
    server_->Get(R"(/v0/mode/responses/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        handle_get_mode_response(req, res);
    });

    // GET /v0/modes - List configured modes
    server_->Get("/v0/modes",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_modes(req, res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST /v0/mode/request");
    LOG_INFO("[HTTP]   GET  /v0/mode/responses/{request_id}");
    LOG_INFO("[HTTP]   GET  /v0/modes");
}

}  // namespace http
}  // namespace helm
