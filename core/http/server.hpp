#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

// Forward declarations
namespace helm {
namespace runtime {
class ModeCortexRuntime;
}
namespace control {
class ModeStatusService;
class ResponseMailbox;
}  // namespace control
}  // namespace helm

namespace helm {
namespace http {

/**
 * @brief HTTP transport of the mode-status protocol
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool and never touch mode
 *   state directly: switch and info requests go through ModeStatusService,
 *   the mode listing is posted onto the cortex event loop
 *
 * Mode switches are asynchronous: POST /v0/mode/request answers 202 with a
 * request_id, and the client polls GET /v0/mode/responses/{request_id}.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, runtime::ModeCortexRuntime &cortex,
               control::ModeStatusService &mode_status, control::ResponseMailbox &mailbox);

    ~HttpServer();

    /**
     * @brief Bind to the configured address/port and start the server thread
     *
     * @param error Populated with error message on failure
     */
    bool start(std::string &error);

    /**
     * @brief Stop the server and join its thread. Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    // How long GET /v0/modes waits for the event loop
    static constexpr std::chrono::milliseconds kLoopReplyTimeout{2000};

    runtime::HttpConfig config_;
    int port_ = 0;

    runtime::ModeCortexRuntime &cortex_;
    control::ModeStatusService &mode_status_;
    control::ResponseMailbox &mailbox_;

    std::atomic<uint64_t> next_request_id_{1};

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
    std::string generate_request_id();

    // Route handlers (implemented in handlers/mode_handlers.cpp)
    void handle_post_mode_request(const httplib::Request &req, httplib::Response &res);
    void handle_get_mode_response(const httplib::Request &req, httplib::Response &res);
    void handle_get_modes(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace helm
