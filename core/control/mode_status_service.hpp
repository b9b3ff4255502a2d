#pragma once

#include <functional>
#include <string>

#include "control/mode_status.hpp"
#include "modes/mode_manager.hpp"
#include "runtime/event_loop.hpp"

namespace helm {
namespace control {

/**
 * ModeStatusService - answers mode-status requests from external transports.
 *
 * Transport threads call handle_request()/submit(); the actual work (mode
 * switch, info query) is posted onto the event loop that owns the
 * ModeManager, and the reply goes out through the publisher when it is done.
 * Every accepted request is answered exactly once, including requests still
 * queued when the loop closes.
 *
 * The publisher may be called from the loop thread or the caller's thread.
 */
class ModeStatusService {
public:
    using Publisher = std::function<void(const ModeStatusResponse &)>;

    ModeStatusService(runtime::EventLoop &loop, modes::ModeManager &mode_manager, Publisher publisher);

    /**
     * Decode and submit one wire payload.
     *
     * @return false if the payload is malformed (logged, nothing published)
     */
    bool handle_request(const std::string &payload);

    // Submit an already decoded request
    void submit(const ModeStatusRequest &request);

private:
    void handle_switch(const ModeStatusRequest &request);
    void handle_info(const ModeStatusRequest &request);
    ModeStatusResponse make_response(const ModeStatusRequest &request, int code, const std::string &current_mode,
                                     const std::string &message) const;
    void publish(const ModeStatusResponse &response);

    runtime::EventLoop &loop_;
    modes::ModeManager &mode_manager_;
    Publisher publisher_;
};

}  // namespace control
}  // namespace helm
