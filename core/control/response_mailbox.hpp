#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "control/mode_status.hpp"

namespace helm {
namespace control {

/**
 * ResponseMailbox - holds mode-status responses until a client collects them.
 *
 * Bounded: when full, the oldest uncollected response is dropped and a
 * warning is logged every 100 drops. Thread-safe.
 */
class ResponseMailbox {
public:
    explicit ResponseMailbox(size_t max_size = 256);

    // Store a response (never blocks)
    void deliver(const ModeStatusResponse &response);

    // Remove and return the response for request_id, if it has arrived
    std::optional<ModeStatusResponse> take(const std::string &request_id);

    size_t size() const;
    size_t dropped_count() const;

private:
    const size_t max_size_;
    mutable std::mutex mutex_;
    std::deque<ModeStatusResponse> responses_;
    size_t dropped_count_ = 0;
};

}  // namespace control
}  // namespace helm
