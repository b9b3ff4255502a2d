#include "control/response_mailbox.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace helm {
namespace control {

ResponseMailbox::ResponseMailbox(size_t max_size) : max_size_(std::max<size_t>(max_size, 1)) {}

void ResponseMailbox::deliver(const ModeStatusResponse &response) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (responses_.size() >= max_size_) {
        responses_.pop_front();
        dropped_count_++;

        if (dropped_count_ % 100 == 1) {
            LOG_WARN("[Mailbox] Overflow, dropped " << dropped_count_ << " uncollected responses total");
        }
    }

    responses_.push_back(response);
}

std::optional<ModeStatusResponse> ResponseMailbox::take(const std::string &request_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(responses_.begin(), responses_.end(),
                           [&request_id](const ModeStatusResponse &r) { return r.request_id == request_id; });
    if (it == responses_.end()) {
        return std::nullopt;
    }

    ModeStatusResponse response = std::move(*it);
    responses_.erase(it);
    return response;
}

size_t ResponseMailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

size_t ResponseMailbox::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
}

}  // namespace control
}  // namespace helm
