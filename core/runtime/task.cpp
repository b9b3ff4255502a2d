#include "runtime/task.hpp"

#include "logging/logger.hpp"

namespace helm {
namespace runtime {

StopToken::StopToken() : state_(std::make_shared<detail::StopState>()) {}

StopToken::StopToken(std::shared_ptr<detail::StopState> state) : state_(std::move(state)) {}

bool StopToken::stop_requested() const { return state_->stopped.load(); }

bool StopToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->stopped.load(); });
}

StopSource::StopSource() : state_(std::make_shared<detail::StopState>()) {}

StopToken StopSource::token() const { return StopToken(state_); }

void StopSource::request_stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopped.store(true);
    }
    state_->cv.notify_all();
}

bool StopSource::stop_requested() const { return state_->stopped.load(); }

SubsystemTask::SubsystemTask(std::string name, Body body) : name_(std::move(name)) {
    thread_ = std::thread([this, body = std::move(body)]() { run(body); });
}

SubsystemTask::~SubsystemTask() {
    cancel();
    join();
}

void SubsystemTask::cancel() { stop_.request_stop(); }

void SubsystemTask::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool SubsystemTask::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

std::string SubsystemTask::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void SubsystemTask::run(const Body &body) {
    LOG_DEBUG("[Task] " << name_ << " started");
    try {
        body(stop_.token());
    } catch (const std::exception &e) {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_ = true;
        error_ = e.what();
    }
    done_.store(true);
    LOG_DEBUG("[Task] " << name_ << " exited" << (stop_.stop_requested() ? " (cancelled)" : ""));
}

}  // namespace runtime
}  // namespace helm
