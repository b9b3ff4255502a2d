#include "runtime/event_loop.hpp"

#include <algorithm>
#include <vector>

#include "logging/logger.hpp"

namespace helm {
namespace runtime {

bool EventLoop::post(Work work, Work on_drop) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(Item{std::move(work), std::move(on_drop)});
    }
    cv_.notify_all();
    return true;
}

size_t EventLoop::run_pending() {
    std::deque<Item> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    size_t executed = 0;
    for (auto &item : batch) {
        try {
            item.work();
        } catch (const std::exception &e) {
            LOG_ERROR("[EventLoop] Error in posted work: " << e.what());
        }
        executed++;
    }
    return executed;
}

void EventLoop::run_for(std::chrono::milliseconds duration, const std::function<bool()> &interrupted) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + duration;

    while (true) {
        run_pending();

        if (interrupted && interrupted()) {
            return;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (woken_) {
            woken_ = false;
            return;
        }

        const auto now = clock::now();
        if (now >= deadline) {
            return;
        }

        const auto slice = std::min<clock::duration>(deadline - now, kMaxWaitSlice);
        cv_.wait_for(lock, slice, [this] { return !queue_.empty() || woken_; });
    }
}

void EventLoop::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

void EventLoop::close() {
    std::deque<Item> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        dropped.swap(queue_);
        woken_ = true;
    }
    cv_.notify_all();

    for (auto &item : dropped) {
        if (!item.on_drop) {
            continue;
        }
        try {
            item.on_drop();
        } catch (const std::exception &e) {
            LOG_ERROR("[EventLoop] Error in drop callback: " << e.what());
        }
    }
}

bool EventLoop::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventLoop::bind_to_current_thread() {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_ = std::this_thread::get_id();
}

bool EventLoop::in_loop_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_ == std::this_thread::get_id();
}

}  // namespace runtime
}  // namespace helm
