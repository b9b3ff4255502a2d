#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace helm {
namespace runtime {

namespace detail {
struct StopState {
    std::atomic<bool> stopped{false};
    std::mutex mutex;
    std::condition_variable cv;
};
}  // namespace detail

/**
 * Read side of a cooperative cancellation flag.
 *
 * A default-constructed token is never stopped. Tokens are cheap to copy and
 * share their state with the StopSource that issued them.
 */
class StopToken {
public:
    StopToken();

    bool stop_requested() const;

    /**
     * Sleep up to timeout, waking early on cancellation.
     *
     * @return true if stop was requested
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class StopSource;
    explicit StopToken(std::shared_ptr<detail::StopState> state);

    std::shared_ptr<detail::StopState> state_;
};

class StopSource {
public:
    StopSource();

    StopToken token() const;
    void request_stop();
    bool stop_requested() const;

private:
    std::shared_ptr<detail::StopState> state_;
};

/**
 * SubsystemTask - one long-running supervised worker thread.
 *
 * The body receives a StopToken and must return promptly once it is
 * cancelled, releasing whatever it opened. An exception escaping the body is
 * captured so the supervisor can report it; it never terminates the process.
 */
class SubsystemTask {
public:
    using Body = std::function<void(const StopToken &)>;

    SubsystemTask(std::string name, Body body);
    ~SubsystemTask();

    // Non-copyable, non-movable (manages thread)
    SubsystemTask(const SubsystemTask &) = delete;
    SubsystemTask &operator=(const SubsystemTask &) = delete;
    SubsystemTask(SubsystemTask &&) = delete;
    SubsystemTask &operator=(SubsystemTask &&) = delete;

    const std::string &name() const { return name_; }

    // Request cooperative stop. Does not wait.
    void cancel();

    // Wait for the body to return. Safe to call repeatedly.
    void join();

    bool done() const { return done_.load(); }
    bool cancelled() const { return stop_.stop_requested(); }

    // True if the body exited by throwing
    bool failed() const;
    std::string error() const;

private:
    void run(const Body &body);

    std::string name_;
    StopSource stop_;
    std::atomic<bool> done_{false};

    mutable std::mutex mutex_;
    bool failed_ = false;
    std::string error_;

    std::thread thread_;
};

}  // namespace runtime
}  // namespace helm
