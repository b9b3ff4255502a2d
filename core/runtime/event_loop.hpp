#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace helm {
namespace runtime {

/**
 * EventLoop - the single execution context that owns mode state.
 *
 * Threads other than the owner never touch ModeManager or runtime state
 * directly; they hand work over with post(). The owner drains the queue from
 * run_pending() or while waiting out a tick period in run_for().
 *
 * Thread safety:
 * - post(), wake(), close(), is_closed() may be called from any thread
 * - run_pending() and run_for() must only be called by the owner thread
 */
class EventLoop {
public:
    using Work = std::function<void()>;

    EventLoop() = default;

    // Non-copyable, non-movable (manages mutex)
    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /**
     * Queue work for the owner thread.
     *
     * @param work Executed on the owner thread, in submission order
     * @param on_drop Invoked instead of work if the loop closes first
     * @return false if the loop is already closed (neither callback runs)
     */
    bool post(Work work, Work on_drop = nullptr);

    /**
     * Execute everything queued so far.
     *
     * @return Number of work items executed
     */
    size_t run_pending();

    /**
     * Execute queued work while waiting out duration.
     *
     * Returns early when interrupted() becomes true or wake() is called.
     */
    void run_for(std::chrono::milliseconds duration, const std::function<bool()> &interrupted = nullptr);

    // Cut the current run_for() short
    void wake();

    // Reject further posts and hand pending items to their drop callbacks
    void close();

    bool is_closed() const;

    size_t pending() const;

    // Record the calling thread as owner
    void bind_to_current_thread();
    bool in_loop_thread() const;

private:
    struct Item {
        Work work;
        Work on_drop;
    };

    // Maximum time between checks of the interrupt predicate
    static constexpr std::chrono::milliseconds kMaxWaitSlice{50};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> queue_;
    bool closed_ = false;
    bool woken_ = false;
    std::thread::id owner_;
};

}  // namespace runtime
}  // namespace helm
