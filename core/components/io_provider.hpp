#pragma once

/**
 * @file io_provider.hpp
 * @brief Shared hand-off point between input tasks and the cortex tick
 *
 * One IoProvider lives for the whole runtime and survives every mode
 * transition. Input tasks write readings into it; the main loop drains them
 * once per tick.
 *
 * Thread safety:
 * - add_input(), set_mode_transition_input(), request_skip_sleep() are called
 *   from input task threads
 * - drain_inputs(), take_mode_transition_input(), clear_skip_sleep() are
 *   called from the main loop
 */

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace helm {
namespace components {

class IoProvider {
public:
    /**
     * @brief Record the latest reading of one sensor
     *
     * Readings are keyed by descriptor; a newer reading replaces one that has
     * not been drained yet.
     */
    void add_input(const std::string &descriptor, const std::string &text);

    /**
     * @brief Take every reading recorded since the previous drain
     */
    std::map<std::string, std::string> drain_inputs();

    /**
     * @brief Store text that may trigger an input-based mode transition
     */
    void set_mode_transition_input(const std::string &text);

    /**
     * @brief Get and clear the pending mode-transition text
     */
    std::optional<std::string> take_mode_transition_input();

    // Don't-sleep signal: cut the current tick wait short
    void request_skip_sleep() { skip_sleep_.store(true); }
    bool skip_sleep_requested() const { return skip_sleep_.load(); }
    void clear_skip_sleep() { skip_sleep_.store(false); }

    // Drop undrained readings and transition text, keep the skip-sleep signal
    // (used between mode activations)
    void reset_inputs();

    // Forget everything (used on shutdown)
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> inputs_;
    std::optional<std::string> mode_transition_input_;
    std::atomic<bool> skip_sleep_{false};
};

}  // namespace components
}  // namespace helm
