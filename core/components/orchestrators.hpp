#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "components/io_provider.hpp"
#include "components/plugin_types.hpp"
#include "runtime/task.hpp"

namespace helm {
namespace components {

/**
 * Orchestrators run one mode's components on a supervised worker thread.
 *
 * start() launches the worker and hands its SubsystemTask to the caller.
 * The orchestrator must outlive the returned task; the cortex runtime cancels
 * and joins every task before it drops the orchestrators of a mode.
 */

// Polls the mode's sensors and writes readings into the shared IoProvider
class InputOrchestrator {
public:
    InputOrchestrator(std::vector<std::shared_ptr<Sensor>> sensors, IoProvider &io);

    std::unique_ptr<runtime::SubsystemTask> start();

private:
    void run(const runtime::StopToken &token);

    std::vector<std::shared_ptr<Sensor>> sensors_;
    IoProvider &io_;
};

// Executes promised actions through their connectors, collecting results
class ActionOrchestrator {
public:
    explicit ActionOrchestrator(std::vector<AgentAction> actions);

    std::unique_ptr<runtime::SubsystemTask> start();

    // Queue actions for execution (main loop)
    void promise(const std::vector<Action> &actions);

    // Take results finished since the previous flush (main loop)
    std::vector<ActionResult> flush_promises();

    size_t pending() const;

private:
    void run(const runtime::StopToken &token);
    ActionResult execute(const Action &action);

    std::vector<AgentAction> actions_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Action> pending_;
    std::vector<ActionResult> finished_;
};

// Feeds promised action batches to every simulator
class SimulatorOrchestrator {
public:
    explicit SimulatorOrchestrator(std::vector<std::shared_ptr<Simulator>> simulators);

    std::unique_ptr<runtime::SubsystemTask> start();

    void promise(const std::vector<Action> &actions);

private:
    void run(const runtime::StopToken &token);

    std::vector<std::shared_ptr<Simulator>> simulators_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<Action>> batches_;
};

// Ticks each background at its own interval
class BackgroundOrchestrator {
public:
    explicit BackgroundOrchestrator(std::vector<std::shared_ptr<Background>> backgrounds);

    std::unique_ptr<runtime::SubsystemTask> start();

private:
    void run(const runtime::StopToken &token);

    std::vector<std::shared_ptr<Background>> backgrounds_;
};

}  // namespace components
}  // namespace helm
