#include "components/orchestrators.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace helm {
namespace components {

namespace {
// Upper bound on how long a worker goes without checking its stop token
constexpr std::chrono::milliseconds kIdleWait{50};
}  // namespace

/******************************************************************************
 * InputOrchestrator
 ******************************************************************************/

InputOrchestrator::InputOrchestrator(std::vector<std::shared_ptr<Sensor>> sensors, IoProvider &io)
    : sensors_(std::move(sensors)), io_(io) {}

std::unique_ptr<runtime::SubsystemTask> InputOrchestrator::start() {
    return std::make_unique<runtime::SubsystemTask>("inputs",
                                                    [this](const runtime::StopToken &token) { run(token); });
}

void InputOrchestrator::run(const runtime::StopToken &token) {
    if (sensors_.empty()) {
        while (!token.wait_for(std::chrono::seconds(1))) {
        }
        return;
    }

    while (!token.stop_requested()) {
        for (auto &sensor : sensors_) {
            if (token.stop_requested()) {
                return;
            }

            std::optional<std::string> reading;
            try {
                reading = sensor->poll(token);
            } catch (const std::exception &e) {
                LOG_ERROR("[Inputs] Sensor '" << sensor->descriptor() << "' failed: " << e.what());
                token.wait_for(kIdleWait);
                continue;
            }
            if (!reading) {
                continue;
            }

            io_.add_input(sensor->descriptor(), *reading);
            if (sensor->feeds_mode_transitions()) {
                io_.set_mode_transition_input(*reading);
            }
            if (sensor->urgent()) {
                io_.request_skip_sleep();
            }
        }
    }
}

/******************************************************************************
 * ActionOrchestrator
 ******************************************************************************/

ActionOrchestrator::ActionOrchestrator(std::vector<AgentAction> actions) : actions_(std::move(actions)) {}

std::unique_ptr<runtime::SubsystemTask> ActionOrchestrator::start() {
    return std::make_unique<runtime::SubsystemTask>("actions",
                                                    [this](const runtime::StopToken &token) { run(token); });
}

void ActionOrchestrator::promise(const std::vector<Action> &actions) {
    if (actions.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.insert(pending_.end(), actions.begin(), actions.end());
    }
    cv_.notify_one();
}

std::vector<ActionResult> ActionOrchestrator::flush_promises() {
    std::vector<ActionResult> results;
    std::lock_guard<std::mutex> lock(mutex_);
    results.swap(finished_);
    return results;
}

size_t ActionOrchestrator::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void ActionOrchestrator::run(const runtime::StopToken &token) {
    while (!token.stop_requested()) {
        Action action;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, kIdleWait, [this] { return !pending_.empty(); });
            if (pending_.empty() || token.stop_requested()) {
                continue;
            }
            action = std::move(pending_.front());
            pending_.pop_front();
        }

        ActionResult result = execute(action);

        std::lock_guard<std::mutex> lock(mutex_);
        finished_.push_back(std::move(result));
    }
}

ActionResult ActionOrchestrator::execute(const Action &action) {
    ActionResult result;
    result.action = action.type;
    result.value = action.value;

    auto it = std::find_if(actions_.begin(), actions_.end(),
                           [&action](const AgentAction &a) { return a.llm_label == action.type; });
    if (it == actions_.end()) {
        it = std::find_if(actions_.begin(), actions_.end(),
                          [&action](const AgentAction &a) { return a.name == action.type; });
    }
    if (it == actions_.end() || !it->connector) {
        result.message = "Unknown action: " + action.type;
        LOG_WARN("[Actions] " << result.message);
        return result;
    }

    try {
        it->connector->connect(nlohmann::json{{"action", action.type}, {"value", action.value}});
        result.success = true;
    } catch (const std::exception &e) {
        result.message = e.what();
        LOG_ERROR("[Actions] Action '" << action.type << "' failed: " << e.what());
    }
    return result;
}

/******************************************************************************
 * SimulatorOrchestrator
 ******************************************************************************/

SimulatorOrchestrator::SimulatorOrchestrator(std::vector<std::shared_ptr<Simulator>> simulators)
    : simulators_(std::move(simulators)) {}

std::unique_ptr<runtime::SubsystemTask> SimulatorOrchestrator::start() {
    return std::make_unique<runtime::SubsystemTask>("simulators",
                                                    [this](const runtime::StopToken &token) { run(token); });
}

void SimulatorOrchestrator::promise(const std::vector<Action> &actions) {
    if (simulators_.empty() || actions.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batches_.push_back(actions);
    }
    cv_.notify_one();
}

void SimulatorOrchestrator::run(const runtime::StopToken &token) {
    while (!token.stop_requested()) {
        std::vector<Action> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, kIdleWait, [this] { return !batches_.empty(); });
            if (batches_.empty() || token.stop_requested()) {
                continue;
            }
            batch = std::move(batches_.front());
            batches_.pop_front();
        }

        for (auto &simulator : simulators_) {
            try {
                simulator->sim(batch);
            } catch (const std::exception &e) {
                LOG_ERROR("[Simulators] Simulator '" << simulator->name() << "' failed: " << e.what());
            }
        }
    }
}

/******************************************************************************
 * BackgroundOrchestrator
 ******************************************************************************/

BackgroundOrchestrator::BackgroundOrchestrator(std::vector<std::shared_ptr<Background>> backgrounds)
    : backgrounds_(std::move(backgrounds)) {}

std::unique_ptr<runtime::SubsystemTask> BackgroundOrchestrator::start() {
    return std::make_unique<runtime::SubsystemTask>("backgrounds",
                                                    [this](const runtime::StopToken &token) { run(token); });
}

void BackgroundOrchestrator::run(const runtime::StopToken &token) {
    using Clock = std::chrono::steady_clock;

    std::vector<Clock::time_point> next_due(backgrounds_.size(), Clock::now());

    while (!token.stop_requested()) {
        auto now = Clock::now();
        auto wake_at = now + kIdleWait;

        for (size_t i = 0; i < backgrounds_.size(); ++i) {
            if (now >= next_due[i]) {
                try {
                    backgrounds_[i]->tick();
                } catch (const std::exception &e) {
                    LOG_ERROR("[Backgrounds] Background '" << backgrounds_[i]->name() << "' failed: " << e.what());
                }
                next_due[i] = Clock::now() + backgrounds_[i]->interval();
            }
            wake_at = std::min(wake_at, next_due[i]);
        }

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(wake_at - Clock::now());
        if (wait.count() > 0) {
            token.wait_for(wait);
        }
    }
}

}  // namespace components
}  // namespace helm
