#include "components/io_provider.hpp"

namespace helm {
namespace components {

void IoProvider::add_input(const std::string &descriptor, const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_[descriptor] = text;
}

std::map<std::string, std::string> IoProvider::drain_inputs() {
    std::map<std::string, std::string> drained;
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(inputs_);
    return drained;
}

void IoProvider::set_mode_transition_input(const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_transition_input_ = text;
}

std::optional<std::string> IoProvider::take_mode_transition_input() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<std::string> text;
    text.swap(mode_transition_input_);
    return text;
}

void IoProvider::reset_inputs() {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_.clear();
    mode_transition_input_.reset();
}

void IoProvider::clear() {
    reset_inputs();
    skip_sleep_.store(false);
}

}  // namespace components
}  // namespace helm
