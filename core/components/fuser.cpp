#include "components/fuser.hpp"

#include <sstream>

namespace helm {
namespace components {

Fuser::Fuser(std::string system_prompt_base, std::string governance, std::string examples,
             std::vector<AgentAction> actions)
    : system_prompt_base_(std::move(system_prompt_base)),
      governance_(std::move(governance)),
      examples_(std::move(examples)),
      actions_(std::move(actions)) {}

std::optional<std::string> Fuser::fuse(const std::map<std::string, std::string> &inputs,
                                       const std::vector<ActionResult> &finished) const {
    if (inputs.empty() && finished.empty()) {
        return std::nullopt;
    }

    std::ostringstream prompt;
    if (!system_prompt_base_.empty()) {
        prompt << system_prompt_base_ << "\n\n";
    }
    if (!governance_.empty()) {
        prompt << "GOVERNANCE:\n" << governance_ << "\n\n";
    }

    if (!inputs.empty()) {
        prompt << "INPUTS:\n";
        for (const auto &entry : inputs) {
            prompt << "// " << entry.first << "\n" << entry.second << "\n";
        }
        prompt << "\n";
    }

    if (!finished.empty()) {
        prompt << "FINISHED ACTIONS:\n";
        for (const auto &result : finished) {
            prompt << result.action << " (" << result.value << "): " << (result.success ? "ok" : "failed");
            if (!result.message.empty()) {
                prompt << " - " << result.message;
            }
            prompt << "\n";
        }
        prompt << "\n";
    }

    if (!actions_.empty()) {
        prompt << "AVAILABLE ACTIONS:\n";
        for (const auto &action : actions_) {
            prompt << action.llm_label << "\n";
        }
        prompt << "\n";
    }

    if (!examples_.empty()) {
        prompt << "EXAMPLES:\n" << examples_ << "\n";
    }

    return prompt.str();
}

}  // namespace components
}  // namespace helm
