#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "components/plugin_types.hpp"

namespace helm {
namespace components {

/**
 * Fuser - builds the reasoning prompt for one tick.
 *
 * Sections appear in a fixed order: mode system prompt, governance, the
 * drained sensor readings, results of actions finished since the previous
 * tick, the actions the mode offers, and examples. Empty sections are left out.
 */
class Fuser {
public:
    Fuser(std::string system_prompt_base, std::string governance, std::string examples,
          std::vector<AgentAction> actions);

    /**
     * @return nullopt when there are neither inputs nor finished actions
     */
    std::optional<std::string> fuse(const std::map<std::string, std::string> &inputs,
                                    const std::vector<ActionResult> &finished) const;

private:
    std::string system_prompt_base_;
    std::string governance_;
    std::string examples_;
    std::vector<AgentAction> actions_;
};

}  // namespace components
}  // namespace helm
