#pragma once

#include "action_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadbridge::actions {

class ActionRegistry {
public:
    void add(std::unique_ptr<ActionHandler> handler);
    ActionHandler* find(const std::string& action) const;
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, std::unique_ptr<ActionHandler>> handlers_;
};

void register_code_actions(ActionRegistry& registry);
void register_viewport_actions(ActionRegistry& registry);
void register_parameter_actions(ActionRegistry& registry);

} // namespace cadbridge::actions
