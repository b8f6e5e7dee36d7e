#include "action_registry.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>

namespace cadbridge::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        return;
    }
    std::string name = handler->name();
    if (!handlers_.emplace(name, std::move(handler)).second) {
        LOG4CPLUS_WARN(server_logger(), "Action already registered: " << name);
    }
}

ActionHandler* ActionRegistry::find(const std::string& action) const {
    auto it = handlers_.find(action);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> ActionRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace cadbridge::actions
