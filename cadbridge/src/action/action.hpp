#pragma once

#include "../core_context.hpp"
#include "../error.hpp"
#include "../http_server.hpp"
#include "action_registry.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace cadbridge::actions {

/**
 * Resolves an action name to its handler and turns handler failures into
 * taxonomy errors. The registry is filled once here and never changes.
 */
class Dispatcher {
public:
    explicit Dispatcher(BridgeContext& context);

    Result<nlohmann::json> dispatch(const std::string& action, const nlohmann::json& params);
    std::vector<std::string> action_names() const { return registry_.names(); }

private:
    BridgeContext& context_;
    ActionRegistry registry_;
};

/// Maps one HTTP request onto dispatch() and renders the response envelope.
HttpReply handle_http_request(Dispatcher& dispatcher, const HttpRequest& request);

} // namespace cadbridge::actions
