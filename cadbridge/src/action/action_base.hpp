#pragma once

#include "../core_context.hpp"
#include "../error.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <optional>
#include <string>

namespace cadbridge::actions {

struct ActionContext {
	const std::string& action;
	BridgeContext& context;
	const nlohmann::json& params;
};

class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;
	virtual Result<nlohmann::json> handle(ActionContext& ctx) = 0;

protected:
	/// Rejects any key of params not listed in allowed.
	std::optional<Error> reject_unknown_params(
	    const ActionContext& ctx,
	    std::initializer_list<const char*> allowed);
	/// Fetches a required, non-empty string parameter.
	std::optional<Error> require_string(
	    const ActionContext& ctx,
	    const std::string& key,
	    std::string& out);
	/// Fetches an optional string parameter; absent or null leaves out untouched.
	std::optional<Error> optional_string(
	    const ActionContext& ctx,
	    const std::string& key,
	    std::string& out);
	std::optional<Error> optional_int(
	    const ActionContext& ctx,
	    const std::string& key,
	    int& out);
};

} // namespace cadbridge::actions
