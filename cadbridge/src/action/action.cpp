#include "action.hpp"

#include "action_base.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>

namespace cadbridge::actions {

std::optional<Error> ActionHandler::reject_unknown_params(
    const ActionContext& ctx,
    std::initializer_list<const char*> allowed) {
	for (const auto& item : ctx.params.items()) {
		const std::string& key = item.key();
		bool known = std::any_of(allowed.begin(), allowed.end(), [&key](const char* name) { return key == name; });
		if (!known) {
			LOG4CPLUS_WARN(server_logger(), ctx.action << ": unexpected parameter " << key);
			return make_invalid_input("Unexpected parameter '" + key + "' for action '" + ctx.action + "'");
		}
	}
	return std::nullopt;
}

std::optional<Error> ActionHandler::require_string(
    const ActionContext& ctx,
    const std::string& key,
    std::string& out) {
	const nlohmann::json* value = codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		return make_invalid_input("Missing required parameter '" + key + "' for action '" + ctx.action + "'");
	}
	if (!value->is_string()) {
		return make_invalid_input("Parameter '" + key + "' must be a string for action '" + ctx.action + "'");
	}
	out = value->get<std::string>();
	if (out.empty()) {
		return make_invalid_input("Parameter '" + key + "' cannot be empty for action '" + ctx.action + "'");
	}
	return std::nullopt;
}

std::optional<Error> ActionHandler::optional_string(
    const ActionContext& ctx,
    const std::string& key,
    std::string& out) {
	const nlohmann::json* value = codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		return std::nullopt;
	}
	if (!value->is_string()) {
		return make_invalid_input("Parameter '" + key + "' must be a string for action '" + ctx.action + "'");
	}
	out = value->get<std::string>();
	return std::nullopt;
}

std::optional<Error> ActionHandler::optional_int(
    const ActionContext& ctx,
    const std::string& key,
    int& out) {
	const nlohmann::json* value = codec::find_key(ctx.params, key);
	if (!value || value->is_null()) {
		return std::nullopt;
	}
	if (!value->is_number_integer() || codec::as_int64(*value) < 0 || codec::as_int64(*value) > 16384) {
		return make_invalid_input("Parameter '" + key + "' must be an integer between 0 and 16384 for action '" +
		                          ctx.action + "'");
	}
	out = static_cast<int>(codec::as_int64(*value));
	return std::nullopt;
}

Dispatcher::Dispatcher(BridgeContext& context) : context_(context) {
	register_code_actions(registry_);
	register_viewport_actions(registry_);
	register_parameter_actions(registry_);
	LOG4CPLUS_DEBUG(server_logger(), "Registered " << registry_.names().size() << " actions");
}

Result<nlohmann::json> Dispatcher::dispatch(const std::string& action, const nlohmann::json& params) {
	ActionHandler* handler = registry_.find(action);
	if (!handler) {
		LOG4CPLUS_WARN(server_logger(), "Unknown action: " << action);
		return make_invalid_input("Action '" + action + "' not found.");
	}

	LOG4CPLUS_INFO(server_logger(), "Action: " << action);
	ActionContext ctx{action, context_, params};
	try {
		return handler->handle(ctx);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(server_logger(), "Action " << action << " threw: " << exc.what());
		return make_execution_error(
		    action, std::string("An error occurred during execution in the host: ") + exc.what());
	}
}

HttpReply handle_http_request(Dispatcher& dispatcher, const HttpRequest& request) {
	HttpReply reply;
	const std::string action = codec::action_from_target(request.target);

	if (request.method != "POST") {
		reply.status = 405;
		reply.body = codec::serialize(codec::error_envelope(
		    make_bad_request("Method " + request.method + " not allowed, use POST")));
		return reply;
	}

	try {
		Result<nlohmann::json> params = codec::decode_params(request.body);
		if (is_error(params)) {
			const Error& error = get_error(params);
			LOG4CPLUS_WARN(server_logger(), "Rejected request for " << action << ": " << error.message);
			reply.status = http_status_for(error.kind);
			reply.body = codec::serialize(codec::error_envelope(error));
			return reply;
		}

		Result<nlohmann::json> result = dispatcher.dispatch(action, get_value(params));
		if (is_error(result)) {
			const Error& error = get_error(result);
			LOG4CPLUS_WARN(server_logger(), action << " failed: " << to_string(error));
			reply.status = http_status_for(error.kind);
			reply.body = codec::serialize(codec::error_envelope(error));
			return reply;
		}

		reply.status = 200;
		reply.body = codec::serialize(codec::success_envelope(get_value(result)));
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(server_logger(), "Unexpected error handling " << action << ": " << exc.what());
		reply.status = 500;
		reply.body = codec::serialize(codec::error_envelope(
		    make_internal_error(std::string("An unexpected internal error occurred: ") + exc.what())));
	}
	return reply;
}

} // namespace cadbridge::actions
