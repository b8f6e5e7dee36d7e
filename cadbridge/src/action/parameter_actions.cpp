#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace cadbridge::actions {

namespace {

nlohmann::json parameter_to_json(const host::Parameter& param) {
    return nlohmann::json{
        {"name", param.name},
        {"value", param.value},
        {"unit", param.unit},
        {"expression", param.expression},
        {"comment", param.comment},
    };
}

class GetUserParametersAction final : public ActionHandler {
public:
    const char* name() const override { return "get_user_parameters"; }

    Result<nlohmann::json> handle(ActionContext& ctx) override {
        if (auto error = reject_unknown_params(ctx, {})) {
            return *error;
        }

        const std::string action = ctx.action;
        auto parameters = std::make_shared<nlohmann::json>(nlohmann::json::array());
        Result<std::string> result = ctx.context.executor.run(
            action, "Read User Parameters",
            [action, parameters](const host::ExecutionScope& scope, std::string&) -> std::optional<Error> {
                if (!scope.document) {
                    return make_execution_error(action, "No active design found");
                }
                for (const auto& param : scope.document->user_parameters()) {
                    parameters->push_back(parameter_to_json(param));
                }
                return std::nullopt;
            });
        if (is_error(result)) {
            return get_error(result);
        }

        LOG4CPLUS_DEBUG(server_logger(), "get_user_parameters returned " << parameters->size() << " entries");
        return *parameters;
    }
};

class SetParameterAction final : public ActionHandler {
public:
    const char* name() const override { return "set_parameter"; }

    Result<nlohmann::json> handle(ActionContext& ctx) override {
        if (auto error = reject_unknown_params(ctx, {"param_name", "expression"})) {
            return *error;
        }

        std::string param_name;
        std::string expression;
        if (auto error = require_string(ctx, "param_name", param_name)) {
            return *error;
        }
        if (auto error = require_string(ctx, "expression", expression)) {
            return *error;
        }

        LOG4CPLUS_INFO(server_logger(), "set_parameter " << param_name << " = " << expression);

        const std::string action = ctx.action;
        auto updated = std::make_shared<nlohmann::json>();
        Result<std::string> result = ctx.context.executor.run(
            action, "Set Parameter " + param_name,
            [action, param_name, expression, updated](const host::ExecutionScope& scope, std::string&) -> std::optional<Error> {
                if (!scope.document) {
                    return make_execution_error(action, "No active design found");
                }
                if (!scope.document->parameter_by_name(param_name)) {
                    return make_execution_error(action, "Parameter '" + param_name + "' not found");
                }

                std::string why;
                if (!scope.document->set_parameter_expression(param_name, expression, why)) {
                    return make_execution_error(action, "Failed to set parameter '" + param_name + "': " + why);
                }

                auto param = scope.document->parameter_by_name(param_name);
                if (param) {
                    *updated = parameter_to_json(*param);
                }
                return std::nullopt;
            });
        if (is_error(result)) {
            return get_error(result);
        }
        return *updated;
    }
};

} // namespace

void register_parameter_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<GetUserParametersAction>());
    registry.add(std::make_unique<SetParameterAction>());
}

} // namespace cadbridge::actions
