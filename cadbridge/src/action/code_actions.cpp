#include "action_base.hpp"
#include "action_registry.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace cadbridge::actions {

namespace {

class ExecuteCodeAction final : public ActionHandler {
public:
    const char* name() const override { return "execute_code"; }

    Result<nlohmann::json> handle(ActionContext& ctx) override {
        if (auto error = reject_unknown_params(ctx, {"code", "transaction_name", "description"})) {
            return *error;
        }

        const nlohmann::json* code_obj = codec::find_key(ctx.params, "code");
        if (code_obj && !code_obj->is_null() && !code_obj->is_string()) {
            return make_invalid_input("Parameter 'code' must be a string for action 'execute_code'");
        }
        std::string code = code_obj && code_obj->is_string() ? code_obj->get<std::string>() : "";

        // transaction_name wins over the older description alias
        std::string label;
        if (auto error = optional_string(ctx, "description", label)) {
            return *error;
        }
        if (auto error = optional_string(ctx, "transaction_name", label)) {
            return *error;
        }

        LOG4CPLUS_INFO(server_logger(), "execute_code: " << code.size() << " bytes, label '"
                                            << (label.empty() ? kDefaultTransactionLabel : label) << "'");

        Result<std::string> result = ctx.context.executor.execute_in_transaction(code, label);
        if (is_error(result)) {
            return get_error(result);
        }
        return nlohmann::json(get_value(result));
    }
};

} // namespace

void register_code_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ExecuteCodeAction>());
}

} // namespace cadbridge::actions
