#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>
#include <string>

namespace cadbridge::actions {

namespace {

class ViewportScreenshotAction final : public ActionHandler {
public:
    const char* name() const override { return "get_viewport_screenshot"; }

    Result<nlohmann::json> handle(ActionContext& ctx) override {
        if (auto error = reject_unknown_params(ctx, {"filepath", "width", "height"})) {
            return *error;
        }

        std::string filepath;
        if (auto error = optional_string(ctx, "filepath", filepath)) {
            return *error;
        }
        if (filepath.empty()) {
            return make_invalid_input("Parameter 'filepath' cannot be empty");
        }

        int width = 0;
        int height = 0;
        if (auto error = optional_int(ctx, "width", width)) {
            return *error;
        }
        if (auto error = optional_int(ctx, "height", height)) {
            return *error;
        }

        const std::string action = ctx.action;
        Result<std::string> result = ctx.context.executor.run(
            action, "Viewport Screenshot",
            [action, filepath, width, height](const host::ExecutionScope& scope, std::string& output) -> std::optional<Error> {
                host::Viewport* viewport = scope.app ? scope.app->active_viewport() : nullptr;
                if (!viewport) {
                    return make_execution_error(action, "No active viewport found. Cannot take screenshot.");
                }
                if (!viewport->save_as_image_file(filepath, width, height)) {
                    return make_execution_error(action, "Failed to save screenshot to " + filepath);
                }
                output = filepath;
                return std::nullopt;
            });
        if (is_error(result)) {
            return get_error(result);
        }

        LOG4CPLUS_INFO(server_logger(), "Screenshot saved to " << filepath);
        return nlohmann::json{{"filepath", get_value(result)}};
    }
};

} // namespace

void register_viewport_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ViewportScreenshotAction>());
}

} // namespace cadbridge::actions
