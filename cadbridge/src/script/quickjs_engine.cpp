#include "script/quickjs_engine.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include "quickjs.h"

#include <cstdint>
#include <memory>
#include <string>

namespace cadbridge::script {

namespace {

struct Session {
    std::string* output;
    const host::ExecutionScope* scope;
};

Session& session_of(JSContext* ctx) {
    return *static_cast<Session*>(JS_GetContextOpaque(ctx));
}

void clear_pending_exception(JSContext* ctx) {
    JS_FreeValue(ctx, JS_GetException(ctx));
}

std::string to_std_string(JSContext* ctx, JSValueConst value) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        clear_pending_exception(ctx);
        return "[unprintable]";
    }
    std::string text(str, len);
    JS_FreeCString(ctx, str);
    return text;
}

JSValue new_string(JSContext* ctx, const std::string& text) {
    return JS_NewStringLen(ctx, text.data(), text.size());
}

std::string describe_exception(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    std::string text = to_std_string(ctx, exception);

    JSValue stack = JS_GetPropertyStr(ctx, exception, "stack");
    if (JS_IsException(stack)) {
        clear_pending_exception(ctx);
    } else if (!JS_IsUndefined(stack)) {
        std::string stack_text = to_std_string(ctx, stack);
        if (!stack_text.empty()) {
            text += "\n";
            text += stack_text;
        }
    }
    JS_FreeValue(ctx, stack);
    JS_FreeValue(ctx, exception);
    return text;
}

JSValue js_print(JSContext* ctx, JSValueConst /*this_val*/, int argc, JSValueConst* argv) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += to_std_string(ctx, argv[i]);
    }
    line += '\n';
    session_of(ctx).output->append(line);
    return JS_UNDEFINED;
}

JSValue parameter_to_object(JSContext* ctx, const host::Parameter& param) {
    JSValue obj = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, obj, "name", new_string(ctx, param.name));
    JS_SetPropertyStr(ctx, obj, "value", JS_NewFloat64(ctx, param.value));
    JS_SetPropertyStr(ctx, obj, "unit", new_string(ctx, param.unit));
    JS_SetPropertyStr(ctx, obj, "expression", new_string(ctx, param.expression));
    JS_SetPropertyStr(ctx, obj, "comment", new_string(ctx, param.comment));
    return obj;
}

JSValue js_design_parameters(JSContext* ctx, JSValueConst /*this_val*/, int /*argc*/, JSValueConst* /*argv*/) {
    host::Document* document = session_of(ctx).scope->document;
    if (!document) {
        return JS_ThrowReferenceError(ctx, "no active design");
    }

    JSValue array = JS_NewArray(ctx);
    uint32_t index = 0;
    for (const auto& param : document->user_parameters()) {
        JS_SetPropertyUint32(ctx, array, index++, parameter_to_object(ctx, param));
    }
    return array;
}

JSValue js_design_set_parameter(JSContext* ctx, JSValueConst /*this_val*/, int argc, JSValueConst* argv) {
    if (argc < 2) {
        return JS_ThrowTypeError(ctx, "setParameter(name, expression) requires 2 arguments");
    }
    host::Document* document = session_of(ctx).scope->document;
    if (!document) {
        return JS_ThrowReferenceError(ctx, "no active design");
    }

    std::string name = to_std_string(ctx, argv[0]);
    std::string expression = to_std_string(ctx, argv[1]);
    std::string error;
    if (!document->set_parameter_expression(name, expression, error)) {
        return JS_ThrowInternalError(ctx, "%s", error.c_str());
    }

    auto updated = document->parameter_by_name(name);
    if (!updated) {
        return JS_UNDEFINED;
    }
    return parameter_to_object(ctx, *updated);
}

void install_globals(JSContext* ctx, const host::ExecutionScope& scope) {
    JSValue global = JS_GetGlobalObject(ctx);

    JS_SetPropertyStr(ctx, global, "print", JS_NewCFunction(ctx, js_print, "print", 1));

    JSValue console = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, console, "log", JS_NewCFunction(ctx, js_print, "log", 1));
    JS_SetPropertyStr(ctx, global, "console", console);

    if (scope.app) {
        JSValue app = JS_NewObject(ctx);
        JS_SetPropertyStr(ctx, app, "version", new_string(ctx, scope.app->version()));
        JS_SetPropertyStr(ctx, global, "app", app);
    } else {
        JS_SetPropertyStr(ctx, global, "app", JS_NULL);
    }

    if (scope.document) {
        JSValue design = JS_NewObject(ctx);
        JS_SetPropertyStr(ctx, design, "name", new_string(ctx, scope.document->name()));
        JS_SetPropertyStr(ctx, design, "parameters", JS_NewCFunction(ctx, js_design_parameters, "parameters", 0));
        JS_SetPropertyStr(ctx, design, "setParameter", JS_NewCFunction(ctx, js_design_set_parameter, "setParameter", 2));
        JS_SetPropertyStr(ctx, global, "design", design);
    } else {
        JS_SetPropertyStr(ctx, global, "design", JS_NULL);
    }

    if (scope.root) {
        JSValue root = JS_NewObject(ctx);
        JS_SetPropertyStr(ctx, root, "name", new_string(ctx, scope.root->name()));
        JS_SetPropertyStr(ctx, global, "root_comp", root);
    } else {
        JS_SetPropertyStr(ctx, global, "root_comp", JS_NULL);
    }

    JS_FreeValue(ctx, global);
}

} // namespace

QuickJsEngine::QuickJsEngine(size_t memory_limit, size_t stack_size)
    : memory_limit_(memory_limit), stack_size_(stack_size) {}

ScriptOutcome QuickJsEngine::run(const std::string& code, const host::ExecutionScope& scope, std::string& output) {
    ScriptOutcome outcome;

    std::unique_ptr<JSRuntime, decltype(&JS_FreeRuntime)> runtime(JS_NewRuntime(), &JS_FreeRuntime);
    if (!runtime) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to create QuickJS runtime");
        outcome.ok = false;
        outcome.trace = "InternalError: failed to create script runtime";
        return outcome;
    }
    JS_SetMemoryLimit(runtime.get(), memory_limit_);
    JS_SetMaxStackSize(runtime.get(), stack_size_);

    std::unique_ptr<JSContext, decltype(&JS_FreeContext)> context(JS_NewContext(runtime.get()), &JS_FreeContext);
    if (!context) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to create QuickJS context");
        outcome.ok = false;
        outcome.trace = "InternalError: failed to create script context";
        return outcome;
    }
    JSContext* ctx = context.get();

    Session session{&output, &scope};
    JS_SetContextOpaque(ctx, &session);
    install_globals(ctx, scope);

    JSValue result = JS_Eval(ctx, code.c_str(), code.size(), "<execute_code>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(result)) {
        outcome.ok = false;
        outcome.trace = describe_exception(ctx);
    }
    JS_FreeValue(ctx, result);

    // Settle promise jobs queued by the script before the context goes away.
    for (;;) {
        JSContext* job_ctx = nullptr;
        int rc = JS_ExecutePendingJob(runtime.get(), &job_ctx);
        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            if (outcome.ok) {
                outcome.ok = false;
                outcome.trace = describe_exception(job_ctx);
            } else {
                clear_pending_exception(job_ctx);
            }
            break;
        }
    }

    LOG4CPLUS_DEBUG(core_logger(), "QuickJS run finished ok=" << outcome.ok << " output=" << output.size() << " bytes");
    return outcome;
}

} // namespace cadbridge::script
