#include "transaction_executor.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <utility>

namespace cadbridge {

namespace {

std::string make_transaction_id() {
    boost::uuids::random_generator generator;
    return "cadbridge_txn_" + boost::uuids::to_string(generator());
}

// Only valid inside a command callback.
host::ExecutionScope scope_of(host::Application& app) {
    host::ExecutionScope scope;
    scope.app = &app;
    scope.document = app.active_document();
    scope.root = scope.document ? scope.document->root_component() : nullptr;
    return scope;
}

} // namespace

TransactionExecutor::TransactionExecutor(host::Application& app, script::ScriptEngine& engine)
    : app_(app), engine_(engine) {}

Result<std::string> TransactionExecutor::execute_in_transaction(const std::string& code, const std::string& label) {
    if (code.empty()) {
        return make_invalid_input("Parameter 'code' cannot be empty for action 'execute_code'");
    }

    script::ScriptEngine& engine = engine_;
    return run("execute_code", label.empty() ? kDefaultTransactionLabel : label,
               [&engine, code](const host::ExecutionScope& scope, std::string& output) -> std::optional<Error> {
                   script::ScriptOutcome outcome = engine.run(code, scope, output);
                   if (!outcome.ok) {
                       if (!output.empty() && output.back() != '\n') {
                           output += '\n';
                       }
                       output += kTracebackSeparator;
                       output += '\n';
                       output += outcome.trace;
                   }
                   return std::nullopt;
               });
}

Result<std::string> TransactionExecutor::run(const std::string& action, const std::string& label, Work work) {
    if (!app_.is_running()) {
        return make_execution_error(action, "The CAD host is not running");
    }

    auto state = std::make_shared<ExecutionState>();
    const std::string id = make_transaction_id();

    host::CommandDefinitions& definitions = app_.command_definitions();
    host::CommandDefinition* definition = definitions.add_button_definition(id, label, "Bridge transaction");
    if (!definition) {
        LOG4CPLUS_ERROR(core_logger(), "Cannot register command definition " << id);
        return make_execution_error(action, "Failed to register transaction command for '" + label + "'");
    }

    host::Application* app = &app_;
    definition->on_command_created().add([app, state, action, work](host::CommandCreatedEventArgs& args) {
        if (state->is_finished()) {
            return;
        }
        try {
            host::Command& command = args.command;

            command.on_execute().add([app, state, action, work](host::CommandEventArgs&) {
                if (state->is_finished()) {
                    return;
                }
                std::string output;
                std::optional<Error> error;
                try {
                    error = work(scope_of(*app), output);
                } catch (const std::exception& exc) {
                    error = make_execution_error(
                        action, std::string("An error occurred during execution in the host: ") + exc.what());
                }
                if (error) {
                    state->host_error = std::move(error);
                } else {
                    state->result = std::move(output);
                }
            });

            command.on_destroy().add([state](host::CommandEventArgs& destroy_args) {
                if (state->is_finished()) {
                    return;
                }
                host::CommandDefinition& parent = destroy_args.command.parent_definition();
                if (!parent.delete_me()) {
                    LOG4CPLUS_WARN(core_logger(), "Failed to delete command definition " << parent.id());
                }
                state->finish();
            });

            command.set_auto_execute(true);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Transaction setup failed: " << exc.what());
            state->host_error = make_execution_error(action, std::string("Failed to set up transaction: ") + exc.what());
            state->finish();
        }
    });

    if (!definition->execute()) {
        definition->delete_me();
        return make_execution_error(action, "Failed to start transaction '" + label + "'");
    }
    LOG4CPLUS_DEBUG(core_logger(), "Transaction " << id << " queued for " << action);

    const bool completed = host::drive_until(app_, [&state] { return state->is_finished(); });

    if (host::CommandDefinition* leftover = definitions.item_by_id(id)) {
        leftover->delete_me();
    }

    {
        std::lock_guard<std::mutex> lock(last_mutex_);
        last_state_ = state;
    }

    if (!completed) {
        LOG4CPLUS_WARN(core_logger(), "Host stopped while transaction " << id << " was pending");
        return make_execution_error(action, "Host stopped before transaction '" + label + "' completed");
    }
    if (state->host_error) {
        return *state->host_error;
    }
    LOG4CPLUS_DEBUG(core_logger(), "Transaction " << id << " finished, " << state->result.size() << " bytes of output");
    return state->result;
}

std::shared_ptr<const ExecutionState> TransactionExecutor::last_state() const {
    std::lock_guard<std::mutex> lock(last_mutex_);
    return last_state_;
}

} // namespace cadbridge
