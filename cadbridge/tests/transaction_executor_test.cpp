#include <gtest/gtest.h>

#include "host/event_loop_host.hpp"
#include "test_helpers.hpp"
#include "transaction_executor.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using cadbridge::TransactionExecutor;
using cadbridge::host::EventLoopHost;

namespace {

/**
 * Host whose commands refuse auto-execute, so transaction setup throws
 * inside the created handler.
 */
class RejectingHost final : public cadbridge::host::Application,
                            public cadbridge::host::CommandDefinitions {
public:
    std::string version() const override { return "rejecting"; }
    cadbridge::host::CommandDefinitions& command_definitions() override { return *this; }
    cadbridge::host::Document* active_document() override { return nullptr; }
    cadbridge::host::Viewport* active_viewport() override { return nullptr; }
    bool is_running() const override { return true; }
    void show_message(const std::string&) override {}

    bool process_events() override {
        Definition* definition = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queued_.empty()) {
                return false;
            }
            auto it = definitions_.find(queued_.front());
            queued_.pop_front();
            if (it == definitions_.end()) {
                return true;
            }
            definition = it->second.get();
        }
        commands_.push_back(std::make_unique<RejectingCommand>(*definition));
        cadbridge::host::CommandCreatedEventArgs args{*commands_.back()};
        definition->created.notify(args);
        return true;
    }

    cadbridge::host::CommandDefinition* add_button_definition(
        const std::string& id, const std::string& name, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = definitions_[id];
        slot = std::make_unique<Definition>(*this, id, name);
        return slot.get();
    }

    cadbridge::host::CommandDefinition* item_by_id(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = definitions_.find(id);
        return it == definitions_.end() ? nullptr : it->second.get();
    }

    size_t count() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return definitions_.size();
    }

private:
    struct Definition final : cadbridge::host::CommandDefinition {
        Definition(RejectingHost& owner, std::string id, std::string name)
            : owner(owner), id_(std::move(id)), name_(std::move(name)) {}

        const std::string& id() const override { return id_; }
        const std::string& name() const override { return name_; }
        cadbridge::host::CommandCreatedEvent& on_command_created() override { return created; }

        bool execute() override {
            std::lock_guard<std::mutex> lock(owner.mutex_);
            owner.queued_.push_back(id_);
            return true;
        }

        bool delete_me() override {
            std::lock_guard<std::mutex> lock(owner.mutex_);
            return owner.definitions_.erase(id_) != 0;
        }

        RejectingHost& owner;
        std::string id_;
        std::string name_;
        cadbridge::host::CommandCreatedEvent created;
    };

    struct RejectingCommand final : cadbridge::host::Command {
        explicit RejectingCommand(cadbridge::host::CommandDefinition& parent) : parent(parent) {}

        cadbridge::host::CommandEvent& on_execute() override { return execute; }
        cadbridge::host::CommandEvent& on_destroy() override { return destroy; }
        void set_auto_execute(bool) override { throw std::runtime_error("auto-execute rejected"); }
        bool is_auto_execute() const override { return false; }
        cadbridge::host::CommandDefinition& parent_definition() override { return parent; }

        cadbridge::host::CommandDefinition& parent;
        cadbridge::host::CommandEvent execute;
        cadbridge::host::CommandEvent destroy;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Definition>> definitions_;
    std::deque<std::string> queued_;
    std::vector<std::unique_ptr<RejectingCommand>> commands_;
};

} // namespace

TEST(TransactionExecutor, ReturnsCapturedOutput) {
    EventLoopHost host;
    FakeScriptEngine engine;
    engine.print("2\n");
    TransactionExecutor executor(host, engine);

    auto result = executor.execute_in_transaction("print(1+1)");
    ASSERT_FALSE(cadbridge::is_error(result)) << cadbridge::get_error(result).message;
    EXPECT_EQ(cadbridge::get_value(result), "2\n");
    EXPECT_EQ(engine.calls(), 1);
    EXPECT_EQ(engine.last_code(), "print(1+1)");
}

TEST(TransactionExecutor, EmptyCodeNeverReachesTheHost) {
    EventLoopHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);

    auto result = executor.execute_in_transaction("");
    ASSERT_TRUE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_error(result).kind, cadbridge::ErrorKind::InvalidUserInput);
    EXPECT_EQ(cadbridge::get_error(result).message, "Parameter 'code' cannot be empty for action 'execute_code'");
    EXPECT_EQ(engine.calls(), 0);
    EXPECT_EQ(host.command_definitions().count(), 0u);
    EXPECT_EQ(host.pending_events(), 0u);
    EXPECT_EQ(executor.last_state(), nullptr);
}

TEST(TransactionExecutor, ScriptFailureIsDataWithTraceback) {
    EventLoopHost host;
    FakeScriptEngine engine;
    engine.fail_after("before", "Error: boom\n    at <eval>:1");
    TransactionExecutor executor(host, engine);

    auto result = executor.execute_in_transaction("throw new Error('boom')");
    ASSERT_FALSE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_value(result), "before\n--- TRACEBACK ---\nError: boom\n    at <eval>:1");
}

TEST(TransactionExecutor, StateFinishesExactlyOnceAndDefinitionIsRemoved) {
    EventLoopHost host;
    FakeScriptEngine engine;
    engine.print("done");
    TransactionExecutor executor(host, engine);

    auto result = executor.execute_in_transaction("x");
    ASSERT_FALSE(cadbridge::is_error(result));

    auto state = executor.last_state();
    ASSERT_NE(state, nullptr);
    EXPECT_TRUE(state->is_finished());
    EXPECT_EQ(state->result, "done");
    EXPECT_FALSE(state->host_error.has_value());

    // Leftover events cannot change the published result
    while (host.process_events()) {
    }
    EXPECT_EQ(state->result, "done");
    EXPECT_EQ(host.command_definitions().count(), 0u);
}

TEST(ExecutionState, FinishFlipsOnce) {
    cadbridge::ExecutionState state;
    EXPECT_FALSE(state.is_finished());
    EXPECT_TRUE(state.finish());
    EXPECT_FALSE(state.finish());
    EXPECT_TRUE(state.is_finished());
}

TEST(TransactionExecutor, EachCallIsOneLabelledUndoEntry) {
    EventLoopHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);

    ASSERT_FALSE(cadbridge::is_error(executor.execute_in_transaction("a")));
    ASSERT_FALSE(cadbridge::is_error(executor.execute_in_transaction("b", "Make Box")));
    EXPECT_EQ(host.document().transaction_history(),
              std::vector<std::string>({"Script Execution", "Make Box"}));
}

TEST(TransactionExecutor, ScopeExposesHostObjects) {
    EventLoopHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);

    ASSERT_FALSE(cadbridge::is_error(executor.execute_in_transaction("scope")));
    auto scope = engine.last_scope();
    EXPECT_EQ(scope.app, &host);
    EXPECT_EQ(scope.document, host.active_document());
    ASSERT_NE(scope.root, nullptr);
    EXPECT_EQ(scope.root->name(), "root");

    host.close_document();
    ASSERT_FALSE(cadbridge::is_error(executor.execute_in_transaction("scope")));
    scope = engine.last_scope();
    EXPECT_EQ(scope.document, nullptr);
    EXPECT_EQ(scope.root, nullptr);
}

TEST(TransactionExecutor, WorkErrorIsReturned) {
    EventLoopHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);

    auto result = executor.run("set_parameter", "Label",
        [](const cadbridge::host::ExecutionScope&, std::string&) -> std::optional<cadbridge::Error> {
            return cadbridge::make_execution_error("set_parameter", "Parameter 'x' not found");
        });
    ASSERT_TRUE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_error(result).kind, cadbridge::ErrorKind::ExecutionError);
    EXPECT_EQ(cadbridge::get_error(result).message, "Error executing action 'set_parameter': Parameter 'x' not found");
    EXPECT_EQ(host.command_definitions().count(), 0u);
}

TEST(TransactionExecutor, ThrowingWorkBecomesExecutionError) {
    EventLoopHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);

    auto result = executor.run("get_user_parameters", "Label",
        [](const cadbridge::host::ExecutionScope&, std::string&) -> std::optional<cadbridge::Error> {
            throw std::runtime_error("kaboom");
        });
    ASSERT_TRUE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_error(result).message,
              "Error executing action 'get_user_parameters': An error occurred during execution in the host: kaboom");
}

TEST(TransactionExecutor, SetupFailureFinishesWithExecutionError) {
    RejectingHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);

    auto result = executor.execute_in_transaction("print(1)");
    ASSERT_TRUE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_error(result).kind, cadbridge::ErrorKind::ExecutionError);
    EXPECT_EQ(cadbridge::get_error(result).message,
              "Error executing action 'execute_code': Failed to set up transaction: auto-execute rejected");

    auto state = executor.last_state();
    ASSERT_NE(state, nullptr);
    EXPECT_TRUE(state->is_finished());
    EXPECT_EQ(engine.calls(), 0);
    EXPECT_EQ(host.command_definitions().count(), 0u);
}

TEST(TransactionExecutor, StoppedHostIsAnExecutionError) {
    EventLoopHost host;
    FakeScriptEngine engine;
    TransactionExecutor executor(host, engine);
    host.stop();

    auto result = executor.execute_in_transaction("print(1)");
    ASSERT_TRUE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_error(result).kind, cadbridge::ErrorKind::ExecutionError);
    EXPECT_EQ(engine.calls(), 0);
}

TEST(TransactionExecutor, HostStoppingMidTransactionEndsTheWait) {
    EventLoopHost host;
    FakeScriptEngine engine;
    engine.set_behaviour([&host](const std::string&, const cadbridge::host::ExecutionScope&, std::string& output) {
        output = "partial";
        host.stop();
        return cadbridge::script::ScriptOutcome{};
    });
    TransactionExecutor executor(host, engine);

    auto result = executor.execute_in_transaction("print(1)", "Long Job");
    ASSERT_TRUE(cadbridge::is_error(result));
    EXPECT_EQ(cadbridge::get_error(result).message,
              "Error executing action 'execute_code': Host stopped before transaction 'Long Job' completed");
    EXPECT_EQ(host.command_definitions().count(), 0u);
}

TEST(TransactionExecutor, ConcurrentCallsAreSerializedThroughTheHost) {
    EventLoopHost host;
    FakeScriptEngine engine;
    std::atomic<int> inside{0};
    std::atomic<int> overlap{0};
    engine.set_behaviour([&](const std::string& code, const cadbridge::host::ExecutionScope&, std::string& output) {
        if (++inside > 1) {
            ++overlap;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        output = code;
        --inside;
        return cadbridge::script::ScriptOutcome{};
    });
    TransactionExecutor executor(host, engine);

    std::vector<std::thread> callers;
    std::vector<std::string> results(6);
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([&executor, &results, i] {
            auto result = executor.execute_in_transaction("call" + std::to_string(i));
            if (!cadbridge::is_error(result)) {
                results[i] = cadbridge::get_value(result);
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(results[i], "call" + std::to_string(i));
    }
    EXPECT_EQ(overlap.load(), 0);
    EXPECT_EQ(host.document().transaction_history().size(), 6u);
}
