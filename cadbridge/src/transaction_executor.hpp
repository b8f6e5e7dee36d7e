#pragma once

#include "error.hpp"
#include "host/host_api.hpp"
#include "script/script_engine.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cadbridge {

/**
 * Per-call state shared between the waiting caller and the host dispatch
 * thread. `result` is written before `finished` flips, and `finished` flips
 * exactly once.
 */
struct ExecutionState {
    std::string result;
    std::optional<Error> host_error;

    bool is_finished() const { return finished_.load(std::memory_order_acquire); }

    /// Returns false when the state was already finished.
    bool finish() {
        bool expected = false;
        return finished_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

private:
    std::atomic<bool> finished_{false};
};

inline constexpr const char* kDefaultTransactionLabel = "Script Execution";
inline constexpr const char* kTracebackSeparator = "--- TRACEBACK ---";

/**
 * Runs work inside a temporary host command so it executes on the host's
 * dispatch thread as one undoable transaction, and blocks the caller while
 * driving the host pump until the command is destroyed.
 */
class TransactionExecutor {
public:
    /// Work returns an Error for native failures; script failures are output.
    using Work = std::function<std::optional<Error>(const host::ExecutionScope& scope, std::string& output)>;

    TransactionExecutor(host::Application& app, script::ScriptEngine& engine);

    Result<std::string> execute_in_transaction(const std::string& code, const std::string& label = kDefaultTransactionLabel);
    Result<std::string> run(const std::string& action, const std::string& label, Work work);

    /// State of the most recent call, kept for inspection.
    std::shared_ptr<const ExecutionState> last_state() const;

private:
    host::Application& app_;
    script::ScriptEngine& engine_;

    mutable std::mutex last_mutex_;
    std::shared_ptr<const ExecutionState> last_state_;
};

} // namespace cadbridge
