#pragma once

#include "host/host_api.hpp"

#include <string>

namespace cadbridge::script {

struct ScriptOutcome {
    bool ok = true;
    std::string trace; // error text and stack when !ok
};

/**
 * Runs an opaque unit of user code against a capability scope.
 *
 * Implementations must write print-like output to `output` as it happens,
 * so output produced before a failure is kept. A failing script is
 * reported through ScriptOutcome, never by throwing.
 */
class ScriptEngine {
public:
    virtual ~ScriptEngine() = default;
    virtual const char* name() const = 0;
    virtual ScriptOutcome run(const std::string& code, const host::ExecutionScope& scope, std::string& output) = 0;
};

} // namespace cadbridge::script
