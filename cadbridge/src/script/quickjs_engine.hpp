#pragma once

#include "script/script_engine.hpp"

#include <cstddef>

namespace cadbridge::script {

/**
 * JavaScript engine backed by QuickJS. Every run gets a fresh runtime and
 * context, so no state leaks between calls.
 *
 * Globals: print(...), console.log(...), app, design, root_comp.
 */
class QuickJsEngine final : public ScriptEngine {
public:
    explicit QuickJsEngine(size_t memory_limit = 256 * 1024 * 1024, size_t stack_size = 1024 * 1024);

    const char* name() const override { return "quickjs"; }
    ScriptOutcome run(const std::string& code, const host::ExecutionScope& scope, std::string& output) override;

private:
    size_t memory_limit_;
    size_t stack_size_;
};

} // namespace cadbridge::script
