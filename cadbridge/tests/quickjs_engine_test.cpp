#include <gtest/gtest.h>

#include "host/event_loop_host.hpp"
#include "script/quickjs_engine.hpp"

#include <string>

using cadbridge::script::QuickJsEngine;
using cadbridge::script::ScriptOutcome;

class QuickJsEngineTest : public ::testing::Test {
protected:
    cadbridge::host::EventLoopHost host;
    QuickJsEngine engine;
    std::string output;

    cadbridge::host::ExecutionScope full_scope() {
        cadbridge::host::ExecutionScope scope;
        scope.app = &host;
        scope.document = host.active_document();
        scope.root = scope.document->root_component();
        return scope;
    }

    ScriptOutcome run(const std::string& code) {
        return engine.run(code, full_scope(), output);
    }
};

TEST_F(QuickJsEngineTest, PrintAndConsoleLogAppendLines) {
    ScriptOutcome outcome = run("print(1 + 1); console.log('a', 'b', 3); print();");
    EXPECT_TRUE(outcome.ok) << outcome.trace;
    EXPECT_EQ(output, "2\na b 3\n\n");
    EXPECT_EQ(engine.name(), std::string("quickjs"));
}

TEST_F(QuickJsEngineTest, ThrowKeepsEarlierOutput) {
    ScriptOutcome outcome = run("print('before'); throw new Error('boom'); print('after');");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(output, "before\n");
    EXPECT_EQ(outcome.trace.rfind("Error: boom", 0), 0u) << outcome.trace;
    EXPECT_NE(outcome.trace.find("<execute_code>"), std::string::npos) << outcome.trace;
}

TEST_F(QuickJsEngineTest, SyntaxErrorIsReported) {
    ScriptOutcome outcome = run("print(");
    EXPECT_FALSE(outcome.ok);
    EXPECT_NE(outcome.trace.find("SyntaxError"), std::string::npos) << outcome.trace;
    EXPECT_TRUE(output.empty());
}

TEST_F(QuickJsEngineTest, ScopeGlobalsReflectTheHost) {
    ASSERT_TRUE(host.document().add_user_parameter("width", "20 mm", "plate"));

    ScriptOutcome outcome = run(
        "print(app.version);"
        "print(design.name);"
        "print(root_comp.name);"
        "const p = design.parameters();"
        "print(p.length, p[0].name, p[0].value, p[0].unit);");
    EXPECT_TRUE(outcome.ok) << outcome.trace;
    EXPECT_EQ(output, "cadbridge-headless\nUntitled\nroot\n1 width 20 mm\n");
}

TEST_F(QuickJsEngineTest, SetParameterChangesTheDocument) {
    ASSERT_TRUE(host.document().add_user_parameter("width", "20 mm"));

    ScriptOutcome outcome = run("const p = design.setParameter('width', '42 mm'); print(p.value);");
    EXPECT_TRUE(outcome.ok) << outcome.trace;
    EXPECT_EQ(output, "42\n");
    auto width = host.document().parameter_by_name("width");
    ASSERT_TRUE(width.has_value());
    EXPECT_DOUBLE_EQ(width->value, 42.0);

    output.clear();
    outcome = run("design.setParameter('width', 'abc');");
    EXPECT_FALSE(outcome.ok);
    EXPECT_NE(outcome.trace.find("not a valid expression"), std::string::npos) << outcome.trace;
}

TEST_F(QuickJsEngineTest, AbsentObjectsAreNull) {
    cadbridge::host::ExecutionScope empty;
    ScriptOutcome outcome = engine.run("print(app === null, design === null, root_comp === null);", empty, output);
    EXPECT_TRUE(outcome.ok) << outcome.trace;
    EXPECT_EQ(output, "true true true\n");
}

TEST_F(QuickJsEngineTest, EachRunStartsWithFreshGlobals) {
    ASSERT_TRUE(run("var counter = 41;").ok);
    ScriptOutcome outcome = run("print(typeof counter);");
    EXPECT_TRUE(outcome.ok);
    EXPECT_EQ(output, "undefined\n");
}

TEST_F(QuickJsEngineTest, RunawayRecursionFailsCleanly) {
    ScriptOutcome outcome = run("function f() { return f() + 1; } f();");
    EXPECT_FALSE(outcome.ok);
    EXPECT_NE(outcome.trace.find("stack"), std::string::npos) << outcome.trace;
}

TEST_F(QuickJsEngineTest, EmbeddedNulSurvivesBothDirections) {
    ASSERT_TRUE(host.document().add_user_parameter("width", "20 mm", std::string("left\0right", 10)));

    ScriptOutcome outcome = run("print('a\\0b'); print(design.parameters()[0].comment.length);");
    EXPECT_TRUE(outcome.ok) << outcome.trace;
    EXPECT_EQ(output, std::string("a\0b\n10\n", 7));
}
