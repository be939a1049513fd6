#include <gtest/gtest.h>
#include "../RpyFmt/runtime/lua_engine.h"
#include "test_helpers.h"
#include "../RpyFmt/src/rpyfmt_formatter_lib.h"
#include <string>

#ifndef RPYFMT_ENGINES_DIR
#define RPYFMT_ENGINES_DIR "RpyFmt/engines"
#endif

using namespace RpyFmt;

// =============================================================================
// spacing.lua
// =============================================================================

class SpacingScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string error;
        ASSERT_TRUE(engine.loadFile(std::string(RPYFMT_ENGINES_DIR) + "/spacing.lua", error))
            << error;
    }

    EngineOutput run(const std::string& source) {
        return engine.format(source, options, std::chrono::milliseconds(5000));
    }

    std::string formatted(const std::string& source) {
        EngineOutput out = run(source);
        EXPECT_TRUE(out.isOk()) << out.message;
        return out.text;
    }

    LuaEngine engine;
    EngineOptions options;
};

TEST_F(SpacingScriptTest, NameComesFromScriptFile) {
    EXPECT_TRUE(engine.isLoaded());
    EXPECT_EQ(engine.getName(), "lua:spacing.lua");
}

TEST_F(SpacingScriptTest, SpacesAssignments) {
    EXPECT_EQ(formatted("x=1\ny =2\n"), "x = 1\ny = 2\n");
    EXPECT_EQ(formatted("total  +=   3\n"), "total += 3\n");
}

TEST_F(SpacingScriptTest, KeywordArgumentsAndCommas) {
    EXPECT_EQ(formatted("f(a = 1,b)\n"), "f(a=1, b)\n");
    EXPECT_EQ(formatted("items = [1 ,2,3, ]\n"), "items = [1, 2, 3,]\n");
}

TEST_F(SpacingScriptTest, Comparisons) {
    EXPECT_EQ(formatted("if a==b or c!=d:\n    pass\n"), "if a == b or c != d:\n    pass\n");
    EXPECT_EQ(formatted("ok = n>=1 and n<=9\n"), "ok = n >= 1 and n <= 9\n");
    EXPECT_EQ(formatted("y = x**2 // 3\n"), "y = x**2 // 3\n");
}

TEST_F(SpacingScriptTest, StringsAndCommentsUntouched) {
    EXPECT_EQ(formatted("s = 'a=b,c'  \n"), "s = 'a=b,c'\n");
    EXPECT_EQ(formatted("x=1 # y=2,z\n"), "x = 1 # y=2,z\n");

    const std::string doc = "doc = \"\"\"a=b\n  c ,d  \n\"\"\"\n";
    EXPECT_EQ(formatted(doc), doc);
}

TEST_F(SpacingScriptTest, IsIdempotent) {
    const std::string source = "def f(a, b=2):\n    return {'k': a, 'v': b}\n\n\n";
    std::string once = formatted(source);
    EXPECT_EQ(once, "def f(a, b=2):\n    return {'k': a, 'v': b}\n");
    EXPECT_EQ(formatted(once), once);
}

TEST_F(SpacingScriptTest, UnclosedBracketIsSyntaxError) {
    EngineOutput out = run("x = 1\nfoo(1,\n");
    ASSERT_EQ(out.status, EngineOutput::Status::SyntaxError);
    EXPECT_EQ(out.message, "'(' was never closed");
    EXPECT_EQ(out.line, 2);
    EXPECT_EQ(out.column, 4);
}

TEST_F(SpacingScriptTest, UnmatchedCloserIsSyntaxError) {
    EngineOutput out = run("x = 1)\n");
    ASSERT_EQ(out.status, EngineOutput::Status::SyntaxError);
    EXPECT_EQ(out.message, "unmatched ')'");
    EXPECT_EQ(out.line, 1);
    EXPECT_EQ(out.column, 6);
}

TEST_F(SpacingScriptTest, UnterminatedStringIsSyntaxError) {
    EngineOutput out = run("x = 'abc\n");
    ASSERT_EQ(out.status, EngineOutput::Status::SyntaxError);
    EXPECT_EQ(out.line, 1);
    EXPECT_EQ(out.column, 5);
}

TEST_F(SpacingScriptTest, FormatsWholeDocument) {
    DocumentReport report = formatDocumentText(
        "label start:\n"
        "    $ score+=1\n"
        "    python:\n"
        "        name=\"Eileen\"\n"
        "        greet(name,loud = True)\n"
        "    \"Hello.\"\n",
        engine, FormatOptions::Sequential());

    ASSERT_TRUE(report.success) << report.error_message;
    EXPECT_EQ(report.formatted_code,
              "label start:\n"
              "    $ score += 1\n"
              "    python:\n"
              "        name = \"Eileen\"\n"
              "        greet(name, loud=True)\n"
              "    \"Hello.\"\n");
}

// =============================================================================
// Script Loading and Protocol
// =============================================================================

TEST(LuaEngineTest, OptionsReachTheScript) {
    LuaEngine engine;
    std::string error;
    ASSERT_TRUE(engine.loadString(
        "function format(source, options)\n"
        "  return options.line_length .. ':' .. (options.style or 'none') .. '\\n'\n"
        "end\n", "=inline", error)) << error;

    EngineOptions options;
    options.lineLength = 77;
    options.extra["style"] = "compact";
    EngineOutput out = engine.format("x\n", options, std::chrono::milliseconds(1000));
    ASSERT_TRUE(out.isOk()) << out.message;
    EXPECT_EQ(out.text, "77:compact\n");
}

TEST(LuaEngineTest, ScriptWithoutFormatFunctionIsRejected) {
    LuaEngine engine;
    std::string error;
    EXPECT_FALSE(engine.loadString("x = 1", "=noformat", error));
    EXPECT_NE(error.find("does not define"), std::string::npos) << error;
    EXPECT_FALSE(engine.isLoaded());

    EXPECT_FALSE(engine.loadString("function format(", "=broken", error));
    EXPECT_FALSE(error.empty());
}

TEST(LuaEngineTest, MissingScriptFile) {
    LuaEngine engine;
    std::string error;
    EXPECT_FALSE(engine.loadFile("/nonexistent/engine.lua", error));
    EXPECT_NE(error.find("/nonexistent/engine.lua"), std::string::npos);
}

TEST(LuaEngineTest, UnloadedEngineFails) {
    LuaEngine engine;
    EngineOutput out = engine.format("x\n", EngineOptions(), std::chrono::milliseconds(100));
    EXPECT_EQ(out.status, EngineOutput::Status::EngineError);
}

TEST(LuaEngineTest, RaisedErrorIsEngineError) {
    LuaEngine engine;
    std::string error;
    ASSERT_TRUE(engine.loadString("function format(s, o) error('kaboom') end", "=raiser", error));
    EngineOutput out = engine.format("x\n", EngineOptions(), std::chrono::milliseconds(1000));
    EXPECT_EQ(out.status, EngineOutput::Status::EngineError);
    EXPECT_NE(out.message.find("kaboom"), std::string::npos) << out.message;
}

TEST(LuaEngineTest, WrongReturnTypeIsEngineError) {
    LuaEngine engine;
    std::string error;
    ASSERT_TRUE(engine.loadString("function format(s, o) return 42 end", "=number", error));
    EngineOutput out = engine.format("x\n", EngineOptions(), std::chrono::milliseconds(1000));
    EXPECT_EQ(out.status, EngineOutput::Status::EngineError);
}

TEST(LuaEngineTest, RunawayScriptTimesOut) {
    LuaEngine engine;
    std::string error;
    ASSERT_TRUE(engine.loadString("function format(s, o) while true do end end", "=spin", error));

    auto start = std::chrono::steady_clock::now();
    EngineOutput out = engine.format("x\n", EngineOptions(), std::chrono::milliseconds(100));
    EXPECT_EQ(out.status, EngineOutput::Status::EngineError);
    EXPECT_EQ(out.message, "timed out after 100 ms");
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
