#include <gtest/gtest.h>
#include "test_helpers.h"
#include "../RpyFmt/src/rpyfmt_formatter_lib.h"
#include "../RpyFmt/runtime/WorkerPool.h"
#include <sstream>

using namespace RpyFmt;
using RpyFmtTest::FakeEngine;
using RpyFmtTest::TempFile;

class FormatterLibTest : public ::testing::Test {
protected:
    DocumentReport format(const std::string& text) {
        return formatDocumentText(text, engine, options, nullptr, "script.rpy");
    }

    FakeEngine engine;
    FormatOptions options;
};

// =============================================================================
// Core Properties
// =============================================================================

TEST_F(FormatterLibTest, DocumentWithoutRegionsIsUnchanged) {
    const std::string text =
        "define e = Character(\"Eileen\")\n"
        "label start:\r\n"
        "    e \"x=1 is not code here.\"   \n"
        "    return";
    DocumentReport report = format(text);

    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.state, PipelineState::Done);
    EXPECT_EQ(report.formatted_code, text);
    EXPECT_FALSE(report.changed);
    EXPECT_EQ(report.regions_found, 0);
    EXPECT_EQ(engine.getCallCount(), 0);
}

TEST_F(FormatterLibTest, ColumnZeroBlockScenario) {
    DocumentReport report = format("python:\n    x=1\n    y =2\n");

    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.formatted_code, "python:\n    x = 1\n    y = 2\n");
    EXPECT_TRUE(report.changed);
    EXPECT_EQ(report.regions_found, 1);
    EXPECT_EQ(report.regions_formatted, 1);
    EXPECT_EQ(report.regions_failed, 0);
    EXPECT_FALSE(report.hasFailures());
}

TEST_F(FormatterLibTest, IndentationIsPreserved) {
    DocumentReport report = format(
        "label start:\n"
        "    python:\n"
        "        x=1\n"
        "        if x:\n"
        "            y=2\n"
        "    \"Done.\"\n");

    EXPECT_EQ(report.formatted_code,
              "label start:\n"
              "    python:\n"
              "        x = 1\n"
              "        if x:\n"
              "            y = 2\n"
              "    \"Done.\"\n");
}

TEST_F(FormatterLibTest, SyntaxErrorPassesRegionThrough) {
    const std::string text =
        "label start:\n"
        "    python:\n"
        "        x = SYNTAX_ERROR\n"
        "    return\n";
    DocumentReport report = format(text);

    EXPECT_TRUE(report.success) << "a failed region does not abort the document";
    EXPECT_EQ(report.formatted_code, text);
    EXPECT_FALSE(report.changed);
    EXPECT_EQ(report.regions_failed, 1);
    ASSERT_EQ(report.diagnostics.size(), 1u);

    const Diagnostic& diagnostic = report.diagnostics[0];
    EXPECT_EQ(diagnostic.kind, ErrorKind::SyntaxError);
    EXPECT_EQ(diagnostic.file, "script.rpy");
    EXPECT_EQ(diagnostic.line, 3u);
    EXPECT_EQ(diagnostic.column, 13u);
    EXPECT_EQ(diagnostic.toString(), "script.rpy:3:13: SyntaxError: invalid syntax");
}

TEST_F(FormatterLibTest, RegionsAreIsolated) {
    DocumentReport report = format(
        "python:\n"
        "    bad=SYNTAX_ERROR\n"
        "label a:\n"
        "    $ good=1\n");

    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.regions_found, 2);
    EXPECT_EQ(report.regions_formatted, 1);
    EXPECT_EQ(report.regions_failed, 1);
    EXPECT_EQ(report.formatted_code,
              "python:\n"
              "    bad=SYNTAX_ERROR\n"
              "label a:\n"
              "    $ good = 1\n");
}

TEST_F(FormatterLibTest, FormattingIsIdempotent) {
    const std::string text =
        "init -2 python:\n"
        "    a=1\n"
        "\n"
        "    def f(x):\n"
        "        return x\n"
        "label start:\n"
        "    $b =2\n"
        "    python hide:\n"
        "        c= 3\n";
    DocumentReport first = format(text);
    ASSERT_TRUE(first.success);
    EXPECT_TRUE(first.changed);

    DocumentReport second = format(first.formatted_code);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.formatted_code, first.formatted_code);
    EXPECT_FALSE(second.changed);
}

TEST_F(FormatterLibTest, InlineAndBlockExtent) {
    DocumentReport report = format(
        "$ a=1\n"
        "    b=2\n"
        "python:\n"
        "    c=3\n"
        "d=4\n");

    EXPECT_EQ(report.regions_found, 2);
    EXPECT_EQ(report.formatted_code,
              "$ a = 1\n"
              "    b=2\n"
              "python:\n"
              "    c = 3\n"
              "d=4\n");
}

TEST_F(FormatterLibTest, InitEarlyBlockIsFormatted) {
    DocumentReport report = format("init python early:\n    x=1\nlabel start:\n    return\n");

    EXPECT_TRUE(report.success) << report.error_message;
    EXPECT_EQ(report.state, PipelineState::Done);
    EXPECT_EQ(report.regions_found, 1);
    EXPECT_EQ(report.formatted_code, "init python early:\n    x = 1\nlabel start:\n    return\n");
}

TEST_F(FormatterLibTest, CrlfAndMissingFinalNewline) {
    DocumentReport report = format("python:\r\n    x=1\r\n    y=2");
    EXPECT_EQ(report.formatted_code, "python:\r\n    x = 1\r\n    y = 2");
}

TEST_F(FormatterLibTest, ByteOrderMarkIsKept) {
    DocumentReport report = format("\xEF\xBB\xBFpython:\n    x=1\n");
    EXPECT_EQ(report.formatted_code, "\xEF\xBB\xBFpython:\n    x = 1\n");
}

TEST_F(FormatterLibTest, EmptyInlineIsLeftAlone) {
    DocumentReport report = format("label a:\n    $\n");
    EXPECT_EQ(report.regions_found, 0);
    EXPECT_EQ(report.formatted_code, "label a:\n    $\n");
}

// =============================================================================
// Aborted Documents
// =============================================================================

TEST_F(FormatterLibTest, MalformedHeaderAbortsDocument) {
    const std::string text = "$ x=1\npython foo:\n    y=2\n";
    DocumentReport report = format(text);

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.state, PipelineState::Aborted);
    EXPECT_EQ(report.formatted_code, text) << "aborted documents are never rewritten";
    EXPECT_FALSE(report.changed);
    EXPECT_EQ(engine.getCallCount(), 0) << "nothing is dispatched";
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0].kind, ErrorKind::MalformedIntroducer);
    EXPECT_EQ(report.diagnostics[0].line, 2u);
    EXPECT_EQ(report.diagnostics[0].column, 8u);
    EXPECT_EQ(report.error_message, report.diagnostics[0].toString());
}

TEST_F(FormatterLibTest, InconsistentIndentationAbortsDocument) {
    DocumentReport report = format("python:\n\tx=1\n        y=2\n");
    EXPECT_EQ(report.state, PipelineState::Aborted);
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0].kind, ErrorKind::InconsistentIndentation);

    options = FormatOptions::ExpandTabs(8);
    DocumentReport expanded = format("python:\n\tx=1\n        y=2\n");
    EXPECT_TRUE(expanded.success);
    EXPECT_EQ(expanded.formatted_code, "python:\n\tx = 1\n\ty = 2\n")
        << "output is indented with the margin's own characters";
}

TEST_F(FormatterLibTest, PipelineStateNames) {
    EXPECT_STREQ(pipelineStateName(PipelineState::Done), "Done");
    EXPECT_STREQ(pipelineStateName(PipelineState::Aborted), "Aborted");
    EXPECT_STREQ(pipelineStateName(PipelineState::Dispatching), "Dispatching");
}

// =============================================================================
// Worker Pool
// =============================================================================

TEST_F(FormatterLibTest, PoolGivesSameOutputAsSequential) {
    std::ostringstream text;
    text << "label start:\n";
    for (int i = 0; i < 12; i++) {
        text << "    $ a" << i << "=" << i << "\n";
        text << "    python:\n        b" << i << "=" << i << "\n";
    }

    DocumentReport sequential = format(text.str());

    WorkerPool pool(3);
    DocumentReport parallel = formatDocumentText(text.str(), engine, options, &pool, "script.rpy");

    EXPECT_EQ(parallel.regions_found, 24);
    EXPECT_EQ(parallel.formatted_code, sequential.formatted_code);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(FormatterLibTest, InPlaceRewritesChangedFile) {
    TempFile file;
    file.write("python:\n    x=1\n");

    std::ostringstream out;
    DocumentReport report = formatDocumentFile(file.path(), engine, options,
                                               WriteMode::InPlace, nullptr, out);
    EXPECT_TRUE(report.success);
    EXPECT_TRUE(report.changed);
    EXPECT_EQ(file.read(), "python:\n    x = 1\n");
    EXPECT_EQ(out.str(), "");
}

TEST_F(FormatterLibTest, CheckAndStdoutLeaveFileAlone) {
    TempFile file;
    file.write("$ x=1\n");

    std::ostringstream checkOut;
    DocumentReport check = formatDocumentFile(file.path(), engine, options,
                                              WriteMode::Check, nullptr, checkOut);
    EXPECT_TRUE(check.changed);
    EXPECT_EQ(checkOut.str(), "");
    EXPECT_EQ(file.read(), "$ x=1\n");

    std::ostringstream stdoutOut;
    formatDocumentFile(file.path(), engine, options, WriteMode::Stdout, nullptr, stdoutOut);
    EXPECT_EQ(stdoutOut.str(), "$ x = 1\n");
    EXPECT_EQ(file.read(), "$ x=1\n");
}

TEST_F(FormatterLibTest, UnreadableFileIsAnIOError) {
    std::ostringstream out;
    DocumentReport report = formatDocumentFile("/nonexistent/script.rpy", engine, options,
                                               WriteMode::InPlace, nullptr, out);
    EXPECT_FALSE(report.success);
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0].kind, ErrorKind::IOError);
    EXPECT_EQ(report.diagnostics[0].toString(),
              "/nonexistent/script.rpy: IOError: cannot read file");
}
