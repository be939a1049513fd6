#include <gtest/gtest.h>
#include "../RpyFmt/src/rpyfmt_extractor.h"
#include <string>
#include <vector>

using namespace RpyFmt;

class ExtractorTest : public ::testing::Test {
protected:
    SegmentList extract(const std::string& text,
                        const FormatOptions& options = FormatOptions()) {
        document.setText(text);
        document.setFilename("test.rpy");
        RegionExtractor extractor(options, "test.rpy");
        return extractor.extract(document);
    }

    // Partition and per-region restore must both hold
    void expectRoundTrip(const SegmentList& segments) {
        std::string problem;
        EXPECT_TRUE(segments.verifyPartition(document.byteLength(), &problem)) << problem;
        EXPECT_EQ(segments.concatenate(document), document.getText());
        for (const auto& region : segments.getRegions()) {
            EXPECT_EQ(region.restoreOriginal(region.code),
                      document.slice(region.begin, region.end))
                << "region " << region.index << " at line " << region.firstLine + 1;
        }
    }

    SourceDocument document;
};

// =============================================================================
// Block Extent
// =============================================================================

TEST_F(ExtractorTest, BlockBodyAndTrailingBlankLines) {
    const std::string text =
        "label start:\n"
        "    python:\n"
        "        x=1\n"
        "\n"
        "        if x:\n"
        "            y =2\n"
        "\n"
        "    e \"Done\"\n";
    SegmentList segments = extract(text);

    ASSERT_EQ(segments.getRegionCount(), 1u);
    const EmbeddedRegion& region = segments.getRegion(0);
    EXPECT_EQ(region.kind, RegionKind::Block);
    EXPECT_EQ(region.headerLine, 1u);
    EXPECT_EQ(region.firstLine, 2u);
    EXPECT_EQ(region.lastLine(), 5u) << "trailing blank line goes back to the host";
    EXPECT_EQ(region.introducerIndent, "    ");
    EXPECT_EQ(region.margin, "        ");
    EXPECT_EQ(region.marginWidth, 8);
    EXPECT_EQ(region.code, "x=1\n\nif x:\n    y =2\n");
    EXPECT_TRUE(region.endsWithLineEnding());

    EXPECT_EQ(region.begin, document.getLineByIndex(2).offset);
    EXPECT_EQ(region.end, document.getLineByIndex(5).endOffset());

    ASSERT_EQ(segments.getSegments().size(), 3u);
    EXPECT_EQ(segments.getSegments()[0].type, SegmentType::Host);
    EXPECT_EQ(segments.getSegments()[1].type, SegmentType::Embedded);
    EXPECT_EQ(segments.getSegments()[2].type, SegmentType::Host);
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, BlockEndsAtEndOfDocument) {
    SegmentList segments = extract("init -1 python:\n    x=1");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    const EmbeddedRegion& region = segments.getRegion(0);
    EXPECT_EQ(region.kind, RegionKind::InitBlock);
    EXPECT_FALSE(region.endsWithLineEnding());
    EXPECT_EQ(region.end, document.byteLength());
    EXPECT_EQ(region.code, "x=1\n");
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, HeaderWithoutBodyStaysHost) {
    SegmentList segments = extract("python:\n\n\nlabel start:\n    return\n");
    EXPECT_EQ(segments.getRegionCount(), 0u);
    ASSERT_EQ(segments.getSegments().size(), 1u);
    expectRoundTrip(segments);

    SegmentList atEnd = extract("python:");
    EXPECT_EQ(atEnd.getRegionCount(), 0u);
}

TEST_F(ExtractorTest, DollarInsideBlockIsPartOfTheBlock) {
    SegmentList segments = extract(
        "python:\n"
        "    x = \"$ y\"\n"
        "    $ = 1\n"
        "$ z = 2\n");
    ASSERT_EQ(segments.getRegionCount(), 2u);
    EXPECT_EQ(segments.getRegion(0).kind, RegionKind::Block);
    EXPECT_EQ(segments.getRegion(0).lastLine(), 2u);
    EXPECT_EQ(segments.getRegion(1).kind, RegionKind::InlineStatement);
    EXPECT_EQ(segments.getRegion(1).firstLine, 3u);
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, SeveralRegionsInDocumentOrder) {
    SegmentList segments = extract(
        "init python:\n"
        "    a=1\n"
        "python early:\n"
        "    b=2\n"
        "label start:\n"
        "    $ c=3\n"
        "    python hide:\n"
        "        d=4\n"
        "    return\n");
    ASSERT_EQ(segments.getRegionCount(), 4u);
    EXPECT_EQ(segments.getRegion(0).kind, RegionKind::InitBlock);
    EXPECT_EQ(segments.getRegion(1).kind, RegionKind::EarlyBlock);
    EXPECT_EQ(segments.getRegion(2).kind, RegionKind::InlineStatement);
    EXPECT_EQ(segments.getRegion(3).kind, RegionKind::Block);
    for (size_t i = 0; i < segments.getRegionCount(); i++) {
        EXPECT_EQ(segments.getRegion(i).index, i);
    }
    expectRoundTrip(segments);
}

// =============================================================================
// Inline Statements
// =============================================================================

TEST_F(ExtractorTest, InlineRegionIsRestOfLine) {
    SegmentList segments = extract("label a:\n    $ renpy.pause( 1 )  \n    \"Next\"\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    const EmbeddedRegion& region = segments.getRegion(0);

    EXPECT_TRUE(region.isInline());
    EXPECT_EQ(region.codeColumn, 5u);
    EXPECT_EQ(region.leadingGap, " ");
    EXPECT_EQ(region.trailingSpace, "  ");
    EXPECT_EQ(region.code, "renpy.pause( 1 )\n");
    EXPECT_EQ(region.begin, document.getLineByIndex(1).offset + 5);
    EXPECT_EQ(region.end, document.getLineByIndex(1).contentEndOffset())
        << "line ending stays host text";
    EXPECT_FALSE(region.endsWithLineEnding());
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, InlineNeverPullsInDeeperLines) {
    SegmentList segments = extract("$ a = 1\n    b = 2\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    EXPECT_EQ(segments.getRegion(0).code, "a = 1\n");
    EXPECT_EQ(segments.getRegion(0).lastLine(), 0u);
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, InlineWithoutSpaceAfterDollar) {
    SegmentList segments = extract("$x=1\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    EXPECT_EQ(segments.getRegion(0).leadingGap, "");
    EXPECT_EQ(segments.getRegion(0).code, "x=1\n");
    expectRoundTrip(segments);
}

// =============================================================================
// Dedent
// =============================================================================

TEST_F(ExtractorTest, MultiLineStringKeepsItsContent) {
    SegmentList segments = extract(
        "python:\n"
        "    text = \"\"\"\n"
        "    Line one\n"
        "\n"
        "      Line two\n"
        "    \"\"\"\n"
        "    z=3\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    const EmbeddedRegion& region = segments.getRegion(0);
    EXPECT_EQ(region.code, "text = \"\"\"\nLine one\n\n  Line two\n\"\"\"\nz=3\n");
    EXPECT_EQ(region.lines[1].continuation, ContinuationKind::String);
    EXPECT_EQ(region.lines[0].continuation, ContinuationKind::None);
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, StringShallowerThanMarginIsInconsistent) {
    const std::string text =
        "python:\n"
        "    text = \"\"\"\n"
        "Line one\n"
        "    \"\"\"\n";
    try {
        extract(text);
        FAIL() << "expected InconsistentIndentation";
    } catch (const DocumentError& e) {
        EXPECT_EQ(e.kind, ErrorKind::InconsistentIndentation);
        EXPECT_EQ(e.location.lineIndex, 2u);
    }
}

TEST_F(ExtractorTest, ClosingQuotesLeftOfMarginAreInconsistent) {
    const std::string text =
        "python:\n"
        "    x = '''\n"
        "'''\n";
    EXPECT_THROW(extract(text), DocumentError);
}

TEST_F(ExtractorTest, BracketContinuationLeftOfMarginIsKept) {
    SegmentList segments = extract(
        "python:\n"
        "    foo(1,\n"
        "  2)\n"
        "    bar()\n"
        "label next:\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    const EmbeddedRegion& region = segments.getRegion(0);
    EXPECT_EQ(region.code, "foo(1,\n  2)\nbar()\n");
    EXPECT_EQ(region.lines[1].continuation, ContinuationKind::Bracket);
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, WhitespaceOnlyBlankLinesRestore) {
    SegmentList segments = extract("python:\n    a=1\n      \n    b=2\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    EXPECT_EQ(segments.getRegion(0).code, "a=1\n\nb=2\n");
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, CrlfDocument) {
    SegmentList segments = extract("python:\r\n    x=1\r\n    y=2\r\nlabel a:\r\n");
    ASSERT_EQ(segments.getRegionCount(), 1u);
    EXPECT_EQ(segments.getRegion(0).code, "x=1\ny=2\n");
    expectRoundTrip(segments);
}

// =============================================================================
// Tabs
// =============================================================================

TEST_F(ExtractorTest, MixedTabsAndSpacesRejectedByDefault) {
    const std::string text =
        "python:\n"
        "\tx = 1\n"
        "        y = 2\n";
    try {
        extract(text);
        FAIL() << "expected InconsistentIndentation";
    } catch (const DocumentError& e) {
        EXPECT_EQ(e.kind, ErrorKind::InconsistentIndentation);
        EXPECT_EQ(e.location.lineIndex, 2u);
    }
}

TEST_F(ExtractorTest, MixedTabsAndSpacesExpanded) {
    const std::string text =
        "python:\n"
        "\tx = 1\n"
        "        y = 2\n"
        "\t    z = 3\n";
    SegmentList segments = extract(text, FormatOptions::ExpandTabs(8));
    ASSERT_EQ(segments.getRegionCount(), 1u);
    const EmbeddedRegion& region = segments.getRegion(0);
    EXPECT_EQ(region.marginWidth, 8);
    EXPECT_EQ(region.code, "x = 1\ny = 2\n    z = 3\n");
    expectRoundTrip(segments);
}

TEST_F(ExtractorTest, AmbiguousDepthAgainstHeader) {
    const std::string text =
        "  python:\n"
        "\tx = 1\n";
    EXPECT_THROW(extract(text), DocumentError);
}

TEST_F(ExtractorTest, MalformedHeaderAbortsExtraction) {
    try {
        extract("label a:\n    python foo:\n        x = 1\n");
        FAIL() << "expected MalformedIntroducer";
    } catch (const DocumentError& e) {
        EXPECT_EQ(e.kind, ErrorKind::MalformedIntroducer);
        EXPECT_EQ(e.location.lineIndex, 1u);
        EXPECT_EQ(e.toString(), "test.rpy:2:12: MalformedIntroducer: unexpected 'foo' in python block header");
    }
}

TEST_F(ExtractorTest, DocumentWithoutPython) {
    const std::string text = "label start:\n    e \"Hello.\"\n    return\n";
    SegmentList segments = extract(text);
    EXPECT_EQ(segments.getRegionCount(), 0u);
    expectRoundTrip(segments);
}

// =============================================================================
// Segment List
// =============================================================================

TEST(SegmentListTest, HostSpansMergeAndEmptySpansDrop) {
    SegmentList list;
    list.addHost(0, 5);
    list.addHost(5, 9);
    list.addHost(9, 9);
    ASSERT_EQ(list.getSegments().size(), 1u);
    EXPECT_EQ(list.getSegments()[0].length(), 9u);
    EXPECT_TRUE(list.verifyPartition(9));
}

TEST(SegmentListTest, VerifyPartitionReportsGapsAndShortCoverage) {
    SegmentList gap;
    gap.addHost(0, 4);
    EmbeddedRegion region;
    region.begin = 6;
    region.end = 8;
    gap.addRegion(region);

    std::string problem;
    EXPECT_FALSE(gap.verifyPartition(8, &problem));
    EXPECT_NE(problem.find("starts at byte 6"), std::string::npos) << problem;

    SegmentList shortList;
    shortList.addHost(0, 4);
    EXPECT_FALSE(shortList.verifyPartition(10, &problem));
    EXPECT_NE(problem.find("4 of 10"), std::string::npos) << problem;
}

TEST(SegmentListTest, IndentationWidthAndSplit) {
    EXPECT_EQ(indentationWidth("    ", 8), 4);
    EXPECT_EQ(indentationWidth("\t", 8), 8);
    EXPECT_EQ(indentationWidth("  \t", 8), 8);
    EXPECT_EQ(indentationWidth("\t  ", 4), 6);

    std::vector<std::string> parts = splitNewlines("a\n\nb\n");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(splitNewlines("a").size(), 1u);
    EXPECT_TRUE(splitNewlines("").empty());
}
