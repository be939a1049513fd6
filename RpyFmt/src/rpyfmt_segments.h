//
// rpyfmt_segments.h
// rpyfmt - Document Model
//
// A document is partitioned into an ordered list of byte spans, each either
// host text (copied through untouched) or an embedded python region. The
// spans have no gaps and no overlap, so concatenating them rebuilds the
// original document exactly.
//

#ifndef RPYFMT_SEGMENTS_H
#define RPYFMT_SEGMENTS_H

#include "rpyfmt_lexer.h"
#include "SourceDocument.h"
#include <string>
#include <vector>
#include <cstddef>

namespace RpyFmt {

// =============================================================================
// Region Lines
// =============================================================================

enum class ContinuationKind {
    None,       // Starts a logical line
    String,     // Starts inside a string literal opened on an earlier line
    Bracket     // Starts inside open brackets or after a backslash
};

// One physical line of a block region and how it was normalized.
// The normalized line is normalizedIndent + text.substr(originalIndent.size()).
struct RegionLine {
    size_t lineIndex;               // Document line index
    std::string text;               // Original content (no terminator)
    std::string eol;                // Original terminator
    std::string originalIndent;     // Prefix removed from text
    std::string normalizedIndent;   // Prefix put in its place
    int indentDelta;                // Columns deeper than the margin
    bool blank;
    ContinuationKind continuation;

    RegionLine()
        : lineIndex(0), indentDelta(0), blank(false), continuation(ContinuationKind::None) {}

    std::string normalizedText() const {
        if (blank && continuation != ContinuationKind::String) {
            return std::string();
        }
        return normalizedIndent + text.substr(originalIndent.size());
    }
};

// =============================================================================
// Embedded Region
// =============================================================================

struct EmbeddedRegion {
    size_t index;                   // Position in document order
    RegionKind kind;
    size_t begin;                   // Byte span [begin, end) in the document
    size_t end;
    size_t headerLine;              // Line of the introducer
    size_t firstLine;               // First line of the region text
    size_t codeColumn;              // Byte column where the region starts on firstLine

    std::string introducerIndent;   // Whitespace before '$' or the header keyword
    std::string margin;             // Block body whitespace stripped and restored
    int marginWidth;                // Column width of margin

    // Inline statements only
    std::string leadingGap;         // Whitespace between '$' and the code
    std::string trailingSpace;      // Whitespace after the code

    std::string code;               // Normalized code, ends with exactly one "\n"
    std::vector<RegionLine> lines;  // Block regions only

    EmbeddedRegion()
        : index(0), kind(RegionKind::Block), begin(0), end(0)
        , headerLine(0), firstLine(0), codeColumn(0), marginWidth(0) {}

    bool isInline() const { return kind == RegionKind::InlineStatement; }

    size_t lastLine() const {
        return lines.empty() ? firstLine : lines.back().lineIndex;
    }

    /// The region's last original line carried a line terminator
    bool endsWithLineEnding() const;

    /// Invert the normalization. Applied to `code` this returns the exact
    /// original bytes of the region.
    std::string restoreOriginal(const std::string& normalized) const;

    /// Width of the indentation the engine output will be shifted by
    int indentWidth(int tabWidth) const;
};

// =============================================================================
// Segments
// =============================================================================

enum class SegmentType {
    Host,
    Embedded
};

struct Segment {
    SegmentType type;
    size_t begin;
    size_t end;
    size_t regionIndex;     // Embedded only

    Segment(SegmentType t, size_t b, size_t e, size_t region = 0)
        : type(t), begin(b), end(e), regionIndex(region) {}

    size_t length() const { return end - begin; }
};

class SegmentList {
public:
    SegmentList() = default;

    /// Append host text; empty spans are dropped
    void addHost(size_t begin, size_t end);

    /// Append an embedded region, assigning its index. Returns the index.
    size_t addRegion(EmbeddedRegion region);

    const std::vector<Segment>& getSegments() const { return m_segments; }
    const std::vector<EmbeddedRegion>& getRegions() const { return m_regions; }
    size_t getRegionCount() const { return m_regions.size(); }
    const EmbeddedRegion& getRegion(size_t index) const { return m_regions.at(index); }

    /// Spans are contiguous from 0 to documentLength with no overlap.
    /// On failure `problem` (when given) describes the first violation.
    bool verifyPartition(size_t documentLength, std::string* problem = nullptr) const;

    /// Rebuild the document from the original bytes of every segment
    std::string concatenate(const SourceDocument& document) const;

    void clear();

private:
    std::vector<Segment> m_segments;
    std::vector<EmbeddedRegion> m_regions;
};

/// Column width of a run of spaces and tabs
int indentationWidth(const std::string& indent, int tabWidth);

/// Split text on "\n" into lines without terminators. A trailing "\n" does
/// not produce an extra empty line.
std::vector<std::string> splitNewlines(const std::string& text);

} // namespace RpyFmt

#endif // RPYFMT_SEGMENTS_H
