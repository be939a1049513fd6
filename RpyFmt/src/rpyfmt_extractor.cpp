//
// rpyfmt_extractor.cpp
// rpyfmt - Region Extractor Implementation
//

#include "rpyfmt_extractor.h"
#include <utility>

namespace RpyFmt {

RegionExtractor::RegionExtractor(const FormatOptions& options, const std::string& filename)
    : m_options(options)
    , m_filename(filename)
{
}

DocumentError RegionExtractor::inconsistent(size_t lineIndex, size_t column,
                                            const std::string& message) const {
    return DocumentError(ErrorKind::InconsistentIndentation, message,
                         DocumentLocation(m_filename, lineIndex, column));
}

// =============================================================================
// Document Walk
// =============================================================================

SegmentList RegionExtractor::extract(const SourceDocument& document) const {
    SegmentList segments;
    BlockRecognizer recognizer(m_filename);
    const auto& lines = document.getLines();

    size_t hostStart = 0;
    size_t i = 0;

    while (i < lines.size()) {
        Introducer intro = recognizer.classify(lines[i], i);

        if (intro.type == IntroducerType::Inline) {
            EmbeddedRegion region;
            if (extractInline(document, intro, i, region)) {
                segments.addHost(hostStart, region.begin);
                hostStart = region.end;
                segments.addRegion(std::move(region));
            }
            i++;
            continue;
        }

        if (intro.type == IntroducerType::Block) {
            EmbeddedRegion region;
            size_t next = i + 1;
            if (extractBlock(document, intro, i, region)) {
                next = region.lastLine() + 1;
                segments.addHost(hostStart, region.begin);
                hostStart = region.end;
                segments.addRegion(std::move(region));
            }
            recognizer.reset();
            i = next;
            continue;
        }

        i++;
    }

    segments.addHost(hostStart, document.byteLength());
    return segments;
}

// =============================================================================
// Inline Statements
// =============================================================================

bool RegionExtractor::extractInline(const SourceDocument& document, const Introducer& intro,
                                    size_t lineIndex, EmbeddedRegion& region) const {
    const SourceLine& line = document.getLineByIndex(lineIndex);
    const std::string& text = line.text;

    size_t start = intro.codeColumn;
    size_t first = text.find_first_not_of(" \t", start);
    if (first == std::string::npos) {
        return false;
    }
    size_t last = text.find_last_not_of(" \t\f") + 1;

    region.kind = RegionKind::InlineStatement;
    region.begin = line.offset + start;
    region.end = line.contentEndOffset();
    region.headerLine = lineIndex;
    region.firstLine = lineIndex;
    region.codeColumn = start;
    region.introducerIndent = intro.indent;
    region.leadingGap = text.substr(start, first - start);
    region.trailingSpace = text.substr(last);
    region.code = text.substr(first, last - first) + "\n";
    return true;
}

// =============================================================================
// Blocks
// =============================================================================

RegionExtractor::IndentRelation
RegionExtractor::compareIndent(const std::string& indent, const std::string& base) const {
    if (m_options.tabPolicy == TabPolicy::Expand) {
        int width = indentationWidth(indent, m_options.tabWidth);
        int baseWidth = indentationWidth(base, m_options.tabWidth);
        return width > baseWidth ? IndentRelation::Deeper : IndentRelation::NotDeeper;
    }

    if (indent.size() > base.size() && indent.compare(0, base.size(), base) == 0) {
        return IndentRelation::Deeper;
    }
    if (base.compare(0, indent.size(), indent) == 0) {
        return IndentRelation::NotDeeper;
    }
    return IndentRelation::Ambiguous;
}

bool RegionExtractor::extractBlock(const SourceDocument& document, const Introducer& intro,
                                   size_t headerIndex, EmbeddedRegion& region) const {
    const auto& lines = document.getLines();
    LineLexer python(LexDialect::Python);

    std::vector<RegionLine> body;
    size_t keep = 0;

    for (size_t j = headerIndex + 1; j < lines.size(); j++) {
        const SourceLine& line = lines[j];

        RegionLine rl;
        rl.lineIndex = j;
        rl.text = line.text;
        rl.eol = line.eol;
        rl.blank = line.isBlank();

        if (python.isInsideString()) {
            rl.continuation = ContinuationKind::String;
        } else if (python.isContinuation()) {
            rl.continuation = ContinuationKind::Bracket;
        }

        if (rl.continuation == ContinuationKind::None && !rl.blank) {
            IndentRelation relation = compareIndent(leadingIndent(line.text), intro.indent);
            if (relation == IndentRelation::Ambiguous) {
                throw inconsistent(j, 0,
                    "tabs and spaces make this line's depth relative to line " +
                    std::to_string(headerIndex + 1) + " ambiguous");
            }
            if (relation == IndentRelation::NotDeeper) {
                break;
            }
        }

        python.scanLine(line.text);
        body.push_back(rl);
        if (!rl.blank || rl.continuation == ContinuationKind::String) {
            keep = body.size();
        }
    }

    // Trailing blank lines belong to the host
    body.resize(keep);
    if (body.empty()) {
        return false;
    }

    region.kind = intro.kind;
    region.headerLine = headerIndex;
    region.firstLine = headerIndex + 1;
    region.codeColumn = 0;
    region.introducerIndent = intro.indent;
    region.lines = std::move(body);
    region.begin = lines[region.firstLine].offset;
    region.end = lines[region.lastLine()].endOffset();

    computeMargin(region);
    normalizeLines(region);

    region.code.clear();
    for (const auto& line : region.lines) {
        region.code += line.normalizedText();
        region.code += "\n";
    }
    return true;
}

void RegionExtractor::computeMargin(EmbeddedRegion& region) const {
    bool found = false;
    std::string margin;
    int marginWidth = 0;

    for (const auto& line : region.lines) {
        if (line.blank || line.continuation != ContinuationKind::None) {
            continue;
        }
        std::string indent = leadingIndent(line.text);

        if (!found) {
            margin = indent;
            marginWidth = indentationWidth(indent, m_options.tabWidth);
            found = true;
            continue;
        }

        if (m_options.tabPolicy == TabPolicy::Expand) {
            int width = indentationWidth(indent, m_options.tabWidth);
            if (width < marginWidth) {
                margin = indent;
                marginWidth = width;
            }
            continue;
        }

        if (indent.compare(0, margin.size(), margin) == 0) {
            continue;
        }
        if (margin.compare(0, indent.size(), indent) == 0) {
            margin = indent;
            continue;
        }
        throw inconsistent(line.lineIndex, 0,
                           "tabs and spaces mix inconsistently in python block indentation");
    }

    region.margin = margin;
    region.marginWidth = m_options.tabPolicy == TabPolicy::Expand
        ? marginWidth
        : indentationWidth(margin, m_options.tabWidth);
}

void RegionExtractor::normalizeLines(EmbeddedRegion& region) const {
    const std::string& margin = region.margin;
    const bool expand = m_options.tabPolicy == TabPolicy::Expand;

    for (auto& line : region.lines) {
        line.originalIndent.clear();
        line.normalizedIndent.clear();
        line.indentDelta = 0;

        if (line.continuation == ContinuationKind::String) {
            // String contents: only an exact margin prefix may be removed
            if (line.text.compare(0, margin.size(), margin) == 0) {
                line.originalIndent = margin;
            } else if (!line.text.empty()) {
                throw inconsistent(line.lineIndex, 0,
                    "multi-line string continues at a shallower indentation than its block");
            }
            continue;
        }

        if (line.blank) {
            continue;
        }

        std::string indent = leadingIndent(line.text);
        int width = indentationWidth(indent, m_options.tabWidth);

        if (expand) {
            if (width >= region.marginWidth) {
                line.originalIndent = indent;
                line.normalizedIndent = std::string(width - region.marginWidth, ' ');
                line.indentDelta = width - region.marginWidth;
            }
        } else if (indent.compare(0, margin.size(), margin) == 0) {
            line.originalIndent = margin;
            line.indentDelta = width - region.marginWidth;
        }
        // Bracket continuations left of the margin are kept as they are
    }
}

} // namespace RpyFmt
