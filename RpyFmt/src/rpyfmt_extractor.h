//
// rpyfmt_extractor.h
// rpyfmt - Region Extractor
//
// Walks a document line by line, asks the BlockRecognizer about each line,
// and cuts every python region out into a normalized, dedented unit that an
// external formatter can parse on its own. Everything else stays host text.
//

#ifndef RPYFMT_EXTRACTOR_H
#define RPYFMT_EXTRACTOR_H

#include "SourceDocument.h"
#include "rpyfmt_errors.h"
#include "rpyfmt_lexer.h"
#include "rpyfmt_options.h"
#include "rpyfmt_segments.h"
#include <string>

namespace RpyFmt {

class RegionExtractor {
public:
    explicit RegionExtractor(const FormatOptions& options, const std::string& filename = "");

    /// Partition the document into host text and python regions.
    /// Throws DocumentError (MalformedIntroducer, InconsistentIndentation).
    SegmentList extract(const SourceDocument& document) const;

    /// Extract the block whose header is on headerIndex. Returns false when
    /// the header has no body, leaving the header as plain host text.
    bool extractBlock(const SourceDocument& document, const Introducer& intro,
                      size_t headerIndex, EmbeddedRegion& region) const;

    /// Extract the statement after '$'. Returns false for an empty statement.
    bool extractInline(const SourceDocument& document, const Introducer& intro,
                       size_t lineIndex, EmbeddedRegion& region) const;

private:
    FormatOptions m_options;
    std::string m_filename;

    enum class IndentRelation {
        Deeper,         // Strictly inside the block
        NotDeeper,      // At or above the header
        Ambiguous       // Tabs and spaces that cannot be compared
    };

    IndentRelation compareIndent(const std::string& indent, const std::string& base) const;

    /// Common margin of the logical body lines; sets region.margin/marginWidth
    void computeMargin(EmbeddedRegion& region) const;

    /// Fill originalIndent/normalizedIndent of each body line
    void normalizeLines(EmbeddedRegion& region) const;

    DocumentError inconsistent(size_t lineIndex, size_t column, const std::string& message) const;
};

} // namespace RpyFmt

#endif // RPYFMT_EXTRACTOR_H
