//
// rpyfmt_splicer.h
// rpyfmt - Splicer
//
// Rebuilds the document from its segments: host text and failed regions are
// copied byte for byte, formatted regions are re-indented to their original
// margin and written with the document's own line endings.
//

#ifndef RPYFMT_SPLICER_H
#define RPYFMT_SPLICER_H

#include "SourceDocument.h"
#include "rpyfmt_dispatcher.h"
#include "rpyfmt_segments.h"
#include <string>
#include <vector>

namespace RpyFmt {

class Splicer {
public:
    explicit Splicer(const SourceDocument& document);

    /// Assemble the output text. results must hold one entry per region.
    std::string splice(const SegmentList& segments,
                       const std::vector<FormatResult>& results) const;

    /// Formatted region text as it appears in the output
    std::string reindent(const EmbeddedRegion& region, const std::string& formatted) const;

private:
    const SourceDocument& m_document;
    std::string m_eol;
};

} // namespace RpyFmt

#endif // RPYFMT_SPLICER_H
