//
// rpyfmt_splicer.cpp
// rpyfmt - Splicer Implementation
//

#include "rpyfmt_splicer.h"
#include <stdexcept>

namespace RpyFmt {

Splicer::Splicer(const SourceDocument& document)
    : m_document(document)
    , m_eol(document.getPreferredEol())
{
}

std::string Splicer::reindent(const EmbeddedRegion& region, const std::string& formatted) const {
    std::vector<std::string> lines = splitNewlines(formatted);

    if (region.isInline()) {
        // "$" keeps its statement on the same line, one space away
        return lines.empty() ? std::string() : " " + lines.front();
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (!lines[i].empty()) {
            out += region.margin;
            out += lines[i];
        }
        if (i + 1 < lines.size() || region.endsWithLineEnding()) {
            out += m_eol;
        }
    }
    return out;
}

std::string Splicer::splice(const SegmentList& segments,
                            const std::vector<FormatResult>& results) const {
    if (results.size() != segments.getRegionCount()) {
        throw std::invalid_argument("splice needs one format result per region");
    }

    std::string out;
    out.reserve(m_document.byteLength() + m_document.byteLength() / 8);

    for (const auto& segment : segments.getSegments()) {
        if (segment.type == SegmentType::Host) {
            out += m_document.slice(segment.begin, segment.end);
            continue;
        }

        const FormatResult& result = results[segment.regionIndex];
        if (const FormattedText* formatted = std::get_if<FormattedText>(&result)) {
            out += reindent(segments.getRegion(segment.regionIndex), formatted->text);
        } else {
            // Failed regions pass through untouched
            out += m_document.slice(segment.begin, segment.end);
        }
    }

    return out;
}

} // namespace RpyFmt
