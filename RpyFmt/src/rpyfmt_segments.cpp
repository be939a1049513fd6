//
// rpyfmt_segments.cpp
// rpyfmt - Document Model Implementation
//

#include "rpyfmt_segments.h"
#include <sstream>
#include <utility>

namespace RpyFmt {

// =============================================================================
// Helpers
// =============================================================================

int indentationWidth(const std::string& indent, int tabWidth) {
    int width = 0;
    for (char c : indent) {
        if (c == '\t') {
            int step = tabWidth > 0 ? tabWidth : 1;
            width = (width / step + 1) * step;
        } else {
            width++;
        }
    }
    return width;
}

std::vector<std::string> splitNewlines(const std::string& text) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            result.push_back(text.substr(start));
            break;
        }
        result.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return result;
}

// =============================================================================
// EmbeddedRegion
// =============================================================================

bool EmbeddedRegion::endsWithLineEnding() const {
    if (isInline() || lines.empty()) {
        return false;
    }
    return !lines.back().eol.empty();
}

std::string EmbeddedRegion::restoreOriginal(const std::string& normalized) const {
    if (isInline()) {
        std::string body = normalized;
        if (!body.empty() && body.back() == '\n') {
            body.pop_back();
        }
        return leadingGap + body + trailingSpace;
    }

    std::vector<std::string> parts = splitNewlines(normalized);
    std::string out;

    for (size_t i = 0; i < lines.size(); i++) {
        const RegionLine& line = lines[i];
        const std::string part = i < parts.size() ? parts[i] : std::string();

        if (line.blank && line.continuation != ContinuationKind::String) {
            out += line.text;
        } else if (part.compare(0, line.normalizedIndent.size(), line.normalizedIndent) == 0) {
            out += line.originalIndent;
            out += part.substr(line.normalizedIndent.size());
        } else {
            out += part;
        }
        out += line.eol;
    }

    return out;
}

int EmbeddedRegion::indentWidth(int tabWidth) const {
    if (isInline()) {
        // "$ " precedes the statement
        return indentationWidth(introducerIndent, tabWidth) + 2;
    }
    return marginWidth;
}

// =============================================================================
// SegmentList
// =============================================================================

void SegmentList::addHost(size_t begin, size_t end) {
    if (end <= begin) {
        return;
    }
    // Merge with a preceding host span
    if (!m_segments.empty() && m_segments.back().type == SegmentType::Host &&
        m_segments.back().end == begin) {
        m_segments.back().end = end;
        return;
    }
    m_segments.emplace_back(SegmentType::Host, begin, end);
}

size_t SegmentList::addRegion(EmbeddedRegion region) {
    size_t index = m_regions.size();
    region.index = index;
    m_segments.emplace_back(SegmentType::Embedded, region.begin, region.end, index);
    m_regions.push_back(std::move(region));
    return index;
}

bool SegmentList::verifyPartition(size_t documentLength, std::string* problem) const {
    size_t expected = 0;

    for (size_t i = 0; i < m_segments.size(); i++) {
        const Segment& seg = m_segments[i];
        std::ostringstream oss;

        if (seg.begin != expected) {
            oss << "segment " << i << " starts at byte " << seg.begin
                << ", expected " << expected;
        } else if (seg.end < seg.begin) {
            oss << "segment " << i << " ends before it starts";
        } else if (seg.type == SegmentType::Embedded) {
            if (seg.regionIndex >= m_regions.size()) {
                oss << "segment " << i << " refers to missing region " << seg.regionIndex;
            } else {
                const EmbeddedRegion& region = m_regions[seg.regionIndex];
                if (region.begin != seg.begin || region.end != seg.end) {
                    oss << "segment " << i << " does not match the span of region "
                        << seg.regionIndex;
                }
            }
        }

        if (!oss.str().empty()) {
            if (problem) {
                *problem = oss.str();
            }
            return false;
        }
        expected = seg.end;
    }

    if (expected != documentLength) {
        if (problem) {
            std::ostringstream oss;
            oss << "segments cover " << expected << " of " << documentLength << " bytes";
            *problem = oss.str();
        }
        return false;
    }
    return true;
}

std::string SegmentList::concatenate(const SourceDocument& document) const {
    std::string out;
    out.reserve(document.byteLength());
    for (const auto& seg : m_segments) {
        out += document.slice(seg.begin, seg.end);
    }
    return out;
}

void SegmentList::clear() {
    m_segments.clear();
    m_regions.clear();
}

} // namespace RpyFmt
