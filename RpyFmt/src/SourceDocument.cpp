//
//  SourceDocument.cpp
//  rpyfmt - Line-Indexed Source Document
//
//  Line scanning and line-ending detection.
//

#include "SourceDocument.h"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace RpyFmt {

// =============================================================================
// Line Endings
// =============================================================================

const char* lineEndingBytes(LineEnding ending) {
    switch (ending) {
        case LineEnding::CRLF: return "\r\n";
        case LineEnding::CR:   return "\r";
        case LineEnding::LF:   return "\n";
        case LineEnding::None: return "";
    }
    return "";
}

const char* lineEndingName(LineEnding ending) {
    switch (ending) {
        case LineEnding::CRLF: return "CRLF";
        case LineEnding::CR:   return "CR";
        case LineEnding::LF:   return "LF";
        case LineEnding::None: return "none";
    }
    return "none";
}

// =============================================================================
// SourceLine / DocumentLocation
// =============================================================================

bool SourceLine::isBlank() const {
    return text.find_first_not_of(" \t\f") == std::string::npos;
}

std::string DocumentLocation::toString() const {
    std::ostringstream oss;
    if (!filename.empty()) {
        oss << filename << ":";
    }
    oss << (lineIndex + 1) << ":" << (column + 1);
    return oss.str();
}

// =============================================================================
// SourceDocument - Construction
// =============================================================================

SourceDocument::SourceDocument()
    : m_lineEnding(LineEnding::None)
    , m_mixedLineEndings(false)
    , m_hasBOM(false)
{
}

SourceDocument::SourceDocument(const std::string& text, const std::string& filename)
    : SourceDocument()
{
    m_filename = filename;
    setText(text);
}

void SourceDocument::setText(const std::string& text) {
    m_text = text;
    scanLines();
}

bool SourceDocument::loadFromFile(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return false;
    }

    m_filename = filename;
    setText(content);
    return true;
}

// =============================================================================
// Access
// =============================================================================

const SourceLine& SourceDocument::getLineByIndex(size_t index) const {
    static const SourceLine empty;
    if (index >= m_lines.size()) {
        return empty;
    }
    return m_lines[index];
}

std::string SourceDocument::slice(size_t begin, size_t end) const {
    if (begin >= m_text.size() || end <= begin) {
        return std::string();
    }
    return m_text.substr(begin, std::min(end, m_text.size()) - begin);
}

size_t SourceDocument::lineIndexForOffset(size_t offset) const {
    if (m_lines.empty()) {
        return 0;
    }

    // First line whose end lies beyond offset
    auto it = std::upper_bound(m_lines.begin(), m_lines.end(), offset,
        [](size_t value, const SourceLine& line) { return value < line.endOffset(); });
    if (it == m_lines.end()) {
        return m_lines.size() - 1;
    }
    return static_cast<size_t>(it - m_lines.begin());
}

std::string SourceDocument::getPreferredEol() const {
    if (m_lineEnding == LineEnding::None) {
        return "\n";
    }
    return lineEndingBytes(m_lineEnding);
}

DocumentLocation SourceDocument::getLocation(size_t lineIndex, size_t column) const {
    return DocumentLocation(m_filename, lineIndex, column);
}

// =============================================================================
// Line Scanning
// =============================================================================

void SourceDocument::scanLines() {
    m_lines.clear();
    m_mixedLineEndings = false;
    m_lineEnding = LineEnding::None;
    m_hasBOM = m_text.size() >= 3 &&
               static_cast<unsigned char>(m_text[0]) == 0xEF &&
               static_cast<unsigned char>(m_text[1]) == 0xBB &&
               static_cast<unsigned char>(m_text[2]) == 0xBF;

    size_t countLF = 0;
    size_t countCRLF = 0;
    size_t countCR = 0;

    size_t lineStart = 0;
    size_t pos = 0;
    const size_t length = m_text.size();

    while (pos < length) {
        char c = m_text[pos];
        if (c != '\n' && c != '\r') {
            pos++;
            continue;
        }

        std::string eol;
        if (c == '\r' && pos + 1 < length && m_text[pos + 1] == '\n') {
            eol = "\r\n";
            countCRLF++;
        } else if (c == '\r') {
            eol = "\r";
            countCR++;
        } else {
            eol = "\n";
            countLF++;
        }

        m_lines.emplace_back(lineStart, m_text.substr(lineStart, pos - lineStart), eol);
        pos += eol.size();
        lineStart = pos;
    }

    // Unterminated last line
    if (lineStart < length) {
        m_lines.emplace_back(lineStart, m_text.substr(lineStart), std::string());
    }

    int styles = (countLF > 0) + (countCRLF > 0) + (countCR > 0);
    m_mixedLineEndings = styles > 1;

    if (countLF > 0 && countLF >= countCRLF && countLF >= countCR) {
        m_lineEnding = LineEnding::LF;
    } else if (countCRLF > 0 && countCRLF >= countCR) {
        m_lineEnding = LineEnding::CRLF;
    } else if (countCR > 0) {
        m_lineEnding = LineEnding::CR;
    }
}

} // namespace RpyFmt
