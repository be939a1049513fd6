//
//  SourceDocument.h
//  rpyfmt - Line-Indexed Source Document
//
//  Immutable view of a Ren'Py script split into physical lines. Every line
//  keeps its byte offset and its original line-ending bytes, so the exact
//  input can always be rebuilt from the lines.
//

#ifndef RPYFMT_SOURCE_DOCUMENT_H
#define RPYFMT_SOURCE_DOCUMENT_H

#include <string>
#include <vector>
#include <cstddef>
#include <utility>

namespace RpyFmt {

// =============================================================================
// LineEnding - Line terminator style
// =============================================================================

enum class LineEnding {
    None,       // Document has no line terminators at all
    LF,         // "\n"
    CRLF,       // "\r\n"
    CR          // "\r"
};

const char* lineEndingBytes(LineEnding ending);
const char* lineEndingName(LineEnding ending);

// =============================================================================
// SourceLine - One physical line
// =============================================================================

struct SourceLine {
    size_t offset;               // Byte offset of the first character
    std::string text;            // Content without the line terminator
    std::string eol;             // "\n", "\r\n", "\r" or "" (last line only)

    SourceLine()
        : offset(0) {}

    SourceLine(size_t off, std::string txt, std::string ending)
        : offset(off), text(std::move(txt)), eol(std::move(ending)) {}

    /// Byte offset one past the terminator
    size_t endOffset() const { return offset + text.size() + eol.size(); }

    /// Byte offset one past the content (terminator excluded)
    size_t contentEndOffset() const { return offset + text.size(); }

    bool isBlank() const;
};

// =============================================================================
// DocumentLocation - Position in source for error reporting
// =============================================================================

struct DocumentLocation {
    std::string filename;
    size_t lineIndex;           // 0-based line index
    size_t column;              // 0-based byte column

    DocumentLocation()
        : lineIndex(0), column(0) {}

    DocumentLocation(const std::string& file, size_t idx, size_t col)
        : filename(file), lineIndex(idx), column(col) {}

    /// "file:line:col" with 1-based line and column
    std::string toString() const;
};

// =============================================================================
// SourceDocument
// =============================================================================

class SourceDocument {
public:
    SourceDocument();
    explicit SourceDocument(const std::string& text, const std::string& filename = "");

    // =========================================================================
    // Loading
    // =========================================================================

    /// Replace the content and rescan lines
    void setText(const std::string& text);

    /// Load from file (binary, no newline translation)
    bool loadFromFile(const std::string& filename);

    // =========================================================================
    // Access
    // =========================================================================

    const std::string& getText() const { return m_text; }
    size_t byteLength() const { return m_text.size(); }
    bool isEmpty() const { return m_text.empty(); }

    const std::vector<SourceLine>& getLines() const { return m_lines; }
    size_t getLineCount() const { return m_lines.size(); }
    const SourceLine& getLineByIndex(size_t index) const;

    /// Bytes in [begin, end)
    std::string slice(size_t begin, size_t end) const;

    /// Index of the line containing byte offset (last line for offset == length)
    size_t lineIndexForOffset(size_t offset) const;

    // =========================================================================
    // Line Endings
    // =========================================================================

    /// Most frequent terminator; ties prefer LF, then CRLF, then CR
    LineEnding getLineEnding() const { return m_lineEnding; }

    /// More than one terminator style present
    bool hasMixedLineEndings() const { return m_mixedLineEndings; }

    /// Terminator to use for newly produced lines ("\n" when the document has none)
    std::string getPreferredEol() const;

    /// Leading UTF-8 byte-order mark
    bool hasByteOrderMark() const { return m_hasBOM; }

    // =========================================================================
    // Metadata
    // =========================================================================

    void setFilename(const std::string& filename) { m_filename = filename; }
    const std::string& getFilename() const { return m_filename; }

    DocumentLocation getLocation(size_t lineIndex, size_t column) const;

private:
    std::string m_text;
    std::vector<SourceLine> m_lines;
    std::string m_filename;
    LineEnding m_lineEnding;
    bool m_mixedLineEndings;
    bool m_hasBOM;

    /// Split m_text into lines and tally terminators
    void scanLines();
};

} // namespace RpyFmt

#endif // RPYFMT_SOURCE_DOCUMENT_H
