//
// rpyfmt_lexer.h
// rpyfmt - Line Lexer and Block Recognizer
//
// The line lexer tracks the minimal lexical state needed to tell code from
// string literals and comments: open quotes (including triple-quoted strings
// that span lines), bracket depth, and backslash continuation. The block
// recognizer sits on top of it and classifies each physical line of a
// Ren'Py script as a python introducer or plain host text.
//

#ifndef RPYFMT_LEXER_H
#define RPYFMT_LEXER_H

#include "SourceDocument.h"
#include "rpyfmt_errors.h"
#include <string>
#include <cstddef>

namespace RpyFmt {

// =============================================================================
// Lexical State
// =============================================================================

enum class LexDialect {
    RenPy,      // Strings of any quote style may span lines; backquotes are strings
    Python      // Only triple-quoted strings (or escaped newlines) span lines
};

enum class LexMode {
    Code,
    String,         // Inside '...', "..." (or `...` for Ren'Py)
    TripleString    // Inside '''...''' or """..."""
};

struct LexicalState {
    LexMode mode;
    char quote;                  // Active quote character when in a string
    int bracketDepth;            // Open ( [ { outside strings
    bool backslashContinuation;  // Previous line ended with a backslash

    LexicalState()
        : mode(LexMode::Code), quote(0), bracketDepth(0), backslashContinuation(false) {}

    /// The next physical line continues the current logical line
    bool isContinuation() const {
        return mode != LexMode::Code || bracketDepth > 0 || backslashContinuation;
    }

    /// The next physical line starts inside a string literal
    bool isInsideString() const {
        return mode != LexMode::Code;
    }

    void reset() { *this = LexicalState(); }
};

// =============================================================================
// Line Lexer
// =============================================================================

class LineLexer {
public:
    explicit LineLexer(LexDialect dialect = LexDialect::RenPy);

    /// Advance the state across one physical line (terminator excluded)
    void scanLine(const std::string& text, size_t from = 0);

    const LexicalState& getState() const { return m_state; }
    bool isContinuation() const { return m_state.isContinuation(); }
    bool isInsideString() const { return m_state.isInsideString(); }

    void reset() { m_state.reset(); }

    /// Position of the first ':' at bracket depth zero that is outside
    /// strings and comments, scanning a single line from `from`.
    /// Returns std::string::npos when there is none.
    static size_t findBlockColon(const std::string& text, size_t from);

private:
    LexDialect m_dialect;
    LexicalState m_state;

    bool isQuote(char c) const;

    /// Consume one lexical unit at text[i], return the index after it
    size_t advance(const std::string& text, size_t i, bool& escapedNewline);
};

// =============================================================================
// Introducers
// =============================================================================

enum class IntroducerType {
    NotIntroducer,
    Inline,         // `$ statement`
    Block           // `python:` and friends
};

enum class RegionKind {
    InlineStatement,    // $ statement
    Block,              // python [hide] [in store]:
    InitBlock,          // init [priority] python [...]:
    EarlyBlock          // [init [priority]] python early [...]:
};

const char* regionKindName(RegionKind kind);

struct Introducer {
    IntroducerType type;
    RegionKind kind;
    std::string indent;         // Leading whitespace of the introducer line
    size_t markerColumn;        // Byte column of '$' or of the first header keyword
    size_t codeColumn;          // Inline only: first byte after '$'

    // Header modifiers (block introducers)
    bool init;                  // Header starts with `init`
    std::string initPriority;   // "-1", "+5", "" when absent
    bool hide;
    std::string storeName;      // `in <store>` name, "" when absent

    Introducer()
        : type(IntroducerType::NotIntroducer), kind(RegionKind::Block)
        , markerColumn(0), codeColumn(0), init(false), hide(false) {}

    bool isIntroducer() const { return type != IntroducerType::NotIntroducer; }
};

// =============================================================================
// Block Recognizer
// =============================================================================

class BlockRecognizer {
public:
    explicit BlockRecognizer(const std::string& filename = "");

    /// Classify one host line. Must be called for consecutive lines so that
    /// strings and brackets spanning lines are tracked.
    /// Throws DocumentError(MalformedIntroducer) for broken python headers.
    Introducer classify(const SourceLine& line, size_t lineIndex);

    /// Resume host lexing in plain code state (after a python block body)
    void reset() { m_lexer.reset(); }

    /// The next line continues a logical line started earlier
    bool inContinuation() const { return m_lexer.isContinuation(); }

private:
    LineLexer m_lexer;
    std::string m_filename;

    bool parseHeader(const std::string& text, size_t start, size_t lineIndex,
                     Introducer& out) const;

    DocumentError malformed(size_t lineIndex, size_t column, const std::string& message) const;
};

// =============================================================================
// Character helpers
// =============================================================================

inline bool isIndentChar(char c) {
    return c == ' ' || c == '\t';
}

inline bool isIdentifierStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || (c >= '0' && c <= '9');
}

/// Leading run of spaces and tabs
inline std::string leadingIndent(const std::string& text, size_t from = 0) {
    size_t pos = from;
    while (pos < text.size() && isIndentChar(text[pos])) {
        pos++;
    }
    return text.substr(from, pos - from);
}

} // namespace RpyFmt

#endif // RPYFMT_LEXER_H
