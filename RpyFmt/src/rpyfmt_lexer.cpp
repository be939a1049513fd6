//
// rpyfmt_lexer.cpp
// rpyfmt - Line Lexer and Block Recognizer Implementation
//

#include "rpyfmt_lexer.h"
#include <cctype>

namespace RpyFmt {

const char* regionKindName(RegionKind kind) {
    switch (kind) {
        case RegionKind::InlineStatement: return "inline-statement";
        case RegionKind::Block:           return "block";
        case RegionKind::InitBlock:       return "init-block";
        case RegionKind::EarlyBlock:      return "early-block";
    }
    return "block";
}

// =============================================================================
// LineLexer
// =============================================================================

LineLexer::LineLexer(LexDialect dialect)
    : m_dialect(dialect)
{
}

bool LineLexer::isQuote(char c) const {
    if (c == '"' || c == '\'') {
        return true;
    }
    return c == '`' && m_dialect == LexDialect::RenPy;
}

size_t LineLexer::advance(const std::string& text, size_t i, bool& escapedNewline) {
    const size_t n = text.size();
    char c = text[i];

    switch (m_state.mode) {
        case LexMode::Code:
            if (c == '#') {
                // Comment runs to end of line
                return n;
            }
            if (isQuote(c)) {
                m_state.quote = c;
                if (i + 2 < n && text[i + 1] == c && text[i + 2] == c) {
                    m_state.mode = LexMode::TripleString;
                    return i + 3;
                }
                m_state.mode = LexMode::String;
                return i + 1;
            }
            if (c == '(' || c == '[' || c == '{') {
                m_state.bracketDepth++;
            } else if (c == ')' || c == ']' || c == '}') {
                if (m_state.bracketDepth > 0) {
                    m_state.bracketDepth--;
                }
            } else if (c == '\\' && i + 1 == n) {
                m_state.backslashContinuation = true;
            }
            return i + 1;

        case LexMode::String:
            if (c == '\\') {
                if (i + 1 == n) {
                    escapedNewline = true;
                }
                return i + 2;
            }
            if (c == m_state.quote) {
                m_state.mode = LexMode::Code;
                m_state.quote = 0;
            }
            return i + 1;

        case LexMode::TripleString:
            if (c == '\\') {
                return i + 2;
            }
            if (c == m_state.quote && i + 2 < n &&
                text[i + 1] == c && text[i + 2] == c) {
                m_state.mode = LexMode::Code;
                m_state.quote = 0;
                return i + 3;
            }
            return i + 1;
    }
    return i + 1;
}

void LineLexer::scanLine(const std::string& text, size_t from) {
    bool escapedNewline = false;
    m_state.backslashContinuation = false;

    size_t i = from;
    while (i < text.size()) {
        i = advance(text, i, escapedNewline);
    }

    // A python single-quoted string cannot cross a newline unless escaped
    if (m_dialect == LexDialect::Python && m_state.mode == LexMode::String && !escapedNewline) {
        m_state.mode = LexMode::Code;
        m_state.quote = 0;
    }
}

size_t LineLexer::findBlockColon(const std::string& text, size_t from) {
    LineLexer lexer(LexDialect::RenPy);
    bool escapedNewline = false;

    size_t i = from;
    while (i < text.size()) {
        if (lexer.m_state.mode == LexMode::Code) {
            if (text[i] == '#') {
                return std::string::npos;
            }
            if (text[i] == ':' && lexer.m_state.bracketDepth == 0) {
                return i;
            }
        }
        i = lexer.advance(text, i, escapedNewline);
    }
    return std::string::npos;
}

// =============================================================================
// BlockRecognizer
// =============================================================================

namespace {

bool startsWithBOM(const std::string& text) {
    return text.size() >= 3 &&
           static_cast<unsigned char>(text[0]) == 0xEF &&
           static_cast<unsigned char>(text[1]) == 0xBB &&
           static_cast<unsigned char>(text[2]) == 0xBF;
}

size_t skipIndent(const std::string& text, size_t pos) {
    while (pos < text.size() && isIndentChar(text[pos])) {
        pos++;
    }
    return pos;
}

std::string readWord(const std::string& text, size_t pos) {
    if (pos >= text.size() || !isIdentifierStart(text[pos])) {
        return std::string();
    }
    size_t end = pos + 1;
    while (end < text.size() && isIdentifierChar(text[end])) {
        end++;
    }
    return text.substr(pos, end - pos);
}

} // namespace

BlockRecognizer::BlockRecognizer(const std::string& filename)
    : m_lexer(LexDialect::RenPy)
    , m_filename(filename)
{
}

DocumentError BlockRecognizer::malformed(size_t lineIndex, size_t column,
                                         const std::string& message) const {
    return DocumentError(ErrorKind::MalformedIntroducer, message,
                         DocumentLocation(m_filename, lineIndex, column));
}

Introducer BlockRecognizer::classify(const SourceLine& line, size_t lineIndex) {
    Introducer result;
    const std::string& text = line.text;

    if (m_lexer.isContinuation()) {
        m_lexer.scanLine(text);
        return result;
    }

    size_t start = 0;
    if (lineIndex == 0 && startsWithBOM(text)) {
        start = 3;
    }

    std::string indent = leadingIndent(text, start);
    size_t pos = start + indent.size();

    if (pos < text.size() && text[pos] == '$') {
        size_t code = pos + 1;
        if (skipIndent(text, code) < text.size()) {
            result.type = IntroducerType::Inline;
            result.kind = RegionKind::InlineStatement;
            result.indent = indent;
            result.markerColumn = pos;
            result.codeColumn = code;
        }
    } else if (pos < text.size() && isIdentifierStart(text[pos])) {
        if (parseHeader(text, pos, lineIndex, result)) {
            result.indent = indent;
        }
    }

    m_lexer.scanLine(text, start);
    return result;
}

bool BlockRecognizer::parseHeader(const std::string& text, size_t start, size_t lineIndex,
                                  Introducer& out) const {
    const size_t n = text.size();
    size_t pos = start;
    bool isInit = false;
    std::string priority;

    std::string word = readWord(text, pos);

    if (word == "init") {
        size_t after = pos + word.size();
        if (after >= n || !isIndentChar(text[after])) {
            // `init:` opens a Ren'Py init block, not python
            return false;
        }
        pos = skipIndent(text, after);

        size_t p = pos;
        if (p < n && (text[p] == '-' || text[p] == '+')) {
            p++;
        }
        size_t digits = p;
        while (p < n && std::isdigit(static_cast<unsigned char>(text[p]))) {
            p++;
        }
        if (p > digits) {
            if (p < n && !isIndentChar(text[p])) {
                return false;
            }
            priority = text.substr(pos, p - pos);
            pos = skipIndent(text, p);
        } else if (p != pos) {
            return false;
        }

        word = readWord(text, pos);
        if (word != "python") {
            return false;
        }
        isInit = true;
    } else if (word != "python") {
        return false;
    }

    size_t colon = LineLexer::findBlockColon(text, pos);
    if (colon == std::string::npos) {
        // Not a header at all, e.g. a character named python speaking
        return false;
    }

    size_t after = pos + word.size();
    if (after < colon && !isIndentChar(text[after])) {
        throw malformed(lineIndex, after,
                        "unexpected '" + std::string(1, text[after]) + "' after 'python'");
    }

    bool early = false;
    bool hide = false;
    std::string store;

    size_t p = skipIndent(text, after);
    while (p < colon) {
        std::string token = readWord(text, p);

        if (token == "early" && !early && !hide && store.empty()) {
            early = true;
        } else if (token == "hide" && !hide && store.empty()) {
            hide = true;
        } else if (token == "in" && store.empty()) {
            size_t q = skipIndent(text, p + token.size());
            size_t nameStart = q;
            while (q < colon) {
                std::string part = readWord(text, q);
                if (part.empty()) {
                    break;
                }
                q += part.size();
                if (q < colon && text[q] == '.') {
                    q++;
                    continue;
                }
                break;
            }
            if (q == nameStart || text[q - 1] == '.') {
                throw malformed(lineIndex, q, "expected a store name after 'in'");
            }
            store = text.substr(nameStart, q - nameStart);
            token = text.substr(p, q - p);
        } else {
            std::string shown = token.empty() ? std::string(1, text[p]) : token;
            throw malformed(lineIndex, p,
                            "unexpected '" + shown + "' in python block header");
        }

        p += token.size();
        if (p < colon && !isIndentChar(text[p])) {
            throw malformed(lineIndex, p,
                            "unexpected '" + std::string(1, text[p]) + "' in python block header");
        }
        p = skipIndent(text, p);
    }

    size_t rest = skipIndent(text, colon + 1);
    if (rest < n && text[rest] != '#') {
        throw malformed(lineIndex, rest, "unexpected content after ':' in python block header");
    }

    out.type = IntroducerType::Block;
    // `init python early:` still runs at parse time, before any init code
    if (early) {
        out.kind = RegionKind::EarlyBlock;
    } else if (isInit) {
        out.kind = RegionKind::InitBlock;
    } else {
        out.kind = RegionKind::Block;
    }
    out.markerColumn = start;
    out.init = isInit;
    out.initPriority = priority;
    out.hide = hide;
    out.storeName = store;
    return true;
}

} // namespace RpyFmt
