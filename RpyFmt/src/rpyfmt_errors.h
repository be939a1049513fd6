//
// rpyfmt_errors.h
// rpyfmt - Error Taxonomy
//
// Document-scoped errors abort processing of one document and are thrown as
// DocumentError. Region-scoped errors (SyntaxError, EngineError) are values
// carried in a FormatResult and never abort anything.
//

#ifndef RPYFMT_ERRORS_H
#define RPYFMT_ERRORS_H

#include "SourceDocument.h"
#include <stdexcept>
#include <string>

namespace RpyFmt {

// =============================================================================
// Error Kinds
// =============================================================================

enum class ErrorKind {
    MalformedIntroducer,        // Looks like a python header but breaks its grammar
    InconsistentIndentation,    // Region cannot be dedented unambiguously
    SyntaxError,                // Engine could not parse the region
    EngineError,                // Engine crashed, timed out or produced bad output
    IOError,                    // Document could not be read or written
    InternalError               // Extraction broke its own invariants
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedIntroducer:     return "MalformedIntroducer";
        case ErrorKind::InconsistentIndentation: return "InconsistentIndentation";
        case ErrorKind::SyntaxError:             return "SyntaxError";
        case ErrorKind::EngineError:             return "EngineError";
        case ErrorKind::IOError:                 return "IOError";
        case ErrorKind::InternalError:           return "InternalError";
    }
    return "Unknown";
}

// =============================================================================
// Document Error
// =============================================================================

class DocumentError : public std::runtime_error {
public:
    ErrorKind kind;
    DocumentLocation location;

    DocumentError(ErrorKind k, const std::string& msg, const DocumentLocation& loc)
        : std::runtime_error(msg), kind(k), location(loc) {}

    std::string toString() const {
        return location.toString() + ": " + errorKindName(kind) + ": " + what();
    }
};

} // namespace RpyFmt

#endif // RPYFMT_ERRORS_H
