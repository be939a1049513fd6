//
// rpyfmt_dispatcher.h
// rpyfmt - Format Dispatcher
//
// Hands every extracted region to the formatting engine on its own and
// collects one FormatResult per region. Regions are independent: a failure
// in one is recorded in its slot and never stops the others.
//

#ifndef RPYFMT_DISPATCHER_H
#define RPYFMT_DISPATCHER_H

#include "rpyfmt_errors.h"
#include "rpyfmt_options.h"
#include "rpyfmt_segments.h"
#include "../runtime/FormatEngine.h"
#include <string>
#include <variant>
#include <vector>

namespace RpyFmt {

class WorkerPool;

// =============================================================================
// Format Results
// =============================================================================

struct FormattedText {
    std::string text;       // Dedented engine output, ends with one "\n"
};

struct FormatFailure {
    ErrorKind kind;         // SyntaxError or EngineError
    std::string message;
    size_t lineIndex;       // Document position (0-based)
    size_t column;

    FormatFailure()
        : kind(ErrorKind::EngineError), lineIndex(0), column(0) {}

    FormatFailure(ErrorKind k, const std::string& msg, size_t line, size_t col)
        : kind(k), message(msg), lineIndex(line), column(col) {}
};

using FormatResult = std::variant<FormattedText, FormatFailure>;

inline bool isFormatted(const FormatResult& result) {
    return std::holds_alternative<FormattedText>(result);
}

// =============================================================================
// Dispatcher
// =============================================================================

class FormatDispatcher {
public:
    // pool may be null: regions are then formatted on the calling thread
    FormatDispatcher(const FormatEngine& engine, WorkerPool* pool, const FormatOptions& options);

    /// One result per region, in region order
    std::vector<FormatResult> dispatch(const std::vector<EmbeddedRegion>& regions) const;

    /// Format a single region; never throws
    FormatResult dispatchOne(const EmbeddedRegion& region) const;

    /// Engine options for a region: line length narrowed by its indentation
    EngineOptions engineOptionsFor(const EmbeddedRegion& region) const;

    /// Strip trailing whitespace outside strings, drop trailing blank lines,
    /// and end with exactly one "\n". Returns "" for output with no code.
    static std::string cleanFormattedText(const std::string& text);

    /// Map an engine syntax-error position back to document coordinates
    static FormatFailure translateSyntaxError(const EmbeddedRegion& region,
                                              const EngineOutput& output);

private:
    const FormatEngine& m_engine;
    WorkerPool* m_pool;
    FormatOptions m_options;
};

} // namespace RpyFmt

#endif // RPYFMT_DISPATCHER_H
