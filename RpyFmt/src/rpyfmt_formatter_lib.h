//
// rpyfmt_formatter_lib.h
// rpyfmt - Formatter Library Interface
//
// Library interface for formatting the python embedded in Ren'Py scripts.
// The command-line tool is a thin layer over these functions; editors and
// other tools can call them directly.
//

#ifndef RPYFMT_FORMATTER_LIB_H
#define RPYFMT_FORMATTER_LIB_H

#include "SourceDocument.h"
#include "rpyfmt_errors.h"
#include "rpyfmt_options.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace RpyFmt {

class FormatEngine;
class WorkerPool;

// =============================================================================
// Pipeline State
// =============================================================================

enum class PipelineState {
    Scanning,
    Extracting,
    Extracted,
    Dispatching,
    Dispatched,
    Splicing,
    Done,       // Finished; individual regions may still have failed
    Aborted     // Region boundaries could not be established
};

const char* pipelineStateName(PipelineState state);

// =============================================================================
// Diagnostics
// =============================================================================

struct Diagnostic {
    std::string file;
    size_t line;            // 1-based
    size_t column;          // 1-based
    ErrorKind kind;
    std::string message;

    Diagnostic()
        : line(0), column(0), kind(ErrorKind::EngineError) {}

    Diagnostic(const std::string& f, size_t ln, size_t col, ErrorKind k, const std::string& msg)
        : file(f), line(ln), column(col), kind(k), message(msg) {}

    /// "file:line:col: Kind: message"
    std::string toString() const;
};

// =============================================================================
// Document Report
// =============================================================================

struct DocumentReport {
    bool success;                          // Reached Done
    PipelineState state;                   // Last state reached
    std::string formatted_code;            // Output text (the input when aborted)
    std::string error_message;             // Abort reason
    bool changed;                          // formatted_code differs from the input
    int regions_found;
    int regions_formatted;
    int regions_failed;
    std::vector<Diagnostic> diagnostics;   // One per failed region, or the abort

    DocumentReport()
        : success(false)
        , state(PipelineState::Scanning)
        , changed(false)
        , regions_found(0)
        , regions_formatted(0)
        , regions_failed(0)
    {}

    bool hasFailures() const { return !diagnostics.empty(); }
};

// =============================================================================
// Main Formatter Functions
// =============================================================================

/// Format every python region of a document
/// @param document The parsed document (never modified)
/// @param engine Engine used for each region
/// @param options Extraction and dispatch options
/// @param pool Optional worker pool; regions are formatted sequentially without one
/// @return DocumentReport with the output text and diagnostics
DocumentReport formatDocument(const SourceDocument& document,
                              const FormatEngine& engine,
                              const FormatOptions& options = FormatOptions(),
                              WorkerPool* pool = nullptr);

/// Format script text (convenience wrapper around formatDocument)
DocumentReport formatDocumentText(const std::string& text,
                                  const FormatEngine& engine,
                                  const FormatOptions& options = FormatOptions(),
                                  WorkerPool* pool = nullptr,
                                  const std::string& filename = "");

// =============================================================================
// File Functions
// =============================================================================

enum class WriteMode {
    InPlace,    // Rewrite the file when it changed
    Stdout,     // Print the result, leave the file alone
    Check       // Only report whether the file would change
};

/// Read, format and (depending on mode) write one file.
/// Read and write failures are reported as IOError diagnostics.
DocumentReport formatDocumentFile(const std::string& path,
                                  const FormatEngine& engine,
                                  const FormatOptions& options,
                                  WriteMode mode,
                                  WorkerPool* pool,
                                  std::ostream& out);

/// Replace a file's content
/// @return True if successful
bool writeDocumentFile(const std::string& path, const std::string& content);

} // namespace RpyFmt

#endif // RPYFMT_FORMATTER_LIB_H
