//
// rpyfmt_formatter_lib.cpp
// rpyfmt - Formatter Library Implementation
//
// Runs one document through scan, extract, dispatch and splice.
//

#include "rpyfmt_formatter_lib.h"
#include "rpyfmt_dispatcher.h"
#include "rpyfmt_extractor.h"
#include "rpyfmt_splicer.h"
#include "../runtime/FormatEngine.h"
#include "../runtime/WorkerPool.h"
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace RpyFmt {

const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Scanning:    return "Scanning";
        case PipelineState::Extracting:  return "Extracting";
        case PipelineState::Extracted:   return "Extracted";
        case PipelineState::Dispatching: return "Dispatching";
        case PipelineState::Dispatched:  return "Dispatched";
        case PipelineState::Splicing:    return "Splicing";
        case PipelineState::Done:        return "Done";
        case PipelineState::Aborted:     return "Aborted";
    }
    return "Unknown";
}

std::string Diagnostic::toString() const {
    std::ostringstream oss;
    if (!file.empty()) {
        oss << file << ":";
    }
    if (line > 0) {
        oss << line << ":" << column << ":";
    }
    if (oss.tellp() > 0) {
        oss << " ";
    }
    oss << errorKindName(kind) << ": " << message;
    return oss.str();
}

// =============================================================================
// Helpers
// =============================================================================

static void abortDocument(DocumentReport& report, const SourceDocument& document,
                          ErrorKind kind, const std::string& message,
                          size_t lineIndex, size_t column) {
    Diagnostic diagnostic(document.getFilename(), lineIndex + 1, column + 1, kind, message);

    report.success = false;
    report.state = PipelineState::Aborted;
    report.formatted_code = document.getText();
    report.changed = false;
    report.error_message = diagnostic.toString();
    report.diagnostics.push_back(diagnostic);
}

// Mechanical check of the document model before anything is dispatched
static void verifySegments(const SourceDocument& document, const SegmentList& segments) {
    std::string problem;
    if (!segments.verifyPartition(document.byteLength(), &problem)) {
        throw std::logic_error("segments do not partition the document: " + problem);
    }

    for (const auto& region : segments.getRegions()) {
        if (region.restoreOriginal(region.code) != document.slice(region.begin, region.end)) {
            throw std::logic_error("region at line " + std::to_string(region.firstLine + 1) +
                                   " does not restore to its original text");
        }
    }
}

// =============================================================================
// Public API Implementation
// =============================================================================

DocumentReport formatDocument(const SourceDocument& document,
                              const FormatEngine& engine,
                              const FormatOptions& options,
                              WorkerPool* pool) {
    DocumentReport report;
    report.state = PipelineState::Scanning;

    try {
        report.state = PipelineState::Extracting;
        RegionExtractor extractor(options, document.getFilename());
        SegmentList segments = extractor.extract(document);
        verifySegments(document, segments);

        report.state = PipelineState::Extracted;
        report.regions_found = static_cast<int>(segments.getRegionCount());

        report.state = PipelineState::Dispatching;
        FormatDispatcher dispatcher(engine, pool, options);
        std::vector<FormatResult> results = dispatcher.dispatch(segments.getRegions());
        report.state = PipelineState::Dispatched;

        for (const auto& result : results) {
            if (const FormatFailure* failure = std::get_if<FormatFailure>(&result)) {
                report.regions_failed++;
                report.diagnostics.emplace_back(document.getFilename(),
                                                failure->lineIndex + 1, failure->column + 1,
                                                failure->kind, failure->message);
            } else {
                report.regions_formatted++;
            }
        }

        report.state = PipelineState::Splicing;
        Splicer splicer(document);
        report.formatted_code = splicer.splice(segments, results);
        report.changed = report.formatted_code != document.getText();

        report.state = PipelineState::Done;
        report.success = true;

    } catch (const DocumentError& e) {
        abortDocument(report, document, e.kind, e.what(),
                      e.location.lineIndex, e.location.column);
    } catch (const std::exception& e) {
        abortDocument(report, document, ErrorKind::InternalError, e.what(), 0, 0);
    }

    return report;
}

DocumentReport formatDocumentText(const std::string& text,
                                  const FormatEngine& engine,
                                  const FormatOptions& options,
                                  WorkerPool* pool,
                                  const std::string& filename) {
    SourceDocument document(text, filename);
    return formatDocument(document, engine, options, pool);
}

// =============================================================================
// File Functions
// =============================================================================

bool writeDocumentFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    return !file.fail();
}

DocumentReport formatDocumentFile(const std::string& path,
                                  const FormatEngine& engine,
                                  const FormatOptions& options,
                                  WriteMode mode,
                                  WorkerPool* pool,
                                  std::ostream& out) {
    SourceDocument document;
    if (!document.loadFromFile(path)) {
        DocumentReport report;
        document.setFilename(path);
        abortDocument(report, document, ErrorKind::IOError, "cannot read file", 0, 0);
        report.diagnostics.back().line = 0;
        report.error_message = report.diagnostics.back().toString();
        return report;
    }

    DocumentReport report = formatDocument(document, engine, options, pool);

    switch (mode) {
        case WriteMode::Stdout:
            // Aborted documents print their original text
            out << report.formatted_code;
            break;

        case WriteMode::InPlace:
            if (report.success && report.changed &&
                !writeDocumentFile(path, report.formatted_code)) {
                Diagnostic diagnostic(path, 0, 0, ErrorKind::IOError, "cannot write file");
                report.success = false;
                report.error_message = diagnostic.toString();
                report.diagnostics.push_back(diagnostic);
            }
            break;

        case WriteMode::Check:
            break;
    }

    return report;
}

} // namespace RpyFmt
