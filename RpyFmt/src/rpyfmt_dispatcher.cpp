//
// rpyfmt_dispatcher.cpp
// rpyfmt - Format Dispatcher Implementation
//

#include "rpyfmt_dispatcher.h"
#include "rpyfmt_lexer.h"
#include "../runtime/WorkerPool.h"
#include <algorithm>
#include <exception>

namespace RpyFmt {

FormatDispatcher::FormatDispatcher(const FormatEngine& engine, WorkerPool* pool,
                                   const FormatOptions& options)
    : m_engine(engine)
    , m_pool(pool)
    , m_options(options)
{
}

// =============================================================================
// Dispatch
// =============================================================================

std::vector<FormatResult> FormatDispatcher::dispatch(const std::vector<EmbeddedRegion>& regions) const {
    std::vector<FormatResult> results(regions.size());

    if (!m_pool || regions.size() <= 1) {
        for (size_t i = 0; i < regions.size(); i++) {
            results[i] = dispatchOne(regions[i]);
        }
        return results;
    }

    // Each task writes only its own slot
    TaskGroup group(*m_pool);
    for (size_t i = 0; i < regions.size(); i++) {
        group.run([this, &regions, &results, i]() {
            results[i] = dispatchOne(regions[i]);
        });
    }
    group.wait();

    return results;
}

EngineOptions FormatDispatcher::engineOptionsFor(const EmbeddedRegion& region) const {
    EngineOptions options;
    options.extra = m_options.engineFlags;

    int available = region.isInline() ? m_options.inlineLineLength : m_options.lineLength;
    available -= region.indentWidth(m_options.tabWidth);
    options.lineLength = std::max(available, m_options.minimumLineLength);
    return options;
}

FormatResult FormatDispatcher::dispatchOne(const EmbeddedRegion& region) const {
    const size_t failureColumn = region.isInline() ? region.codeColumn : 0;

    EngineOutput output;
    try {
        output = m_engine.format(region.code, engineOptionsFor(region),
                                 std::chrono::milliseconds(m_options.timeoutMs));
    } catch (const std::exception& e) {
        return FormatFailure(ErrorKind::EngineError,
                             m_engine.getName() + " failed: " + e.what(),
                             region.firstLine, failureColumn);
    }

    switch (output.status) {
        case EngineOutput::Status::SyntaxError:
            return translateSyntaxError(region, output);

        case EngineOutput::Status::EngineError:
            return FormatFailure(ErrorKind::EngineError,
                                 m_engine.getName() + ": " + output.message,
                                 region.firstLine, failureColumn);

        case EngineOutput::Status::Ok:
            break;
    }

    if (output.text.find('\0') != std::string::npos) {
        return FormatFailure(ErrorKind::EngineError,
                             m_engine.getName() + " produced binary output",
                             region.firstLine, failureColumn);
    }

    std::string cleaned = cleanFormattedText(output.text);
    if (cleaned.empty()) {
        return FormatFailure(ErrorKind::EngineError,
                             m_engine.getName() + " produced no output",
                             region.firstLine, failureColumn);
    }

    if (region.isInline() && cleaned.find('\n') != cleaned.size() - 1) {
        return FormatFailure(ErrorKind::EngineError,
                             "inline statement expands to multiple lines",
                             region.firstLine, failureColumn);
    }

    return FormattedText{cleaned};
}

// =============================================================================
// Output Cleaning
// =============================================================================

std::string FormatDispatcher::cleanFormattedText(const std::string& text) {
    std::string unified;
    unified.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\r') {
            unified += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                i++;
            }
        } else {
            unified += text[i];
        }
    }

    std::vector<std::string> lines = splitNewlines(unified);
    LineLexer lexer(LexDialect::Python);

    for (auto& line : lines) {
        lexer.scanLine(line);
        // Whitespace before a newline inside a string is part of the string
        if (!lexer.isInsideString()) {
            size_t end = line.find_last_not_of(" \t\f");
            line.erase(end == std::string::npos ? 0 : end + 1);
        }
    }

    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::string result;
    for (const auto& line : lines) {
        result += line;
        result += "\n";
    }
    return result;
}

// =============================================================================
// Error Positions
// =============================================================================

FormatFailure FormatDispatcher::translateSyntaxError(const EmbeddedRegion& region,
                                                     const EngineOutput& output) {
    std::string message = output.message.empty() ? "cannot parse" : output.message;
    size_t engineColumn = output.column > 0 ? static_cast<size_t>(output.column - 1) : 0;

    if (region.isInline()) {
        size_t column = region.codeColumn + region.leadingGap.size();
        if (output.line <= 1) {
            column += engineColumn;
        }
        return FormatFailure(ErrorKind::SyntaxError, message, region.firstLine, column);
    }

    if (output.line <= 0 || region.lines.empty()) {
        return FormatFailure(ErrorKind::SyntaxError, message, region.firstLine, 0);
    }

    size_t index = std::min(static_cast<size_t>(output.line - 1), region.lines.size() - 1);
    const RegionLine& line = region.lines[index];

    size_t column = engineColumn;
    if (column >= line.normalizedIndent.size()) {
        column = column - line.normalizedIndent.size() + line.originalIndent.size();
    } else {
        column = std::min(column, line.originalIndent.size());
    }

    return FormatFailure(ErrorKind::SyntaxError, message, line.lineIndex, column);
}

} // namespace RpyFmt
