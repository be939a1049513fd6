//
// rpyfmt_options.h
// rpyfmt - Formatter Options
//
// Options that control region extraction, dispatch to the formatting
// engine, and the command-line run. Engine options are opaque to the core:
// they are handed to the engine untouched apart from the line length, which
// is narrowed per region to leave room for the region's indentation.
//

#ifndef RPYFMT_OPTIONS_H
#define RPYFMT_OPTIONS_H

#include <map>
#include <string>
#include <sstream>

namespace RpyFmt {

// =============================================================================
// Tab Policy
// =============================================================================

enum class TabPolicy {
    Reject,     // Mixed tab/space indentation that cannot be compared is an error
    Expand      // Compare indentation by column width using tabWidth
};

// =============================================================================
// Engine Options
// =============================================================================

struct EngineOptions {
    int lineLength = 88;
    std::map<std::string, std::string> extra;   // Passed through verbatim (-o KEY=VALUE)
};

// =============================================================================
// Format Options
// =============================================================================

struct FormatOptions {
    // Line length handed to the engine for python blocks.
    // The region's indentation width is subtracted before dispatch.
    int lineLength = 88;

    // Line length for single-line `$` statements. Large by default so the
    // engine never wraps a one-line statement onto several lines.
    int inlineLineLength = 1000;

    // Smallest line length ever passed to the engine, however deep the region.
    int minimumLineLength = 20;

    // Opaque style flags for the engine
    std::map<std::string, std::string> engineFlags;

    // Indentation handling
    TabPolicy tabPolicy = TabPolicy::Reject;
    int tabWidth = 8;

    // Per-region engine timeout in milliseconds
    int timeoutMs = 10000;

    // Worker threads used for dispatch (0 = hardware concurrency)
    int jobs = 0;

    FormatOptions() = default;

    static FormatOptions Default() {
        return FormatOptions();
    }

    // Tolerate tab-indented scripts, treating a tab as `width` columns
    static FormatOptions ExpandTabs(int width = 8) {
        FormatOptions opts;
        opts.tabPolicy = TabPolicy::Expand;
        opts.tabWidth = width;
        return opts;
    }

    // Single-threaded dispatch (useful for tests and for debugging engines)
    static FormatOptions Sequential() {
        FormatOptions opts;
        opts.jobs = 1;
        return opts;
    }

    /// Stable description of everything that influences formatted output.
    /// Used as part of the format cache key.
    std::string fingerprint() const {
        std::ostringstream oss;
        oss << "ll=" << lineLength
            << ";ill=" << inlineLineLength
            << ";min=" << minimumLineLength
            << ";tabs=" << (tabPolicy == TabPolicy::Reject ? "reject" : "expand")
            << ";tw=" << tabWidth;
        for (const auto& flag : engineFlags) {
            oss << ";" << flag.first << "=" << flag.second;
        }
        return oss.str();
    }
};

} // namespace RpyFmt

#endif // RPYFMT_OPTIONS_H
