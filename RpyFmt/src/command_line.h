//
// command_line.h
// rpyfmt - Command-Line Options
//

#ifndef RPYFMT_COMMAND_LINE_H
#define RPYFMT_COMMAND_LINE_H

#include "rpyfmt_log.h"
#include "rpyfmt_options.h"
#include <string>
#include <vector>

namespace RpyFmt {

struct CommandLineOptions {
    FormatOptions format;
    std::vector<std::string> inputs;    // Files, directories, or "-" for stdin

    bool check;                 // Report files that would change, write nothing
    bool toStdout;              // Print results instead of rewriting files
    bool strict;                // Any failed region makes the run fail

    std::string engineCommand;  // External formatter command template
    std::string luaScript;      // Lua formatter script (overrides engineCommand)

    std::string cachePath;      // Empty: default location
    bool useCache;

    LogLevel logLevel;

    CommandLineOptions()
        : check(false)
        , toStdout(false)
        , strict(false)
        , useCache(true)
        , logLevel(LogLevel::Normal)
    {}
};

enum class ParseOutcome {
    Run,
    Help,
    Version,
    Error
};

/// Parse argv into options. On Error, error holds the message.
ParseOutcome parseCommandLine(int argc, const char* const* argv,
                              CommandLineOptions& options, std::string& error);

/// Engine command to use: --engine, then $RPYFMT_ENGINE, then black
std::string resolveEngineCommand(const CommandLineOptions& options);

/// Expand the inputs into a sorted file list (directories give every *.rpy
/// below them). Inputs that do not exist are added to missing.
std::vector<std::string> collectInputFiles(const std::vector<std::string>& inputs,
                                           std::vector<std::string>& missing);

void printUsage(const char* programName);

} // namespace RpyFmt

#endif // RPYFMT_COMMAND_LINE_H
