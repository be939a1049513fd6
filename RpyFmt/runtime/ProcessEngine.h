//
// ProcessEngine.h
// rpyfmt Runtime - External Formatter Process
//
// Runs an external python formatter (black, ruff format, ...) as a child
// process: the source goes in on stdin, formatted code comes back on stdout.
// The command is a template run through /bin/sh; {line_length} and any
// {key} given with -o key=value are substituted before it runs.
//

#ifndef RPYFMT_PROCESS_ENGINE_H
#define RPYFMT_PROCESS_ENGINE_H

#include "FormatEngine.h"
#include <string>

namespace RpyFmt {

class ProcessEngine : public FormatEngine {
public:
    explicit ProcessEngine(const std::string& commandTemplate = defaultCommand());

    EngineOutput format(const std::string& source,
                        const EngineOptions& options,
                        std::chrono::milliseconds timeout) const override;

    std::string getName() const override;

    const std::string& getCommandTemplate() const { return commandTemplate_; }

    // Command line with placeholders replaced
    std::string expandCommand(const EngineOptions& options) const;

    // "black -q --line-length {line_length} -"
    static std::string defaultCommand();

    // Recognize black's "Cannot parse: L:C: ..." and ruff's
    // "Failed to parse at L:C: ..." diagnostics
    static bool parseSyntaxError(const std::string& stderrText,
                                 int& line, int& column, std::string& message);

private:
    std::string commandTemplate_;
};

} // namespace RpyFmt

#endif // RPYFMT_PROCESS_ENGINE_H
