//
// command_line.cpp
// rpyfmt - Command-Line Options Implementation
//

#include "command_line.h"
#include "../runtime/ProcessEngine.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <set>

namespace RpyFmt {

void printUsage(const char* programName) {
    std::cerr << "rpyfmt - Formats the python embedded in Ren'Py scripts\n\n";
    std::cerr << "Usage: " << programName << " [options] <file.rpy|directory|->...\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --line-length N     Line length for python blocks (default: 88)\n";
    std::cerr << "  --inline-line-length N  Line length for $ statements (default: 1000)\n";
    std::cerr << "  --check                 Report files that would change; write nothing\n";
    std::cerr << "  --stdout                Print results instead of rewriting files\n";
    std::cerr << "  --strict                Exit with status 1 if any region failed\n";
    std::cerr << "  -j, --jobs N            Worker threads (default: one per CPU)\n";
    std::cerr << "  --timeout MS            Per-region engine timeout (default: 10000)\n";
    std::cerr << "  -v, --verbose           Per-file progress and timing\n";
    std::cerr << "  -q, --quiet             Errors only\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "  --version               Show version\n";
    std::cerr << "\nEngine Options:\n";
    std::cerr << "  --engine CMD            Formatter command; {line_length} and {KEY} are\n";
    std::cerr << "                          substituted (default: $RPYFMT_ENGINE or\n";
    std::cerr << "                          \"" << ProcessEngine::defaultCommand() << "\")\n";
    std::cerr << "  --lua-engine FILE       Use a Lua formatter script instead\n";
    std::cerr << "  -o KEY=VALUE            Engine option, repeatable\n";
    std::cerr << "\nIndentation:\n";
    std::cerr << "  --tabs reject|expand    Tab handling in indentation (default: reject)\n";
    std::cerr << "  --tab-width N           Tab width for --tabs expand (default: 8)\n";
    std::cerr << "\nCache:\n";
    std::cerr << "  --cache FILE            Cache database (default: ~/.cache/rpyfmt/cache.db)\n";
    std::cerr << "  --no-cache              Do not skip files recorded as formatted\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << programName << " game/                      # Format every .rpy under game/\n";
    std::cerr << "  " << programName << " --check game/script.rpy    # Exit 1 if it would change\n";
    std::cerr << "  " << programName << " - < script.rpy             # Filter stdin to stdout\n";
    std::cerr << "  " << programName << " --engine 'ruff format --line-length {line_length} -' game/\n";
}

// =============================================================================
// Argument Helpers
// =============================================================================

static bool parsePositiveInt(const char* text, int& value) {
    if (!text || !*text) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || parsed <= 0 || parsed > 1000000) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

// Value of an option that takes an argument, or nullptr when missing
static const char* takeValue(int argc, const char* const* argv, int& i) {
    if (i + 1 < argc) {
        return argv[++i];
    }
    return nullptr;
}

ParseOutcome parseCommandLine(int argc, const char* const* argv,
                              CommandLineOptions& options, std::string& error) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            return ParseOutcome::Help;
        } else if (strcmp(arg, "--version") == 0) {
            return ParseOutcome::Version;
        } else if (strcmp(arg, "--check") == 0) {
            options.check = true;
        } else if (strcmp(arg, "--stdout") == 0) {
            options.toStdout = true;
        } else if (strcmp(arg, "--strict") == 0) {
            options.strict = true;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            options.logLevel = LogLevel::Verbose;
        } else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
            options.logLevel = LogLevel::Quiet;
        } else if (strcmp(arg, "--no-cache") == 0) {
            options.useCache = false;
        } else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--line-length") == 0) {
            if (!parsePositiveInt(takeValue(argc, argv, i), options.format.lineLength)) {
                error = std::string(arg) + " requires a positive number";
                return ParseOutcome::Error;
            }
        } else if (strcmp(arg, "--inline-line-length") == 0) {
            if (!parsePositiveInt(takeValue(argc, argv, i), options.format.inlineLineLength)) {
                error = "--inline-line-length requires a positive number";
                return ParseOutcome::Error;
            }
        } else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--jobs") == 0) {
            if (!parsePositiveInt(takeValue(argc, argv, i), options.format.jobs)) {
                error = std::string(arg) + " requires a positive number";
                return ParseOutcome::Error;
            }
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!parsePositiveInt(takeValue(argc, argv, i), options.format.timeoutMs)) {
                error = "--timeout requires a positive number of milliseconds";
                return ParseOutcome::Error;
            }
        } else if (strcmp(arg, "--tab-width") == 0) {
            if (!parsePositiveInt(takeValue(argc, argv, i), options.format.tabWidth)) {
                error = "--tab-width requires a positive number";
                return ParseOutcome::Error;
            }
        } else if (strcmp(arg, "--tabs") == 0) {
            const char* value = takeValue(argc, argv, i);
            if (value && strcmp(value, "reject") == 0) {
                options.format.tabPolicy = TabPolicy::Reject;
            } else if (value && strcmp(value, "expand") == 0) {
                options.format.tabPolicy = TabPolicy::Expand;
            } else {
                error = "--tabs requires 'reject' or 'expand'";
                return ParseOutcome::Error;
            }
        } else if (strcmp(arg, "--engine") == 0) {
            const char* value = takeValue(argc, argv, i);
            if (!value || !*value) {
                error = "--engine requires a command";
                return ParseOutcome::Error;
            }
            options.engineCommand = value;
        } else if (strcmp(arg, "--lua-engine") == 0) {
            const char* value = takeValue(argc, argv, i);
            if (!value || !*value) {
                error = "--lua-engine requires a script file";
                return ParseOutcome::Error;
            }
            options.luaScript = value;
        } else if (strcmp(arg, "--cache") == 0) {
            const char* value = takeValue(argc, argv, i);
            if (!value || !*value) {
                error = "--cache requires a database file";
                return ParseOutcome::Error;
            }
            options.cachePath = value;
        } else if (strcmp(arg, "-o") == 0) {
            const char* value = takeValue(argc, argv, i);
            const char* equals = value ? strchr(value, '=') : nullptr;
            if (!equals || equals == value) {
                error = "-o requires KEY=VALUE";
                return ParseOutcome::Error;
            }
            std::string key(value, static_cast<size_t>(equals - value));
            options.format.engineFlags[key] = equals + 1;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            error = std::string("Unknown option: ") + arg;
            return ParseOutcome::Error;
        } else {
            options.inputs.push_back(arg);
        }
    }

    if (options.inputs.empty()) {
        error = "No input files specified";
        return ParseOutcome::Error;
    }

    if (options.check && options.toStdout) {
        error = "--check and --stdout cannot be combined";
        return ParseOutcome::Error;
    }

    return ParseOutcome::Run;
}

std::string resolveEngineCommand(const CommandLineOptions& options) {
    if (!options.engineCommand.empty()) {
        return options.engineCommand;
    }
    const char* fromEnv = getenv("RPYFMT_ENGINE");
    if (fromEnv && *fromEnv) {
        return fromEnv;
    }
    return ProcessEngine::defaultCommand();
}

// =============================================================================
// Input Collection
// =============================================================================

std::vector<std::string> collectInputFiles(const std::vector<std::string>& inputs,
                                           std::vector<std::string>& missing) {
    namespace fs = std::filesystem;

    std::vector<std::string> files;
    std::set<std::string> seen;

    auto add = [&](const std::string& path) {
        if (seen.insert(path).second) {
            files.push_back(path);
        }
    };

    for (const auto& input : inputs) {
        if (input == "-") {
            add(input);
            continue;
        }

        std::error_code ec;
        if (fs::is_directory(input, ec)) {
            std::vector<std::string> found;
            fs::recursive_directory_iterator it(input, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                missing.push_back(input);
                continue;
            }
            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    break;
                }
                if (it->is_regular_file(ec) && it->path().extension() == ".rpy") {
                    found.push_back(it->path().string());
                }
            }
            std::sort(found.begin(), found.end());
            for (const auto& path : found) {
                add(path);
            }
        } else if (fs::exists(input, ec)) {
            add(input);
        } else {
            missing.push_back(input);
        }
    }

    return files;
}

} // namespace RpyFmt
