//
// rpyfmt - Ren'Py Python Formatter
// Formats the python blocks and $ statements of Ren'Py scripts with an
// external python formatter, leaving every other byte untouched
//

#include "command_line.h"
#include "format_cache.h"
#include "rpyfmt_formatter_lib.h"
#include "rpyfmt_log.h"
#include "../runtime/FormatEngine.h"
#include "../runtime/ProcessEngine.h"
#include "../runtime/WorkerPool.h"
#include "../runtime/lua_engine.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

using namespace RpyFmt;

static const char* RPYFMT_VERSION = "1.0.0";

// Totals for the final summary
struct RunTotals {
    int files = 0;
    int changed = 0;
    int unchanged = 0;
    int cached = 0;
    int aborted = 0;
    int regionFailures = 0;
    int ioErrors = 0;
};

static void reportDiagnostics(const DocumentReport& report) {
    for (const auto& diagnostic : report.diagnostics) {
        if (diagnostic.kind == ErrorKind::IOError) {
            Log::error(diagnostic.toString());
        } else {
            Log::warning(diagnostic.toString());
        }
    }
}

static void tally(RunTotals& totals, const DocumentReport& report) {
    totals.files++;
    totals.regionFailures += report.regions_failed;

    bool ioError = false;
    for (const auto& diagnostic : report.diagnostics) {
        if (diagnostic.kind == ErrorKind::IOError) {
            ioError = true;
        }
    }

    if (ioError) {
        totals.ioErrors++;
    } else if (report.state == PipelineState::Aborted) {
        totals.aborted++;
    } else if (report.changed) {
        totals.changed++;
    } else {
        totals.unchanged++;
    }
}

static bool readWholeFile(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return !file.bad();
}

static std::string plural(int count, const char* word) {
    std::ostringstream oss;
    oss << count << " " << word << (count == 1 ? "" : "s");
    return oss.str();
}

static void printSummary(const RunTotals& totals, bool check) {
    std::ostringstream oss;
    if (check) {
        oss << plural(totals.changed, "file") << " would be reformatted, "
            << plural(totals.unchanged + totals.cached, "file") << " would be left unchanged";
    } else {
        oss << plural(totals.changed, "file") << " reformatted, "
            << plural(totals.unchanged + totals.cached, "file") << " left unchanged";
    }
    if (totals.aborted > 0) {
        oss << ", " << plural(totals.aborted, "file") << " skipped on errors";
    }
    if (totals.regionFailures > 0) {
        oss << ", " << plural(totals.regionFailures, "region") << " not formatted";
    }
    if (totals.ioErrors > 0) {
        oss << ", " << plural(totals.ioErrors, "file") << " unreadable or unwritable";
    }
    oss << ".";
    Log::info(oss.str());
}

int main(int argc, char** argv) {
    CommandLineOptions options;
    std::string error;

    switch (parseCommandLine(argc, argv, options, error)) {
        case ParseOutcome::Help:
            printUsage(argv[0]);
            return 0;
        case ParseOutcome::Version:
            std::cout << "rpyfmt " << RPYFMT_VERSION << "\n";
            return 0;
        case ParseOutcome::Error:
            Log::error(error);
            printUsage(argv[0]);
            return 1;
        case ParseOutcome::Run:
            break;
    }

    Log::setLevel(options.logLevel);

    // Engine
    std::unique_ptr<FormatEngine> engine;
    std::string engineIdentity;
    if (!options.luaScript.empty()) {
        auto luaEngine = std::make_unique<LuaEngine>();
        if (!luaEngine->loadFile(options.luaScript, error)) {
            Log::error(error);
            return 1;
        }
        engineIdentity = "lua:" + options.luaScript;
        engine = std::move(luaEngine);
    } else {
        std::string command = resolveEngineCommand(options);
        engineIdentity = command;
        engine = std::make_unique<ProcessEngine>(command);
    }
    Log::verbose("Engine: " + engineIdentity);

    // Inputs
    std::vector<std::string> missing;
    std::vector<std::string> files = collectInputFiles(options.inputs, missing);
    for (const auto& path : missing) {
        Log::error("No such file or directory: " + path);
    }

    // Cache (never consulted when printing to stdout: output is always needed)
    FormatCache cache;
    bool cacheEnabled = options.useCache && !options.toStdout;
    if (cacheEnabled) {
        std::string path = options.cachePath.empty() ? FormatCache::getDefaultDatabasePath()
                                                     : options.cachePath;
        if (!cache.open(path)) {
            Log::warning("Cache disabled: " + cache.getLastError());
            cacheEnabled = false;
        } else {
            Log::verbose("Cache: " + path);
        }
    }
    const std::string fingerprint = options.format.fingerprint() + ";engine=" + engineIdentity;

    WorkerPool pool(static_cast<size_t>(options.format.jobs));
    Log::verbose("Workers: " + std::to_string(pool.getThreadCount()));

    const WriteMode mode = options.check ? WriteMode::Check
                         : options.toStdout ? WriteMode::Stdout
                         : WriteMode::InPlace;

    RunTotals totals;
    totals.ioErrors = static_cast<int>(missing.size());

    for (const auto& path : files) {
        auto startTime = std::chrono::steady_clock::now();

        if (path == "-") {
            std::string text((std::istreambuf_iterator<char>(std::cin)),
                             std::istreambuf_iterator<char>());
            DocumentReport report = formatDocumentText(text, *engine, options.format, &pool, "<stdin>");
            if (mode != WriteMode::Check) {
                std::cout << report.formatted_code;
            } else if (report.changed) {
                Log::info("would reformat <stdin>");
            }
            reportDiagnostics(report);
            tally(totals, report);
            continue;
        }

        std::string original;
        bool haveOriginal = cacheEnabled && readWholeFile(path, original);
        if (haveOriginal && cache.isUnchanged(path, original, fingerprint)) {
            Log::verbose(path + ": unchanged (cached)");
            totals.files++;
            totals.cached++;
            continue;
        }

        DocumentReport report = formatDocumentFile(path, *engine, options.format, mode, &pool, std::cout);
        reportDiagnostics(report);
        tally(totals, report);

        if (report.success && report.changed) {
            if (mode == WriteMode::Check) {
                Log::info("would reformat " + path);
            } else if (mode == WriteMode::InPlace) {
                Log::info("reformatted " + path);
            }
        }

        // Only fully formatted content goes into the cache
        if (cacheEnabled && report.success && report.regions_failed == 0) {
            // In check mode the file on disk is only clean if nothing would change
            bool stored = true;
            if (mode == WriteMode::InPlace || !report.changed) {
                stored = cache.recordClean(path, report.formatted_code, fingerprint);
            }
            if (!stored) {
                Log::warning("Cache update failed: " + cache.getLastError());
            }
        } else if (cacheEnabled && !report.success && !cache.forget(path)) {
            Log::warning("Cache update failed: " + cache.getLastError());
        }

        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - startTime).count();
        std::ostringstream timing;
        timing << path << ": " << pipelineStateName(report.state) << ", "
               << report.regions_found << " regions, "
               << report.regions_formatted << " formatted, "
               << report.regions_failed << " failed (" << elapsed << " ms)";
        Log::verbose(timing.str());
    }

    pool.shutdown();

    if (!options.toStdout || options.check) {
        printSummary(totals, options.check);
    }

    if (totals.ioErrors > 0) {
        return 1;
    }
    if (options.check && totals.changed > 0) {
        return 1;
    }
    if (options.strict && (totals.regionFailures > 0 || totals.aborted > 0)) {
        return 1;
    }
    return 0;
}
