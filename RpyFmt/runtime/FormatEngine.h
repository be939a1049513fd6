//
// FormatEngine.h
// rpyfmt Runtime - Formatting Engine Interface
//
// An engine turns one self-contained piece of python source into formatted
// python source. The core treats it as a black box: it never looks at how
// the text was produced, only at the outcome.
//

#ifndef RPYFMT_FORMAT_ENGINE_H
#define RPYFMT_FORMAT_ENGINE_H

#include "../src/rpyfmt_options.h"
#include <chrono>
#include <string>

namespace RpyFmt {

// Outcome of one engine call
struct EngineOutput {
    enum class Status {
        Ok,             // text holds the formatted source
        SyntaxError,    // the source does not parse
        EngineError     // anything else: crash, timeout, bad output
    };

    Status status;
    std::string text;
    std::string message;
    int line;       // 1-based position in the source, 0 = unknown
    int column;     // 1-based, 0 = unknown

    EngineOutput()
        : status(Status::EngineError), line(0), column(0) {}

    static EngineOutput ok(const std::string& formatted) {
        EngineOutput out;
        out.status = Status::Ok;
        out.text = formatted;
        return out;
    }

    static EngineOutput syntaxError(const std::string& msg, int ln = 0, int col = 0) {
        EngineOutput out;
        out.status = Status::SyntaxError;
        out.message = msg;
        out.line = ln;
        out.column = col;
        return out;
    }

    static EngineOutput engineError(const std::string& msg) {
        EngineOutput out;
        out.status = Status::EngineError;
        out.message = msg;
        return out;
    }

    bool isOk() const { return status == Status::Ok; }
};

// Abstract engine. Implementations must be safe to call from several
// dispatch threads at once.
class FormatEngine {
public:
    virtual ~FormatEngine() = default;

    virtual EngineOutput format(const std::string& source,
                                const EngineOptions& options,
                                std::chrono::milliseconds timeout) const = 0;

    virtual std::string getName() const = 0;
};

} // namespace RpyFmt

#endif // RPYFMT_FORMAT_ENGINE_H
