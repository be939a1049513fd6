//
// lua_engine.h
// rpyfmt Runtime - Lua Scripted Formatter
//
// Runs a formatter written in Lua. The script must define a global
//
//     function format(source, options)
//
// returning the formatted text, or nil, message [, line, column] when the
// source does not parse. options.line_length is always set; every -o
// key=value pair is added as a string field. Each call gets a fresh Lua
// state, so one engine can serve all dispatch threads.
//

#ifndef RPYFMT_LUA_ENGINE_H
#define RPYFMT_LUA_ENGINE_H

#include "FormatEngine.h"
#include <string>

namespace RpyFmt {

class LuaEngine : public FormatEngine {
public:
    LuaEngine();

    // Read and validate a script file. Returns false with error set on failure.
    bool loadFile(const std::string& path, std::string& error);

    // Validate script text. chunkName is used in Lua error messages.
    bool loadString(const std::string& script, const std::string& chunkName, std::string& error);

    bool isLoaded() const { return !script_.empty(); }

    EngineOutput format(const std::string& source,
                        const EngineOptions& options,
                        std::chrono::milliseconds timeout) const override;

    std::string getName() const override;

private:
    std::string script_;
    std::string chunkName_;
};

} // namespace RpyFmt

#endif // RPYFMT_LUA_ENGINE_H
