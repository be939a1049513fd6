//
// lua_engine.cpp
// rpyfmt Runtime - Lua Scripted Formatter Implementation
//

#include "lua_engine.h"
#include <lua.hpp>
#include <fstream>
#include <iterator>

namespace RpyFmt {

namespace {

// Deadline of the call running on this thread
thread_local std::chrono::steady_clock::time_point t_deadline;
thread_local bool t_timedOut = false;

// Instructions between deadline checks
const int kHookInterval = 10000;

void timeoutHook(lua_State* L, lua_Debug* /*ar*/) {
    if (std::chrono::steady_clock::now() > t_deadline) {
        t_timedOut = true;
        luaL_error(L, "format timed out");
    }
}

// Closes the state on every exit path
struct StateGuard {
    lua_State* L;
    explicit StateGuard(lua_State* state) : L(state) {}
    ~StateGuard() {
        if (L) {
            lua_close(L);
        }
    }
};

std::string popMessage(lua_State* L) {
    std::string message = lua_isstring(L, -1) ? lua_tostring(L, -1) : "unknown Lua error";
    lua_pop(L, 1);
    return message;
}

// Run the script so its globals exist; leaves nothing on the stack
bool runScript(lua_State* L, const std::string& script, const std::string& chunkName,
               std::string& error) {
    if (luaL_loadbuffer(L, script.c_str(), script.size(), chunkName.c_str()) != 0 ||
        lua_pcall(L, 0, 0, 0) != 0) {
        error = popMessage(L);
        return false;
    }
    return true;
}

} // namespace

// =============================================================================
// Loading
// =============================================================================

LuaEngine::LuaEngine() {
}

bool LuaEngine::loadFile(const std::string& path, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open Lua engine script: " + path;
        return false;
    }
    std::string script((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return loadString(script, "@" + path, error);
}

bool LuaEngine::loadString(const std::string& script, const std::string& chunkName,
                           std::string& error) {
    lua_State* L = luaL_newstate();
    if (!L) {
        error = "cannot create Lua state";
        return false;
    }
    StateGuard guard(L);
    luaL_openlibs(L);

    if (!runScript(L, script, chunkName, error)) {
        return false;
    }

    lua_getglobal(L, "format");
    bool isFunction = lua_isfunction(L, -1);
    lua_pop(L, 1);
    if (!isFunction) {
        error = chunkName + " does not define a global format(source, options) function";
        return false;
    }

    script_ = script;
    chunkName_ = chunkName;
    return true;
}

std::string LuaEngine::getName() const {
    std::string name = chunkName_;
    if (!name.empty() && name[0] == '@') {
        name = name.substr(1);
    }
    size_t slash = name.rfind('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return "lua:" + name;
}

// =============================================================================
// Formatting
// =============================================================================

EngineOutput LuaEngine::format(const std::string& source,
                               const EngineOptions& options,
                               std::chrono::milliseconds timeout) const {
    if (script_.empty()) {
        return EngineOutput::engineError("no Lua engine script loaded");
    }

    lua_State* L = luaL_newstate();
    if (!L) {
        return EngineOutput::engineError("cannot create Lua state");
    }
    StateGuard guard(L);
    luaL_openlibs(L);

    // LuaJIT does not run count hooks inside compiled traces
    if (luaL_dostring(L, "if jit then jit.off() end") != 0) {
        return EngineOutput::engineError(popMessage(L));
    }

    t_deadline = std::chrono::steady_clock::now() + timeout;
    t_timedOut = false;
    lua_sethook(L, timeoutHook, LUA_MASKCOUNT, kHookInterval);

    std::string error;
    if (!runScript(L, script_, chunkName_, error)) {
        return EngineOutput::engineError(t_timedOut ? "timed out loading engine script" : error);
    }

    lua_getglobal(L, "format");
    if (!lua_isfunction(L, -1)) {
        return EngineOutput::engineError(chunkName_ + " does not define format()");
    }

    lua_pushlstring(L, source.data(), source.size());

    lua_newtable(L);
    lua_pushinteger(L, options.lineLength);
    lua_setfield(L, -2, "line_length");
    for (const auto& entry : options.extra) {
        lua_pushstring(L, entry.second.c_str());
        lua_setfield(L, -2, entry.first.c_str());
    }

    if (lua_pcall(L, 2, 4, 0) != 0) {
        std::string message = popMessage(L);
        if (t_timedOut) {
            return EngineOutput::engineError("timed out after " +
                                             std::to_string(timeout.count()) + " ms");
        }
        return EngineOutput::engineError(message);
    }

    // Results occupy -4 (text or nil) .. -1
    if (lua_type(L, -4) == LUA_TSTRING) {
        size_t length = 0;
        const char* text = lua_tolstring(L, -4, &length);
        return EngineOutput::ok(std::string(text, length));
    }

    if (lua_isnil(L, -4)) {
        std::string message = lua_isstring(L, -3) ? lua_tostring(L, -3) : "cannot parse";
        int line = lua_isnumber(L, -2) ? static_cast<int>(lua_tointeger(L, -2)) : 0;
        int column = lua_isnumber(L, -1) ? static_cast<int>(lua_tointeger(L, -1)) : 0;
        return EngineOutput::syntaxError(message, line, column);
    }

    return EngineOutput::engineError(std::string("format() returned a ") +
                                     luaL_typename(L, -4) + " instead of a string");
}

} // namespace RpyFmt
