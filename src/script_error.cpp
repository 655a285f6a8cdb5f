#include "engine_state.hpp"

namespace lbridge {

static bool ends_with(const string& s, const string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void push_raised_error(engine_state* st, lua_State* L, const error& e) {
    string text = e.what();
    // position of the script code that triggered the failure, like luaL_error
    luaL_where(L, 1);
    lua_pushlstring(L, text.data(), text.size());
    lua_concat(L, 2);
    if (st != nullptr) {
        st->last_raised = raised_error{text, e};
    }
}

error error_from_status(engine_state& st, lua_State* L, int status,
        error_kind run_kind) {
    string message;
    if (lua_type(L, -1) == LUA_TSTRING || lua_type(L, -1) == LUA_TNUMBER) {
        size_t len;
        auto s = lua_tolstring(L, -1, &len);
        message = string{s, len};
    } else {
        message = string{"(error object is a "} + luaL_typename(L, -1) + " value)";
    }

    // a failure raised by a native entry point, possibly rethrown by the
    // script with another position prefix
    if (status == LUA_ERRRUN && st.last_raised.has_value()
            && ends_with(message, st.last_raised->text)) {
        auto e = st.last_raised->err;
        st.last_raised.reset();
        return e;
    }

    switch (status) {
    case LUA_ERRSYNTAX:
        return error{ek_syntax, message};
    case LUA_ERRMEM:
        return error{ek_memory, message};
    case LUA_ERRRUN:
        return error{run_kind, message};
    case LUA_ERRERR:
        return error{ek_runtime, "error in error handling: " + message};
    default:
        return error{ek_unknown, message, "", status};
    }
}

}
