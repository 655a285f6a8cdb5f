// proxy.cpp -- lazy path resolution for data server namespaces
//
// Each namespace is a global table with no contents of its own. Its metatable
// holds __index/__newindex closures whose upvalues are the engine handle and
// the namespace name. Reading a key asks the data server about the path so
// far plus that key: a leaf is converted and returned, anything else yields a
// fresh proxy table that remembers the longer path and shares the metatable.
// The path lives in the proxy under a light userdata key and is only ever
// touched with raw accessors, which never reach the metamethods.

#include "engine_state.hpp"

namespace lbridge {

// the address of this variable is the key of the path in proxy tables
static const char path_key = 'p';

static data_path read_path(lua_State* L, int container) {
    data_path res;
    if (lua_rawgetp(L, container, &path_key) == LUA_TTABLE) {
        auto n = static_cast<lua_Integer>(lua_rawlen(L, -1));
        for (lua_Integer i = 1; i <= n; ++i) {
            lua_rawgeti(L, -1, i);
            size_t len = 0;
            auto s = lua_tolstring(L, -1, &len);
            res.emplace_back(s, len);
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);
    return res;
}

// Only strings and numbers name path segments. Numbers use the same string
// form as numeric map keys.
static bool key_segment(lua_State* L, int index, string* out) {
    switch (lua_type(L, index)) {
    case LUA_TSTRING: {
        size_t len;
        auto s = lua_tolstring(L, index, &len);
        *out = string{s, len};
        return true;
    }
    case LUA_TNUMBER:
        *out = number_key(L, index);
        return true;
    default:
        return false;
    }
}

static string upvalue_namespace(lua_State* L) {
    size_t len = 0;
    auto s = lua_tolstring(L, lua_upvalueindex(2), &len);
    return string{s, len};
}

static void push_proxy(lua_State* L, int container, const data_path& path) {
    lua_createtable(L, 0, 1);
    lua_createtable(L, static_cast<int>(path.size()), 0);
    lua_Integer i = 1;
    for (auto& seg : path) {
        lua_pushlstring(L, seg.data(), seg.size());
        lua_rawseti(L, -2, i++);
    }
    lua_rawsetp(L, -2, &path_key);
    lua_getmetatable(L, container);
    lua_setmetatable(L, -2);
}

// The *_impl functions return the number of results, or -1 after pushing an
// error message. lua_error is called by the caller once every C++ object here
// has been destroyed.
static int proxy_index_impl(lua_State* L) {
    // 1: container, 2: key
    auto st = upvalue_engine(L, 1);
    string segment;
    if (st == nullptr || !key_segment(L, 2, &segment)) {
        lua_pushnil(L);
        return 1;
    }
    heap_enforcement unlimited{&st->heap, false};

    auto it = st->servers.find(upvalue_namespace(L));
    if (it == st->servers.end()) {
        lua_pushnil(L);
        return 1;
    }
    // keep the server alive even if it is unregistered while we use it
    auto server = it->second;
    auto path = read_path(L, 1);
    path.push_back(std::move(segment));

    try {
        auto res = server->lookup(path);
        if (res.kind == rk_leaf) {
            push_value(L, res.leaf, &st->functions);
        } else {
            push_proxy(L, 1, path);
        }
        return 1;
    } catch (const error& e) {
        push_raised_error(st, L, e);
    } catch (const std::exception& e) {
        push_raised_error(st, L, error{ek_runtime, e.what(),
                format_path(server->get_namespace(), path)});
    } catch (...) {
        push_raised_error(st, L, error{ek_runtime,
                "data server threw a non-standard exception",
                format_path(server->get_namespace(), path)});
    }
    return -1;
}

static int proxy_index(lua_State* L) {
    int n = proxy_index_impl(L);
    if (n < 0) {
        return lua_error(L);
    }
    return n;
}

static int proxy_newindex_impl(lua_State* L) {
    // 1: container, 2: key, 3: value
    auto st = upvalue_engine(L, 1);
    auto name_space = upvalue_namespace(L);
    if (st == nullptr) {
        push_raised_error(nullptr, L, path_resolution(name_space));
        return -1;
    }
    heap_enforcement unlimited{&st->heap, false};

    auto path = read_path(L, 1);
    string segment;
    if (!key_segment(L, 2, &segment)) {
        push_raised_error(st, L, error{ek_type,
                string{"cannot index a namespace with a "} + luaL_typename(L, 2),
                format_path(name_space, path)});
        return -1;
    }
    path.push_back(std::move(segment));
    auto full = format_path(name_space, path);

    auto it = st->servers.find(name_space);
    if (it == st->servers.end()) {
        push_raised_error(st, L, path_resolution(full));
        return -1;
    }
    auto server = it->second;

    try {
        auto v = pull_value(L, 3, &st->functions);
        if (!server->can_write(path)) {
            throw read_only_access(full);
        }
        server->write(path, v);
        return 0;
    } catch (const error& e) {
        push_raised_error(st, L, e);
    } catch (const std::exception& e) {
        push_raised_error(st, L, error{ek_runtime, e.what(), full});
    } catch (...) {
        push_raised_error(st, L, error{ek_runtime,
                "data server threw a non-standard exception", full});
    }
    return -1;
}

static int proxy_newindex(lua_State* L) {
    int n = proxy_newindex_impl(L);
    if (n < 0) {
        return lua_error(L);
    }
    return n;
}

void install_namespace(engine_state& st, const string& name_space) {
    auto L = st.L;
    stack_guard guard{L};

    lua_createtable(L, 0, 0);
    lua_createtable(L, 0, 4);
    lua_pushinteger(L, static_cast<lua_Integer>(st.handle));
    lua_pushlstring(L, name_space.data(), name_space.size());
    lua_pushcclosure(L, proxy_index, 2);
    lua_setfield(L, -2, "__index");
    lua_pushinteger(L, static_cast<lua_Integer>(st.handle));
    lua_pushlstring(L, name_space.data(), name_space.size());
    lua_pushcclosure(L, proxy_newindex, 2);
    lua_setfield(L, -2, "__newindex");
    lua_pushstring(L, "lbridge.proxy");
    lua_setfield(L, -2, "__name");
    // scripts can neither read nor replace the metatable
    lua_pushboolean(L, 0);
    lua_setfield(L, -2, "__metatable");
    lua_setmetatable(L, -2);

    lua_pushglobaltable(L);
    lua_pushlstring(L, name_space.data(), name_space.size());
    lua_pushvalue(L, -3);
    lua_rawset(L, -3);
}

void remove_namespace(engine_state& st, const string& name_space) {
    auto L = st.L;
    stack_guard guard{L};
    lua_pushglobaltable(L);
    lua_pushlstring(L, name_space.data(), name_space.size());
    lua_pushnil(L);
    lua_rawset(L, -3);
}

}
