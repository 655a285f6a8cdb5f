#include "lbridge/marshal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lbridge {

// the address of this variable is the registry key of the complex metatable
static const char complex_mt_key = 'c';

function_registry::function_registry(u64 owner)
    : owner{owner} {
}

void function_registry::set_owner(u64 new_owner) {
    owner = new_owner;
}

u64 function_registry::get_owner() const {
    return owner;
}

function_ref function_registry::anchor(lua_State* L, int index) {
    lua_pushvalue(L, index);
    auto ref = luaL_ref(L, LUA_REGISTRYINDEX);
    return function_ref{anchors.insert(ref), owner};
}

bool function_registry::push(lua_State* L, const function_ref& ref) {
    int* r = ref.owner == owner ? anchors.get(ref.id) : nullptr;
    if (r == nullptr) {
        lua_pushnil(L);
        return false;
    }
    lua_rawgeti(L, LUA_REGISTRYINDEX, *r);
    return true;
}

bool function_registry::release(lua_State* L, const function_ref& ref) {
    int* r = ref.owner == owner ? anchors.get(ref.id) : nullptr;
    if (r == nullptr) {
        return false;
    }
    luaL_unref(L, LUA_REGISTRYINDEX, *r);
    anchors.remove(ref.id);
    return true;
}

void function_registry::release_all(lua_State* L) {
    anchors.for_each([L](u64, int& r) {
        luaL_unref(L, LUA_REGISTRYINDEX, r);
    });
    anchors.clear();
}

u32 function_registry::size() const {
    return anchors.size();
}

static int complex_tostring(lua_State* L) {
    lua_getfield(L, 1, "re");
    lua_getfield(L, 1, "im");
    auto re = lua_tonumber(L, -2);
    auto im = lua_tonumber(L, -1);
    char buf[96];
    snprintf(buf, sizeof(buf), "%.14g%s%.14gi", re, im >= 0 ? "+" : "", im);
    lua_pushstring(L, buf);
    return 1;
}

static int complex_eq(lua_State* L) {
    lua_getfield(L, 1, "re");
    lua_getfield(L, 2, "re");
    lua_getfield(L, 1, "im");
    lua_getfield(L, 2, "im");
    lua_pushboolean(L, lua_rawequal(L, -4, -3) && lua_rawequal(L, -2, -1));
    return 1;
}

void push_complex_metatable(lua_State* L) {
    if (lua_rawgetp(L, LUA_REGISTRYINDEX, &complex_mt_key) == LUA_TTABLE) {
        return;
    }
    lua_pop(L, 1);
    lua_createtable(L, 0, 3);
    lua_pushstring(L, "complex");
    lua_setfield(L, -2, "__name");
    lua_pushcfunction(L, complex_tostring);
    lua_setfield(L, -2, "__tostring");
    lua_pushcfunction(L, complex_eq);
    lua_setfield(L, -2, "__eq");
    lua_pushvalue(L, -1);
    lua_rawsetp(L, LUA_REGISTRYINDEX, &complex_mt_key);
}

string number_key(lua_State* L, int index) {
    if (lua_isinteger(L, index)) {
        return std::to_string(static_cast<long long>(lua_tointeger(L, index)));
    }
    char buf[64];
    snprintf(buf, sizeof(buf), "%.14g", static_cast<double>(lua_tonumber(L, index)));
    return string{buf};
}

static void push_number(lua_State* L, f64 n) {
    // doubles in [-2^63, 2^63) with no fractional part are exact integers
    if (std::isfinite(n) && std::floor(n) == n
            && n >= -9223372036854775808.0 && n < 9223372036854775808.0) {
        lua_pushinteger(L, static_cast<lua_Integer>(n));
    } else {
        lua_pushnumber(L, n);
    }
}

void push_value(lua_State* L, const value& v, function_registry* refs) {
    if (!lua_checkstack(L, 3)) {
        throw error{ek_runtime, "value nesting too deep to push"};
    }
    switch (v.kind()) {
    case vk_nil:
        lua_pushnil(L);
        break;
    case vk_bool:
        lua_pushboolean(L, *v.as_bool());
        break;
    case vk_number:
        push_number(L, *v.as_number());
        break;
    case vk_string: {
        auto s = v.as_string();
        lua_pushlstring(L, s->data(), s->size());
        break;
    }
    case vk_array: {
        auto arr = v.as_array();
        lua_createtable(L, static_cast<int>(arr->size()), 0);
        lua_Integer i = 1;
        for (auto& x : *arr) {
            push_value(L, x, refs);
            lua_rawseti(L, -2, i++);
        }
        break;
    }
    case vk_map: {
        auto m = v.as_map();
        lua_createtable(L, 0, static_cast<int>(m->size()));
        for (auto& e : *m) {
            lua_pushlstring(L, e.first.data(), e.first.size());
            push_value(L, e.second, refs);
            lua_rawset(L, -3);
        }
        break;
    }
    case vk_function:
        if (refs == nullptr) {
            lua_pushnil(L);
        } else {
            refs->push(L, *v.as_function());
        }
        break;
    case vk_complex: {
        auto c = *v.as_complex();
        lua_createtable(L, 0, 2);
        lua_pushnumber(L, c.re);
        lua_setfield(L, -2, "re");
        lua_pushnumber(L, c.im);
        lua_setfield(L, -2, "im");
        push_complex_metatable(L);
        lua_setmetatable(L, -2);
        break;
    }
    }
}

// tables being pulled, from the outermost one in
using open_tables = std::vector<const void*>;

static value pull_rec(lua_State* L, int index, function_registry* refs,
        open_tables& open);

// true if the table at index carries the complex metatable
static bool is_complex(lua_State* L, int index) {
    if (!lua_getmetatable(L, index)) {
        return false;
    }
    push_complex_metatable(L);
    bool res = lua_rawequal(L, -1, -2);
    lua_pop(L, 2);
    return res;
}

static value pull_table(lua_State* L, int index, function_registry* refs,
        open_tables& open) {
    if (is_complex(L, index)) {
        lua_pushstring(L, "re");
        lua_rawget(L, index);
        lua_pushstring(L, "im");
        lua_rawget(L, index);
        complex_num c{lua_tonumber(L, -2), lua_tonumber(L, -1)};
        lua_pop(L, 2);
        return value{c};
    }

    // One pass over the table. Integer keys are kept apart from the rest, and
    // while every key is a positive integer we only need min and max to know
    // whether the keys are exactly 1..n.
    std::vector<std::pair<lua_Integer, value>> numbered;
    std::vector<std::pair<string, value>> named;
    bool all_positive = true;
    lua_Integer min = 0;
    lua_Integer max = 0;

    lua_pushnil(L);
    while (lua_next(L, index) != 0) {
        // key at -2, value at -1
        auto v = pull_rec(L, -1, refs, open);
        switch (lua_type(L, -2)) {
        case LUA_TNUMBER:
            if (lua_isinteger(L, -2)) {
                auto k = lua_tointeger(L, -2);
                if (numbered.empty() || k < min) {
                    min = k;
                }
                if (numbered.empty() || k > max) {
                    max = k;
                }
                if (k < 1) {
                    all_positive = false;
                }
                numbered.emplace_back(k, std::move(v));
            } else {
                all_positive = false;
                named.emplace_back(number_key(L, -2), std::move(v));
            }
            break;
        case LUA_TSTRING: {
            // lua_tolstring is safe here since the key is already a string
            size_t len;
            auto s = lua_tolstring(L, -2, &len);
            all_positive = false;
            named.emplace_back(string{s, len}, std::move(v));
            break;
        }
        case LUA_TBOOLEAN:
            all_positive = false;
            named.emplace_back(lua_toboolean(L, -2) ? "true" : "false", std::move(v));
            break;
        default:
            // keys of other types have no host representation
            all_positive = false;
            break;
        }
        lua_pop(L, 1);
    }

    auto count = static_cast<lua_Integer>(numbered.size());
    if (all_positive && count > 0 && min == 1 && max == count) {
        // keys are distinct, so they are a permutation of 1..count
        value_array arr(numbered.size());
        for (auto& e : numbered) {
            arr[e.first - 1] = std::move(e.second);
        }
        return value{std::move(arr)};
    }

    value_map res;
    for (auto& e : numbered) {
        res[std::to_string(static_cast<long long>(e.first))] = std::move(e.second);
    }
    for (auto& e : named) {
        res[e.first] = std::move(e.second);
    }
    return value{std::move(res)};
}

static value pull_rec(lua_State* L, int index, function_registry* refs,
        open_tables& open) {
    index = lua_absindex(L, index);
    switch (lua_type(L, index)) {
    case LUA_TBOOLEAN:
        return value{static_cast<bool>(lua_toboolean(L, index))};
    case LUA_TNUMBER:
        if (lua_isinteger(L, index)) {
            return value{static_cast<f64>(lua_tointeger(L, index))};
        }
        return value{static_cast<f64>(lua_tonumber(L, index))};
    case LUA_TSTRING: {
        size_t len;
        auto s = lua_tolstring(L, index, &len);
        return value{string{s, len}};
    }
    case LUA_TTABLE: {
        if (open.size() >= static_cast<size_t>(MAX_PULL_DEPTH)
                || !lua_checkstack(L, 4)) {
            return value{};
        }
        auto p = lua_topointer(L, index);
        if (std::find(open.begin(), open.end(), p) != open.end()) {
            return value{};
        }
        open.push_back(p);
        auto res = pull_table(L, index, refs, open);
        open.pop_back();
        return res;
    }
    case LUA_TFUNCTION:
        if (refs == nullptr) {
            return value{};
        }
        return value{refs->anchor(L, index)};
    default:
        // nil, threads, userdata and light userdata
        return value{};
    }
}

value pull_value(lua_State* L, int index, function_registry* refs) {
    open_tables open;
    return pull_rec(L, index, refs, open);
}

}
