// lua_api.hpp -- the Lua 5.4 C API, with C linkage

#ifndef __LBRIDGE_LUA_API_HPP
#define __LBRIDGE_LUA_API_HPP

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

#if LUA_VERSION_NUM < 504
#error "lbridge requires Lua 5.4 or newer"
#endif

#endif
