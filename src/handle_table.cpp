#include "engine_state.hpp"

namespace lbridge {

// engines register here on construction and leave on destruction
static std::mutex table_lock;
static slot_arena<engine_state*> engine_table;

u64 register_engine(engine_state* st) {
    std::lock_guard<std::mutex> guard{table_lock};
    return engine_table.insert(st);
}

void release_engine(u64 handle) {
    std::lock_guard<std::mutex> guard{table_lock};
    engine_table.remove(handle);
}

engine_state* find_engine(u64 handle) {
    std::lock_guard<std::mutex> guard{table_lock};
    auto res = engine_table.get(handle);
    return res == nullptr ? nullptr : *res;
}

engine_state* upvalue_engine(lua_State* L, int i) {
    int isnum = 0;
    auto handle = lua_tointegerx(L, lua_upvalueindex(i), &isnum);
    if (!isnum) {
        return nullptr;
    }
    return find_engine(static_cast<u64>(handle));
}

}
