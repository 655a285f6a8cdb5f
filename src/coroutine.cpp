#include "engine_state.hpp"

namespace lbridge {

std::ostream& operator<<(std::ostream& out, const coroutine_handle& h) {
    return out << "<coroutine " << h.id << " of engine " << h.owner << ">";
}

coroutine_result coroutine_result::completed(value v) {
    coroutine_result res;
    res.outcome = co_completed;
    res.result = std::move(v);
    return res;
}

coroutine_result coroutine_result::yielded_values(std::vector<value> vs) {
    coroutine_result res;
    res.outcome = co_yielded;
    res.yielded = std::move(vs);
    return res;
}

coroutine_result coroutine_result::failed(const error& e) {
    coroutine_result res;
    res.outcome = co_failed;
    res.err = e;
    return res;
}

u64 create_coroutine(engine_state& st, const string& code) {
    auto L = st.L;
    stack_guard guard{L};
    auto T = lua_newthread(L);
    auto status = luaL_loadbuffer(T, code.data(), code.size(), "=coroutine");
    if (status != LUA_OK) {
        // nothing is anchored yet; the guard drops the thread
        throw error_from_status(st, T, status, ek_syntax);
    }
    // pops the thread
    auto ref = luaL_ref(L, LUA_REGISTRYINDEX);
    return st.coroutines.insert(coroutine_slot{T, ref, cst_fresh});
}

coroutine_result resume_coroutine(engine_state& st, u64 id,
        const std::vector<value>& args) {
    auto slot = st.coroutines.get(id);
    if (slot == nullptr) {
        throw error{ek_coroutine, "coroutine not found or already destroyed"};
    }
    switch (slot->state) {
    case cst_completed:
    case cst_failed:
        throw error{ek_coroutine, "cannot resume dead coroutine"};
    case cst_running:
        throw error{ek_coroutine, "cannot resume non-suspended coroutine"};
    default:
        break;
    }

    auto T = slot->thread;
    if (!lua_checkstack(T, static_cast<int>(args.size()) + LUA_MINSTACK)) {
        throw error{ek_coroutine, "too many arguments to resume"};
    }
    // arguments go on the coroutine's own stack
    auto top = lua_gettop(T);
    try {
        for (auto& v : args) {
            push_value(T, v, &st.functions);
        }
    } catch (...) {
        lua_settop(T, top);
        throw;
    }

    slot->state = cst_running;
    int nres = 0;
    int status;
    {
        heap_enforcement limited{&st.heap, true};
        // from a host function, the thread that called it does the resuming
        auto from = st.active_thread != nullptr ? st.active_thread : st.L;
        status = lua_resume(T, from, static_cast<int>(args.size()), &nres);
    }
    // the body may have created coroutines and moved the slot. It cannot
    // have destroyed this one since destroy refuses running coroutines.
    slot = st.coroutines.get(id);

    switch (status) {
    case LUA_OK: {
        auto v = nres > 0 ? pull_value(T, -nres, &st.functions) : value{};
        lua_pop(T, nres);
        slot->state = cst_completed;
        return coroutine_result::completed(std::move(v));
    }
    case LUA_YIELD: {
        std::vector<value> vs;
        vs.reserve(nres);
        auto base = lua_gettop(T) - nres;
        for (int i = 1; i <= nres; ++i) {
            vs.push_back(pull_value(T, base + i, &st.functions));
        }
        lua_pop(T, nres);
        slot->state = cst_suspended;
        return coroutine_result::yielded_values(std::move(vs));
    }
    default: {
        auto e = error_from_status(st, T, status, ek_coroutine);
        lua_settop(T, 0);
        slot->state = cst_failed;
        return coroutine_result::failed(e);
    }
    }
}

coroutine_status coroutine_status_of(engine_state& st, u64 id) {
    auto slot = st.coroutines.get(id);
    if (slot == nullptr) {
        return cs_dead;
    }
    switch (slot->state) {
    case cst_fresh:
    case cst_suspended:
        return cs_suspended;
    case cst_running:
        return cs_running;
    default:
        return cs_dead;
    }
}

void destroy_coroutine(engine_state& st, u64 id) {
    auto slot = st.coroutines.get(id);
    if (slot == nullptr) {
        return;
    }
    if (slot->state == cst_running) {
        throw error{ek_coroutine, "cannot destroy a running coroutine"};
    }
    luaL_unref(st.L, LUA_REGISTRYINDEX, slot->ref);
    st.coroutines.remove(id);
}

void destroy_all_coroutines(engine_state& st) {
    st.coroutines.for_each([&st](u64, coroutine_slot& slot) {
        luaL_unref(st.L, LUA_REGISTRYINDEX, slot.ref);
    });
    st.coroutines.clear();
}

}
