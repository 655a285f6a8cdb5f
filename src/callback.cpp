#include "engine_state.hpp"
#include "lbridge/engine.hpp"

namespace lbridge {

void call_handle::error(const string& message) {
    set_fault(err, "callback:" + func_name, message);
}

bool call_handle::check_arity(const std::vector<value>& args, size_t n) {
    if (args.size() != n) {
        error("expected " + std::to_string(n) + " argument(s), got "
                + std::to_string(args.size()));
        return false;
    }
    return true;
}

bool call_handle::check_arity(const std::vector<value>& args,
        size_t min,
        size_t max) {
    if (args.size() < min || args.size() > max) {
        error("expected " + std::to_string(min) + " to " + std::to_string(max)
                + " arguments, got " + std::to_string(args.size()));
        return false;
    }
    return true;
}

bool call_handle::check_kind(const std::vector<value>& args,
        size_t i,
        value_kind k) {
    auto actual = i < args.size() ? args[i].kind() : vk_nil;
    if (actual != k) {
        error("argument " + std::to_string(i + 1) + " must be "
                + value_kind_name(k) + ", got " + value_kind_name(actual));
        return false;
    }
    return true;
}

bool call_handle::track_allocation(size_t bytes) {
    try {
        eng->track_allocation(bytes);
        return true;
    } catch (const lbridge::error& e) {
        error(e.message);
        err_kind = e.kind;
        return false;
    }
}

void call_handle::track_deallocation(size_t bytes) {
    eng->track_deallocation(bytes);
}

namespace {

// Points the engine at the call in progress and restores the previous value
// on every exit path.
class active_call_guard {
private:
    engine_state* st;
    call_handle* previous;
    lua_State* previous_thread;

public:
    active_call_guard(engine_state* st, call_handle* h, lua_State* thread)
        : st{st}
        , previous{st->active_call}
        , previous_thread{st->active_thread} {
        st->active_call = h;
        st->active_thread = thread;
    }
    ~active_call_guard() {
        st->active_call = previous;
        st->active_thread = previous_thread;
    }
    active_call_guard(const active_call_guard&) = delete;
    active_call_guard& operator=(const active_call_guard&) = delete;
};

}

static string describe_failure(const string& name, const string& message) {
    return "host function '" + name + "' failed: " + message;
}

// Returns the number of results, or -1 after pushing an error message. Every
// C++ object in here is gone by the time the caller raises the error.
static int call_host_function(lua_State* L) {
    size_t len = 0;
    auto s = lua_tolstring(L, lua_upvalueindex(2), &len);
    string name{s, len};

    auto st = upvalue_engine(L, 1);
    if (st == nullptr) {
        push_raised_error(nullptr, L, error{ek_callback,
                "host function '" + name + "' outlived its engine"});
        return -1;
    }
    auto it = st->callbacks.find(name);
    if (it == st->callbacks.end()) {
        push_raised_error(st, L, error{ek_callback,
                "host function '" + name + "' is not registered"});
        return -1;
    }
    // the copy survives the function unregistering itself
    auto fn = it->second;
    heap_enforcement unlimited{&st->heap, false};

    try {
        std::vector<value> args;
        auto n = lua_gettop(L);
        args.reserve(n);
        for (int i = 1; i <= n; ++i) {
            args.push_back(pull_value(L, i, &st->functions));
        }

        fault err;
        call_handle h{st->owner, name, &err};
        active_call_guard active{st, &h, L};
        auto res = fn(h, args);
        if (!h.failed()) {
            push_value(L, res, &st->functions);
            return 1;
        }
        push_raised_error(st, L, error{h.err_kind, describe_failure(name, err.message)});
    } catch (const error& e) {
        // memory errors from the accounting hook keep their kind
        auto kind = e.kind == ek_memory ? ek_memory : ek_callback;
        push_raised_error(st, L, error{kind, describe_failure(name, e.message)});
    } catch (const std::exception& e) {
        push_raised_error(st, L, error{ek_callback, describe_failure(name, e.what())});
    } catch (...) {
        push_raised_error(st, L, error{ek_callback,
                describe_failure(name, "non-standard exception")});
    }
    return -1;
}

static int host_function_trampoline(lua_State* L) {
    int n = call_host_function(L);
    if (n < 0) {
        return lua_error(L);
    }
    return n;
}

void install_function(engine_state& st, const string& name) {
    auto L = st.L;
    stack_guard guard{L};
    lua_pushglobaltable(L);
    lua_pushlstring(L, name.data(), name.size());
    lua_pushinteger(L, static_cast<lua_Integer>(st.handle));
    lua_pushlstring(L, name.data(), name.size());
    lua_pushcclosure(L, host_function_trampoline, 2);
    lua_rawset(L, -3);
}

void remove_function(engine_state& st, const string& name) {
    auto L = st.L;
    stack_guard guard{L};
    lua_pushglobaltable(L);
    lua_pushlstring(L, name.data(), name.size());
    lua_pushnil(L);
    lua_rawset(L, -3);
}

}
