// engine_state.hpp -- engine internals shared by the engine and the native
// entry points (proxy metamethods, host function trampoline)

#ifndef __LBRIDGE_ENGINE_STATE_HPP
#define __LBRIDGE_ENGINE_STATE_HPP

#include "lbridge/arena.hpp"
#include "lbridge/base.hpp"
#include "lbridge/callback.hpp"
#include "lbridge/config.hpp"
#include "lbridge/coroutine.hpp"
#include "lbridge/data_server.hpp"
#include "lbridge/log.hpp"
#include "lbridge/lua_api.hpp"
#include "lbridge/marshal.hpp"
#include "lbridge/memory.hpp"

#include <mutex>
#include <unordered_map>

namespace lbridge {

class engine;

enum coroutine_state {
    cst_fresh,      // created, never resumed
    cst_suspended,  // stopped at a yield
    cst_running,
    cst_completed,
    cst_failed
};

struct coroutine_slot {
    lua_State* thread;
    // registry reference keeping the thread alive
    int ref;
    coroutine_state state;
};

// the last failure a native entry point raised into the interpreter
struct raised_error {
    // text of the raised message, without the position prefix
    string text;
    error err;
};

struct engine_state {
    engine* owner;
    logger* log;
    engine_config config;

    // heap must be initialized before L is created, since L's allocator
    // refers to it
    heap_state heap;
    lua_State* L = nullptr;
    // packed handle in the process-wide engine table
    u64 handle = 0;

    mutable std::recursive_mutex lock;

    std::unordered_map<string, shared_ptr<data_server>> servers;
    std::unordered_map<string, host_function> callbacks;
    function_registry functions;
    slot_arena<coroutine_slot> coroutines;

    // the innermost host function call in progress, or null
    call_handle* active_call = nullptr;
    // thread running that call. Coroutines resumed from host functions are
    // resumed from this thread.
    lua_State* active_thread = nullptr;

    optional<raised_error> last_raised;

    memory_tracker tracker;

    engine_state(engine* owner, const engine_config& config, logger* log)
        : owner{owner}
        , log{log}
        , config{config}
        , tracker{config.memory_limit} {
        heap.limit = config.interpreter_memory_limit;
    }

    void log_info(const string& subsystem, const string& message) {
        if (log != nullptr) {
            log->log_info(subsystem, message);
        }
    }
    void log_warning(const string& subsystem, const string& message) {
        if (log != nullptr) {
            log->log_warning(subsystem, message);
        }
    }
    void log_error(const string& subsystem, const string& message) {
        if (log != nullptr) {
            log->log_error(subsystem, message);
        }
    }
};

// Restores the stack top of L when it goes out of scope.
class stack_guard {
private:
    lua_State* L;
    int top;

public:
    explicit stack_guard(lua_State* L)
        : L{L}
        , top{lua_gettop(L)} {
    }
    ~stack_guard() {
        lua_settop(L, top);
    }
    stack_guard(const stack_guard&) = delete;
    stack_guard& operator=(const stack_guard&) = delete;
};

// process-wide table of live engines. Scripts and references identify their
// engine through these handles, so a closure that outlives its engine finds
// nothing instead of a dangling pointer.
u64 register_engine(engine_state* st);
void release_engine(u64 handle);
// returns nullptr for stale handles
engine_state* find_engine(u64 handle);

// read the engine handle stored as upvalue i of the running C closure
engine_state* upvalue_engine(lua_State* L, int i);

// Native entry points raise failures as message strings prefixed with the
// script position. The structured error is kept in st (which may be null for
// a stale engine) so the host gets its kind and path back.
void push_raised_error(engine_state* st, lua_State* L, const error& e);
// Build the error for a failed pcall/resume from the error value at the top of
// L. Errors raised by push_raised_error come back as they were; other errors
// get run_kind for LUA_ERRRUN.
error error_from_status(engine_state& st, lua_State* L, int status,
        error_kind run_kind);

// proxy system (proxy.cpp)
void install_namespace(engine_state& st, const string& name_space);
void remove_namespace(engine_state& st, const string& name_space);

// host function trampoline (callback.cpp)
void install_function(engine_state& st, const string& name);
void remove_function(engine_state& st, const string& name);

// coroutines (coroutine.cpp)
u64 create_coroutine(engine_state& st, const string& code);
coroutine_result resume_coroutine(engine_state& st, u64 id,
        const std::vector<value>& args);
coroutine_status coroutine_status_of(engine_state& st, u64 id);
void destroy_coroutine(engine_state& st, u64 id);
void destroy_all_coroutines(engine_state& st);

}

#endif
