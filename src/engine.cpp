#include "lbridge/engine.hpp"

#include "engine_state.hpp"

#include <cstdio>

namespace lbridge {

using engine_lock = std::lock_guard<std::recursive_mutex>;

static int open_libraries(lua_State* L) {
    luaL_openlibs(L);
    return 0;
}

static int panic_handler(lua_State* L) {
    auto msg = lua_type(L, -1) == LUA_TSTRING ? lua_tostring(L, -1) : "?";
    fprintf(stderr, "lbridge: unprotected error in call to Lua API (%s)\n", msg);
    return 0;
}

// remove the entry at a dotted path like "package.loaded.io", if present
static void remove_entry(lua_State* L, const string& dotted) {
    stack_guard guard{L};
    auto segs = split_dotted(dotted);
    lua_pushglobaltable(L);
    for (size_t i = 0; i + 1 < segs.size(); ++i) {
        lua_pushlstring(L, segs[i].data(), segs[i].size());
        if (lua_rawget(L, -2) != LUA_TTABLE) {
            return;
        }
    }
    lua_pushlstring(L, segs.back().data(), segs.back().size());
    lua_pushnil(L);
    lua_rawset(L, -3);
}

static void set_string_field(lua_State* L, int index, const char* key,
        const string& s) {
    index = lua_absindex(L, index);
    lua_pushstring(L, key);
    lua_pushlstring(L, s.data(), s.size());
    lua_rawset(L, index);
}

static string package_pattern(const string& dir) {
    return dir + "/?.lua;" + dir + "/?/init.lua";
}

static void apply_sandbox(engine_state& st) {
    auto L = st.L;
    stack_guard guard{L};
    auto& config = st.config;

    if (config.sandboxed) {
        for (auto& entry : config.sandbox_policy) {
            remove_entry(L, entry);
        }
    }

    lua_pushglobaltable(L);
    lua_pushstring(L, "package");
    if (lua_rawget(L, -2) != LUA_TTABLE) {
        return;
    }
    auto package = lua_gettop(L);

    if (!config.sandboxed) {
        if (config.package_path.has_value()) {
            lua_pushstring(L, "path");
            lua_rawget(L, package);
            auto old = lua_type(L, -1) == LUA_TSTRING ? lua_tostring(L, -1) : "";
            set_string_field(L, package, "path",
                    package_pattern(*config.package_path) + ";" + old);
        }
        return;
    }

    // no native modules, and Lua modules only from the configured directory
    set_string_field(L, package, "cpath", "");
    set_string_field(L, package, "path",
            config.package_path.has_value() ? package_pattern(*config.package_path) : "");

    // searchers are: preload, Lua files, C libraries, C root libraries
    lua_pushstring(L, "searchers");
    if (lua_rawget(L, package) == LUA_TTABLE) {
        lua_Integer keep = config.package_path.has_value() ? 2 : 1;
        for (auto i = static_cast<lua_Integer>(lua_rawlen(L, -1)); i > keep; --i) {
            lua_pushnil(L);
            lua_rawseti(L, -2, i);
        }
    }
}

// Release everything the engine holds. The engine lock must be held.
static void close_state(engine_state& st) {
    if (st.handle != 0) {
        release_engine(st.handle);
        st.handle = 0;
    }
    if (st.L != nullptr) {
        destroy_all_coroutines(st);
        st.functions.release_all(st.L);
        lua_close(st.L);
        st.L = nullptr;
    }
}

// Log and return the error for a failed call. The error value is at the top
// of the stack.
static error call_failure(engine_state& st, int status, const string& what) {
    auto e = error_from_status(st, st.L, status, ek_runtime);
    st.log_error("engine", what + " failed: " + e.what());
    return e;
}

// pcall with the interpreter heap limit enforced
static int protected_call(engine_state& st, int nargs, int nresults) {
    heap_enforcement limited{&st.heap, true};
    return lua_pcall(st.L, nargs, nresults, 0);
}

static void load_chunk(engine_state& st, const string& code, const string& name) {
    auto status = luaL_loadbuffer(st.L, code.data(), code.size(), name.c_str());
    if (status != LUA_OK) {
        throw call_failure(st, status, "loading " + name);
    }
}

// Load code as an expression if it is one, and as a block otherwise.
static void load_expression(engine_state& st, const string& code,
        const string& name) {
    auto expr = "return " + code;
    auto status = luaL_loadbuffer(st.L, expr.data(), expr.size(), name.c_str());
    if (status == LUA_OK) {
        return;
    }
    lua_pop(st.L, 1);
    load_chunk(st, code, name);
}

engine::engine(const engine_config& config, logger* log)
    : st{new engine_state{this, config, log}} {
    auto L = lua_newstate(bounded_alloc, &st->heap);
    if (L == nullptr) {
        throw error{ek_init_failed, "could not create the interpreter state"};
    }
    st->L = L;
    lua_atpanic(L, panic_handler);

    lua_pushcfunction(L, open_libraries);
    auto status = lua_pcall(L, 0, 0, 0);
    if (status != LUA_OK) {
        auto e = error_from_status(*st, L, status, ek_init_failed);
        close_state(*st);
        throw error{ek_init_failed, "could not open the standard libraries: " + e.message};
    }

    push_complex_metatable(L);
    lua_pop(L, 1);

    st->handle = register_engine(st.get());
    st->functions.set_owner(st->handle);
    try {
        apply_sandbox(*st);
    } catch (const std::exception& e) {
        close_state(*st);
        throw error{ek_init_failed, string{"could not apply the sandbox: "} + e.what()};
    }

    st->log_info("engine", "created engine " + std::to_string(st->handle)
            + (config.sandboxed ? " (sandboxed)" : " (unrestricted)"));
}

engine::~engine() {
    engine_lock guard{st->lock};
    st->log_info("engine", "destroying engine " + std::to_string(st->handle));
    close_state(*st);
}

const engine_config& engine::config() const {
    return st->config;
}

u64 engine::handle() const {
    return st->handle;
}

void engine::run(const string& code, const string& chunk_name) {
    engine_lock guard{st->lock};
    stack_guard sg{st->L};
    load_chunk(*st, code, chunk_name);
    auto status = protected_call(*st, 0, 0);
    if (status != LUA_OK) {
        throw call_failure(*st, status, "run");
    }
}

value engine::evaluate(const string& code, const string& chunk_name) {
    engine_lock guard{st->lock};
    stack_guard sg{st->L};
    load_expression(*st, code, chunk_name);
    auto status = protected_call(*st, 0, 1);
    if (status != LUA_OK) {
        throw call_failure(*st, status, "evaluate");
    }
    return pull_value(st->L, -1, &st->functions);
}

value_map engine::evaluate_map(const string& code) {
    auto v = evaluate(code);
    if (auto m = v.as_map()) {
        return *m;
    }
    throw error{ek_type, string{"expected map, got "} + value_kind_name(v.kind())};
}

value_array engine::evaluate_array(const string& code) {
    auto v = evaluate(code);
    if (auto arr = v.as_array()) {
        return *arr;
    }
    // an empty table is classified as a map, but it is also an empty array
    if (auto m = v.as_map(); m != nullptr && m->empty()) {
        return value_array{};
    }
    throw error{ek_type, string{"expected array, got "} + value_kind_name(v.kind())};
}

void engine::seed(i64 n) {
    engine_lock guard{st->lock};
    auto L = st->L;
    stack_guard sg{L};
    lua_pushglobaltable(L);
    lua_pushstring(L, "math");
    if (lua_rawget(L, -2) != LUA_TTABLE) {
        throw error{ek_runtime, "the math library is not available"};
    }
    lua_pushstring(L, "randomseed");
    if (lua_rawget(L, -2) != LUA_TFUNCTION) {
        throw error{ek_runtime, "math.randomseed is not available"};
    }
    lua_pushinteger(L, static_cast<lua_Integer>(n));
    auto status = protected_call(*st, 1, 0);
    if (status != LUA_OK) {
        throw call_failure(*st, status, "seed");
    }
}

void engine::register_server(shared_ptr<data_server> server) {
    if (server == nullptr) {
        throw error{ek_type, "cannot register a null data server"};
    }
    auto name_space = server->get_namespace();
    if (name_space.empty()) {
        throw error{ek_type, "data server namespace must not be empty"};
    }
    engine_lock guard{st->lock};
    auto it = st->servers.find(name_space);
    if (it != st->servers.end()) {
        st->log_warning("engine", "replacing data server for namespace " + name_space);
        it->second = std::move(server);
    } else {
        st->servers.emplace(name_space, std::move(server));
    }
    install_namespace(*st, name_space);
    st->log_info("engine", "registered data server for namespace " + name_space);
}

bool engine::unregister_server(const string& name_space) {
    engine_lock guard{st->lock};
    if (st->servers.erase(name_space) == 0) {
        return false;
    }
    remove_namespace(*st, name_space);
    st->log_info("engine", "unregistered data server for namespace " + name_space);
    return true;
}

bool engine::has_server(const string& name_space) const {
    engine_lock guard{st->lock};
    return st->servers.count(name_space) != 0;
}

void engine::register_function(const string& name, host_function fn) {
    if (!fn) {
        throw error{ek_type, "cannot register an empty host function as " + name};
    }
    if (name.empty()) {
        throw error{ek_type, "host function name must not be empty"};
    }
    engine_lock guard{st->lock};
    auto it = st->callbacks.find(name);
    if (it != st->callbacks.end()) {
        st->log_warning("engine", "replacing host function " + name);
        it->second = std::move(fn);
    } else {
        st->callbacks.emplace(name, std::move(fn));
    }
    install_function(*st, name);
    st->log_info("engine", "registered host function " + name);
}

bool engine::unregister_function(const string& name) {
    engine_lock guard{st->lock};
    if (st->callbacks.erase(name) == 0) {
        return false;
    }
    remove_function(*st, name);
    st->log_info("engine", "unregistered host function " + name);
    return true;
}

bool engine::has_function(const string& name) const {
    engine_lock guard{st->lock};
    return st->callbacks.count(name) != 0;
}

bool engine::in_callback() const {
    engine_lock guard{st->lock};
    return st->active_call != nullptr;
}

value engine::call_function(const function_ref& ref,
        const std::vector<value>& args) {
    engine_lock guard{st->lock};
    auto L = st->L;
    stack_guard sg{L};
    if (!st->functions.push(L, ref)) {
        st->log_warning("engine", "call through a stale function reference");
        throw error{ek_type, "function reference is stale or belongs to another engine"};
    }
    if (!lua_checkstack(L, static_cast<int>(args.size()) + LUA_MINSTACK)) {
        throw error{ek_runtime, "too many arguments to call"};
    }
    for (auto& v : args) {
        push_value(L, v, &st->functions);
    }
    auto status = protected_call(*st, static_cast<int>(args.size()), 1);
    if (status != LUA_OK) {
        throw call_failure(*st, status, "call");
    }
    return pull_value(L, -1, &st->functions);
}

bool engine::release_function(const function_ref& ref) {
    engine_lock guard{st->lock};
    return st->functions.release(st->L, ref);
}

value engine::call_and_release(const value& fn, const std::vector<value>& args) {
    auto ref = fn.as_function();
    if (!ref.has_value()) {
        throw error{ek_type, string{"expected function, got "} + value_kind_name(fn.kind())};
    }
    value res;
    try {
        res = call_function(*ref, args);
    } catch (...) {
        release_function(*ref);
        throw;
    }
    release_function(*ref);
    return res;
}

u32 engine::anchored_functions() const {
    engine_lock guard{st->lock};
    return st->functions.size();
}

coroutine_handle engine::create_coroutine(const string& code) {
    engine_lock guard{st->lock};
    auto id = lbridge::create_coroutine(*st, code);
    st->log_info("engine", "created coroutine " + std::to_string(id));
    return coroutine_handle{id, st->handle};
}

coroutine_result engine::resume(const coroutine_handle& h,
        const std::vector<value>& args) {
    engine_lock guard{st->lock};
    if (h.owner != st->handle) {
        st->log_warning("engine", "resume of a coroutine from another engine");
        throw error{ek_coroutine, "coroutine not found or already destroyed"};
    }
    return resume_coroutine(*st, h.id, args);
}

coroutine_status engine::status(const coroutine_handle& h) const {
    engine_lock guard{st->lock};
    if (h.owner != st->handle) {
        return cs_dead;
    }
    return coroutine_status_of(*st, h.id);
}

void engine::destroy(const coroutine_handle& h) {
    engine_lock guard{st->lock};
    if (h.owner != st->handle) {
        return;
    }
    if (st->coroutines.contains(h.id)) {
        destroy_coroutine(*st, h.id);
        st->log_info("engine", "destroyed coroutine " + std::to_string(h.id));
    }
}

u32 engine::live_coroutines() const {
    engine_lock guard{st->lock};
    return st->coroutines.size();
}

void engine::track_allocation(size_t bytes) {
    st->tracker.track_allocation(bytes);
}

void engine::track_deallocation(size_t bytes) {
    st->tracker.track_deallocation(bytes);
}

void engine::reset_memory_tracker() {
    st->tracker.reset();
}

size_t engine::allocated_bytes() const {
    return st->tracker.current_total();
}

size_t engine::interpreter_bytes() const {
    engine_lock guard{st->lock};
    return st->heap.used;
}

}
