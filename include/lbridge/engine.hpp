// engine.hpp -- the public face of lbridge

#ifndef __LBRIDGE_ENGINE_HPP
#define __LBRIDGE_ENGINE_HPP

#include "lbridge/base.hpp"
#include "lbridge/callback.hpp"
#include "lbridge/config.hpp"
#include "lbridge/coroutine.hpp"
#include "lbridge/data_server.hpp"
#include "lbridge/log.hpp"
#include "lbridge/value.hpp"

#include <vector>

namespace lbridge {

struct engine_state;

// An engine owns one Lua interpreter together with the data servers, host
// functions and coroutines registered with it. Every operation takes the
// engine lock, which is reentrant so host functions may call back into the
// engine. Memory accounting has a lock of its own.
//
// Operations report failure by throwing lbridge::error.
//
// One engine runs on one host thread at a time. Hosts that need parallelism
// should give each thread its own engine.
class engine {
private:
    unique_ptr<engine_state> st;

public:
    // log may be null, in which case nothing is logged. Throws error
    // (ek_init_failed) if the interpreter cannot be created.
    explicit engine(const engine_config& config = default_config(),
            logger* log = nullptr);
    ~engine();

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;

    const engine_config& config() const;
    // packed handle identifying this engine to scripts and references
    u64 handle() const;

    // execute code as a chunk, discarding results
    void run(const string& code, const string& chunk_name = "=run");
    // Evaluate code and return its first result. code may be an expression
    // ("1 + 2") or a block with a return statement.
    value evaluate(const string& code, const string& chunk_name = "=evaluate");
    // like evaluate, but the result must be a map or an array (ek_type)
    value_map evaluate_map(const string& code);
    value_array evaluate_array(const string& code);
    // seed the interpreter's random number generator
    void seed(i64 n);

    // data servers. Registering replaces any server under the same namespace.
    void register_server(shared_ptr<data_server> server);
    bool unregister_server(const string& name_space);
    bool has_server(const string& name_space) const;

    // host functions. Registering replaces any function of the same name.
    void register_function(const string& name, host_function fn);
    bool unregister_function(const string& name);
    bool has_function(const string& name) const;
    // true while a host function is running
    bool in_callback() const;

    // script functions handed to the host as function_refs
    value call_function(const function_ref& ref,
            const std::vector<value>& args = {});
    // returns false if ref was already released or belongs to another engine
    bool release_function(const function_ref& ref);
    // call fn (which must hold a function) and release it afterwards, even if
    // the call fails
    value call_and_release(const value& fn, const std::vector<value>& args = {});
    u32 anchored_functions() const;

    // coroutines
    coroutine_handle create_coroutine(const string& code);
    coroutine_result resume(const coroutine_handle& h,
            const std::vector<value>& args = {});
    coroutine_status status(const coroutine_handle& h) const;
    // idempotent
    void destroy(const coroutine_handle& h);
    u32 live_coroutines() const;

    // memory accounting hook for host code allocating on behalf of scripts
    void track_allocation(size_t bytes);
    void track_deallocation(size_t bytes);
    void reset_memory_tracker();
    size_t allocated_bytes() const;
    // bytes currently held by the interpreter heap
    size_t interpreter_bytes() const;
};

}

#endif
