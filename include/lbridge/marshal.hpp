// marshal.hpp -- moving values on and off the interpreter stack

#ifndef __LBRIDGE_MARSHAL_HPP
#define __LBRIDGE_MARSHAL_HPP

#include "lbridge/arena.hpp"
#include "lbridge/base.hpp"
#include "lbridge/lua_api.hpp"
#include "lbridge/value.hpp"

namespace lbridge {

// Tables nested deeper than this pull as nil.
constexpr int MAX_PULL_DEPTH = 200;

// Anchors script functions in the interpreter registry so the host can hold
// them as function_refs. Each anchor lives in a generational arena, so using a
// released reference is a detected mismatch rather than a dangling registry
// slot.
class function_registry {
private:
    // registry reference per anchored function
    slot_arena<int> anchors;
    // packed handle of the engine these references belong to
    u64 owner;

public:
    explicit function_registry(u64 owner = 0);

    void set_owner(u64 new_owner);
    u64 get_owner() const;

    // anchor the function at index and return a reference to it
    function_ref anchor(lua_State* L, int index);
    // push the anchored function, or nil if ref is stale or foreign. Returns
    // true if a function was pushed.
    bool push(lua_State* L, const function_ref& ref);
    // drop the anchor. Returns false if ref is stale or foreign.
    bool release(lua_State* L, const function_ref& ref);
    void release_all(lua_State* L);

    u32 size() const;
};

// Push v as exactly one stack slot. Composite values recurse depth first.
// Integral numbers are pushed as interpreter integers. refs may be null, in
// which case function references push nil. Throws error (ek_runtime) if the
// stack cannot grow.
void push_value(lua_State* L, const value& v, function_registry* refs);

// Convert the slot at index into a value. Tables are classified as arrays iff
// their keys are exactly 1..n for n > 0; everything else becomes a map with
// numeric and boolean keys converted to strings. Functions are anchored in
// refs (or pulled as nil if refs is null). Threads and userdata pull as nil.
// A table reached again through its own contents (a cycle) pulls as nil at
// that point. Tables shared without a cycle are copied at each occurrence.
value pull_value(lua_State* L, int index, function_registry* refs);

// Push the shared metatable used for complex numbers, creating it in the
// registry on first use.
void push_complex_metatable(lua_State* L);

// string form of a numeric table key, as used for map keys
string number_key(lua_State* L, int index);

}

#endif
