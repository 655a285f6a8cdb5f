// callback.hpp -- host functions callable from scripts

#ifndef __LBRIDGE_CALLBACK_HPP
#define __LBRIDGE_CALLBACK_HPP

#include "lbridge/base.hpp"
#include "lbridge/value.hpp"

#include <functional>
#include <vector>

namespace lbridge {

class engine;

// Context passed to every host function. Errors are reported by calling
// error() (or by throwing); the caller checks failed() after the function
// returns.
struct call_handle {
    engine* eng;

    // used in error generation
    string func_name;
    fault* err;
    // kind of the error raised in the script when the call fails
    error_kind err_kind = ek_callback;

    // used to check errors
    inline bool failed() const {
        return err->happened;
    }
    // used to set an error
    void error(const string& message);

    // these checks don't raise exceptions; they set the error and return
    // false, so the caller must check failed() or the result.

    // exactly n arguments
    bool check_arity(const std::vector<value>& args, size_t n);
    // between min and max arguments, inclusive
    bool check_arity(const std::vector<value>& args, size_t min, size_t max);
    // argument i (0-based) has kind k
    bool check_kind(const std::vector<value>& args, size_t i, value_kind k);

    // memory accounting through the engine. Failure is reported as an error
    // instead of an exception.
    bool track_allocation(size_t bytes);
    void track_deallocation(size_t bytes);
};

// Script functions anywhere inside args arrive as function_refs and stay
// anchored in the engine until released with engine::release_function (or
// call_and_release), whether or not the host function keeps them. Scripts that
// pass fresh closures in a loop grow the anchor table until the host releases
// them.
using host_function =
    std::function<value(call_handle& h, const std::vector<value>& args)>;

}

#endif
