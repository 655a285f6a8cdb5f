// base.hpp -- common typedefs and error handling code for lbridge

#ifndef __LBRIDGE_BASE_HPP
#define __LBRIDGE_BASE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lbridge {

/// aliases imported from std
template<class T> using optional = std::optional<T>;
using string = std::string;

template<class T> using shared_ptr = std::shared_ptr<T>;
template<class T> using unique_ptr = std::unique_ptr<T>;

/// integer/float typedefs by bitwidth
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

// packed handles are stored in interpreter integers, which are 64 bits wide
static_assert(sizeof(uintptr_t) == 8);
static_assert(sizeof(double) == 8);
typedef double f64;

// kinds of errors that can escape a public engine operation
enum error_kind {
    ek_syntax,            // code failed to compile
    ek_runtime,           // raised during execution
    ek_memory,            // interpreter heap or accounting limit exceeded
    ek_read_only,         // write rejected by the data server
    ek_path_resolution,   // write into a namespace with no server
    ek_callback,          // a host function failed
    ek_coroutine,         // bad coroutine handle or coroutine failure
    ek_init_failed,       // interpreter construction failed
    ek_type,              // value had the wrong kind for the operation
    ek_unknown            // fallback; code holds the interpreter status
};

// stable lowercase name, used in error messages
const char* error_kind_name(error_kind kind);

// A fault records an error without throwing. Host functions report failure
// through one of these (see call_handle).
struct fault {
    bool happened = false;
    string subsystem;
    string message;
};
inline void set_fault(fault* f,
        const string& subsystem,
        const string& message) {
    f->happened = true;
    f->subsystem = subsystem;
    f->message = message;
}

// The one exception type thrown by public engine operations.
class error : public std::exception {
    // need this to ensure the return value of what() lives as long as the
    // error does
    string formatted;

public:
    error_kind kind;
    string message;
    // dotted path for ek_read_only and ek_path_resolution, otherwise empty
    string path;
    // interpreter status code for ek_unknown, otherwise 0
    int code;

    error(error_kind kind,
            const string& message,
            const string& path = "",
            int code = 0);

    const char* what() const noexcept override {
        return formatted.c_str();
    }
};

// constructors for errors whose message is derived from the path
error read_only_access(const string& path);
error path_resolution(const string& path);

}

#endif
