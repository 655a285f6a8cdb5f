// value.hpp -- values that cross the boundary between the host and scripts

#ifndef __LBRIDGE_VALUE_HPP
#define __LBRIDGE_VALUE_HPP

#include "lbridge/base.hpp"

#include <ostream>
#include <unordered_map>
#include <variant>
#include <vector>

namespace lbridge {

enum value_kind {
    vk_nil,
    vk_bool,
    vk_number,
    vk_string,
    vk_array,
    vk_map,
    vk_function,
    vk_complex
};

const char* value_kind_name(value_kind kind);

// Opaque reference to a script function anchored by an engine. id is a packed
// slot in the engine's function arena; owner is the packed engine handle.
struct function_ref {
    u64 id = 0;
    u64 owner = 0;

    bool operator==(const function_ref& other) const {
        return id == other.id && owner == other.owner;
    }
    bool operator!=(const function_ref& other) const {
        return !(*this == other);
    }
};

// complex number extension type. In scripts this is a {re, im} table carrying
// the engine's complex metatable.
struct complex_num {
    f64 re = 0;
    f64 im = 0;

    bool operator==(const complex_num& other) const {
        return re == other.re && im == other.im;
    }
    bool operator!=(const complex_num& other) const {
        return !(*this == other);
    }
};

class value;
using value_array = std::vector<value>;
using value_map = std::unordered_map<string, value>;

// Immutable tagged value. Arrays and maps are shared between copies on the
// host side; every read from the interpreter builds fresh ones.
class value {
private:
    std::variant<std::monostate,
                 bool,
                 f64,
                 string,
                 shared_ptr<const value_array>,
                 shared_ptr<const value_map>,
                 function_ref,
                 complex_num> data;

public:
    value() = default;
    value(std::nullptr_t) { }
    value(bool b) : data{b} { }
    value(int n) : data{static_cast<f64>(n)} { }
    value(i64 n) : data{static_cast<f64>(n)} { }
    value(f64 n) : data{n} { }
    value(const char* s) : data{string{s}} { }
    value(const string& s) : data{s} { }
    value(string&& s) : data{std::move(s)} { }
    value(value_array arr);
    value(value_map m);
    value(const function_ref& f) : data{f} { }
    value(const complex_num& c) : data{c} { }

    value_kind kind() const {
        return static_cast<value_kind>(data.index());
    }
    bool is_nil() const {
        return kind() == vk_nil;
    }
    // script truthiness: only nil and false are false
    bool truthy() const;

    // accessors return an empty optional (or a null pointer) on a kind
    // mismatch
    optional<bool> as_bool() const;
    optional<f64> as_number() const;
    // only succeeds for numbers with an exact 64-bit integer value
    optional<i64> as_integer() const;
    const string* as_string() const;
    const value_array* as_array() const;
    const value_map* as_map() const;
    optional<function_ref> as_function() const;
    optional<complex_num> as_complex() const;

    // lookup helpers; nil on a kind mismatch or a missing entry
    value field(const string& key) const;
    value elem(size_t i) const;
    size_t size() const;

    // deep structural equality. Function references compare by handle.
    bool operator==(const value& other) const;
    bool operator!=(const value& other) const {
        return !(*this == other);
    }
};

// display form, e.g. {1, 2, 3} or {x = 1}. Map entries are sorted by key.
string v_to_string(const value& v);

std::ostream& operator<<(std::ostream& out, const value& v);

}

#endif
