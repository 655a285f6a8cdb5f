#include "lbridge/value.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lbridge {

const char* value_kind_name(value_kind kind) {
    switch (kind) {
    case vk_nil:
        return "nil";
    case vk_bool:
        return "bool";
    case vk_number:
        return "number";
    case vk_string:
        return "string";
    case vk_array:
        return "array";
    case vk_map:
        return "map";
    case vk_function:
        return "function";
    case vk_complex:
        return "complex";
    }
    return "unknown";
}

value::value(value_array arr)
    : data{std::make_shared<const value_array>(std::move(arr))} {
}

value::value(value_map m)
    : data{std::make_shared<const value_map>(std::move(m))} {
}

bool value::truthy() const {
    switch (kind()) {
    case vk_nil:
        return false;
    case vk_bool:
        return std::get<bool>(data);
    default:
        return true;
    }
}

optional<bool> value::as_bool() const {
    if (auto b = std::get_if<bool>(&data)) {
        return *b;
    }
    return std::nullopt;
}

optional<f64> value::as_number() const {
    if (auto n = std::get_if<f64>(&data)) {
        return *n;
    }
    return std::nullopt;
}

optional<i64> value::as_integer() const {
    auto n = std::get_if<f64>(&data);
    // 2^63 is the first double that is out of range
    if (n == nullptr || !std::isfinite(*n) || std::floor(*n) != *n
            || *n < -9223372036854775808.0 || *n >= 9223372036854775808.0) {
        return std::nullopt;
    }
    return static_cast<i64>(*n);
}

const string* value::as_string() const {
    return std::get_if<string>(&data);
}

const value_array* value::as_array() const {
    if (auto p = std::get_if<shared_ptr<const value_array>>(&data)) {
        return p->get();
    }
    return nullptr;
}

const value_map* value::as_map() const {
    if (auto p = std::get_if<shared_ptr<const value_map>>(&data)) {
        return p->get();
    }
    return nullptr;
}

optional<function_ref> value::as_function() const {
    if (auto f = std::get_if<function_ref>(&data)) {
        return *f;
    }
    return std::nullopt;
}

optional<complex_num> value::as_complex() const {
    if (auto c = std::get_if<complex_num>(&data)) {
        return *c;
    }
    return std::nullopt;
}

value value::field(const string& key) const {
    auto m = as_map();
    if (m == nullptr) {
        return value{};
    }
    auto it = m->find(key);
    return it == m->end() ? value{} : it->second;
}

value value::elem(size_t i) const {
    auto arr = as_array();
    if (arr == nullptr || i >= arr->size()) {
        return value{};
    }
    return (*arr)[i];
}

size_t value::size() const {
    if (auto arr = as_array()) {
        return arr->size();
    } else if (auto m = as_map()) {
        return m->size();
    } else if (auto s = as_string()) {
        return s->size();
    }
    return 0;
}

bool value::operator==(const value& other) const {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
    case vk_nil:
        return true;
    case vk_array: {
        auto a = as_array();
        auto b = other.as_array();
        return a == b || *a == *b;
    }
    case vk_map: {
        auto a = as_map();
        auto b = other.as_map();
        if (a == b) {
            return true;
        }
        if (a->size() != b->size()) {
            return false;
        }
        for (auto& e : *a) {
            auto it = b->find(e.first);
            if (it == b->end() || it->second != e.second) {
                return false;
            }
        }
        return true;
    }
    default:
        return data == other.data;
    }
}

static string format_number(f64 n) {
    char buf[64];
    if (std::isfinite(n) && std::floor(n) == n && std::fabs(n) < 1e15) {
        snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(n));
    } else {
        snprintf(buf, sizeof(buf), "%.14g", n);
    }
    return string{buf};
}

string v_to_string(const value& v) {
    switch (v.kind()) {
    case vk_nil:
        return "nil";
    case vk_bool:
        return *v.as_bool() ? "true" : "false";
    case vk_number:
        return format_number(*v.as_number());
    case vk_string:
        return *v.as_string();
    case vk_array: {
        string res = "{";
        bool first = true;
        for (auto& x : *v.as_array()) {
            if (!first) {
                res += ", ";
            }
            first = false;
            res += x.kind() == vk_string ? "\"" + *x.as_string() + "\""
                : v_to_string(x);
        }
        return res + "}";
    }
    case vk_map: {
        // sort so the output is stable
        std::vector<const value_map::value_type*> entries;
        for (auto& e : *v.as_map()) {
            entries.push_back(&e);
        }
        std::sort(entries.begin(), entries.end(),
                [](auto a, auto b) { return a->first < b->first; });
        string res = "{";
        bool first = true;
        for (auto e : entries) {
            if (!first) {
                res += ", ";
            }
            first = false;
            auto& x = e->second;
            res += e->first + " = ";
            res += x.kind() == vk_string ? "\"" + *x.as_string() + "\""
                : v_to_string(x);
        }
        return res + "}";
    }
    case vk_function:
        return "<function#" + std::to_string(v.as_function()->id) + ">";
    case vk_complex: {
        auto c = *v.as_complex();
        string res = format_number(c.re);
        if (c.im >= 0 || std::isnan(c.im)) {
            res += "+";
        }
        return res + format_number(c.im) + "i";
    }
    }
    return "?";
}

std::ostream& operator<<(std::ostream& out, const value& v) {
    return out << v_to_string(v);
}

}
