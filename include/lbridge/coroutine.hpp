#ifndef __LBRIDGE_COROUTINE_HPP
#define __LBRIDGE_COROUTINE_HPP

#include "lbridge/base.hpp"
#include "lbridge/value.hpp"

#include <functional>
#include <ostream>
#include <vector>

namespace lbridge {

// Handle to a coroutine owned by an engine. id is a packed slot in the
// engine's coroutine arena; owner is the packed engine handle.
struct coroutine_handle {
    u64 id = 0;
    u64 owner = 0;

    bool operator==(const coroutine_handle& other) const {
        return id == other.id && owner == other.owner;
    }
    bool operator!=(const coroutine_handle& other) const {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& out, const coroutine_handle& h);

enum coroutine_status {
    cs_suspended,   // not started yet, or stopped at a yield
    cs_running,     // inside resume (only seen from host functions)
    cs_dead         // completed, failed or destroyed
};

enum coroutine_outcome {
    co_completed,
    co_yielded,
    co_failed
};

// result of one resume
struct coroutine_result {
    coroutine_outcome outcome;
    // first value returned by the body when completed
    value result;
    // every value passed to coroutine.yield, in order
    std::vector<value> yielded;
    // set when failed
    optional<error> err;

    static coroutine_result completed(value v);
    static coroutine_result yielded_values(std::vector<value> vs);
    static coroutine_result failed(const error& e);

    bool is_completed() const {
        return outcome == co_completed;
    }
    bool is_yielded() const {
        return outcome == co_yielded;
    }
    bool is_failed() const {
        return outcome == co_failed;
    }
};

}

namespace std {
template<> struct hash<lbridge::coroutine_handle> {
    size_t operator()(const lbridge::coroutine_handle& h) const noexcept {
        return hash<lbridge::u64>{}(h.id) ^ (hash<lbridge::u64>{}(h.owner) << 1);
    }
};
}

#endif
