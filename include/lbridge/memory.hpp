#ifndef __LBRIDGE_MEMORY_HPP
#define __LBRIDGE_MEMORY_HPP

#include "lbridge/base.hpp"

#include <mutex>

namespace lbridge {

// Byte counter for memory that host code allocates on behalf of scripts. It
// has its own lock, separate from the engine lock, so a host function running
// under the engine lock can update it.
class memory_tracker {
private:
    mutable std::mutex mtx;
    size_t used = 0;
    // 0 means unlimited
    size_t limit;

public:
    explicit memory_tracker(size_t limit = 0);

    // throws error (ek_memory) if the allocation would exceed the limit. The
    // counter is left unchanged in that case.
    void track_allocation(size_t bytes);
    // like track_allocation but reports failure by returning false
    bool try_allocation(size_t bytes);
    // saturates at 0
    void track_deallocation(size_t bytes);
    void reset();

    size_t current_total() const;
    size_t get_limit() const;
};

// Bookkeeping for the interpreter's allocator. The limit is only enforced
// while enforce is set, which the engine does only while script code runs.
// This keeps allocation failures out of host-side marshaling.
struct heap_state {
    size_t used = 0;
    size_t limit = 0;
    bool enforce = false;
};

// lua_Alloc implementation over heap_state
void* bounded_alloc(void* ud, void* ptr, size_t osize, size_t nsize);

// Sets enforcement for the lifetime of the object and restores the previous
// setting afterwards.
class heap_enforcement {
private:
    heap_state* heap;
    bool previous;

public:
    heap_enforcement(heap_state* heap, bool enforce)
        : heap{heap}
        , previous{heap->enforce} {
        heap->enforce = enforce;
    }
    ~heap_enforcement() {
        heap->enforce = previous;
    }
    heap_enforcement(const heap_enforcement&) = delete;
    heap_enforcement& operator=(const heap_enforcement&) = delete;
};

}

#endif
