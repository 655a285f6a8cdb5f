#include "lbridge/memory.hpp"

#include <cstdlib>

namespace lbridge {

memory_tracker::memory_tracker(size_t limit)
    : limit{limit} {
}

void memory_tracker::track_allocation(size_t bytes) {
    if (!try_allocation(bytes)) {
        throw error{ek_memory, "Memory limit exceeded: "
            + std::to_string(bytes) + " more bytes requested with "
            + std::to_string(current_total()) + " of "
            + std::to_string(limit) + " in use"};
    }
}

bool memory_tracker::try_allocation(size_t bytes) {
    std::lock_guard<std::mutex> guard{mtx};
    // written this way to avoid overflow in used + bytes
    if (limit != 0 && (used > limit || bytes > limit - used)) {
        return false;
    }
    used += bytes;
    return true;
}

void memory_tracker::track_deallocation(size_t bytes) {
    std::lock_guard<std::mutex> guard{mtx};
    used = bytes > used ? 0 : used - bytes;
}

void memory_tracker::reset() {
    std::lock_guard<std::mutex> guard{mtx};
    used = 0;
}

size_t memory_tracker::current_total() const {
    std::lock_guard<std::mutex> guard{mtx};
    return used;
}

size_t memory_tracker::get_limit() const {
    return limit;
}

void* bounded_alloc(void* ud, void* ptr, size_t osize, size_t nsize) {
    auto heap = static_cast<heap_state*>(ud);
    // for new blocks osize encodes the object type rather than a size
    if (ptr == nullptr) {
        osize = 0;
    }
    if (nsize == 0) {
        free(ptr);
        heap->used -= osize;
        return nullptr;
    }
    if (heap->enforce && heap->limit != 0 && nsize > osize
            && heap->used - osize + nsize > heap->limit) {
        // the interpreter runs an emergency collection and tries again
        return nullptr;
    }
    auto res = realloc(ptr, nsize);
    if (res != nullptr) {
        heap->used = heap->used - osize + nsize;
    }
    return res;
}

}
