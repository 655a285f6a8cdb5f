#ifndef __LBRIDGE_ARENA_HPP
#define __LBRIDGE_ARENA_HPP

#include "lbridge/base.hpp"

#include <vector>

namespace lbridge {

// Generation-checked slot table. insert() returns a packed id holding the slot
// index in the low 32 bits and the slot's generation in the high 32 bits.
// Removing an object bumps the generation, so stale ids never find the slot's
// next occupant. Generations start at 1, hence 0 is never a valid id.
template<typename T>
class slot_arena {
private:
    static constexpr u32 no_slot = 0xffffffff;

    struct slot {
        u32 generation = 1;
        // index of the next free slot while this one is on the free list
        u32 next_free = no_slot;
        optional<T> obj;
    };
    std::vector<slot> slots;
    // head of the free list, threaded through the unused slots
    u32 first_free = no_slot;
    u32 count = 0;

    slot* find(u64 id) {
        auto index = static_cast<u32>(id & 0xffffffff);
        auto generation = static_cast<u32>(id >> 32);
        if (index >= slots.size()) {
            return nullptr;
        }
        auto& s = slots[index];
        if (s.generation != generation || !s.obj.has_value()) {
            return nullptr;
        }
        return &s;
    }

public:
    static u64 pack(u32 index, u32 generation) {
        return (static_cast<u64>(generation) << 32) | index;
    }

    u64 insert(T obj) {
        u32 index;
        if (first_free == no_slot) {
            index = static_cast<u32>(slots.size());
            slots.emplace_back();
        } else {
            index = first_free;
            first_free = slots[index].next_free;
        }
        auto& s = slots[index];
        s.obj.emplace(std::move(obj));
        s.next_free = no_slot;
        ++count;
        return pack(index, s.generation);
    }

    // returns nullptr for ids that were removed or never issued
    T* get(u64 id) {
        auto s = find(id);
        return s == nullptr ? nullptr : &*s->obj;
    }

    bool contains(u64 id) {
        return find(id) != nullptr;
    }

    // returns false for stale ids
    bool remove(u64 id) {
        auto s = find(id);
        if (s == nullptr) {
            return false;
        }
        s->obj.reset();
        // a slot whose generation would wrap is retired instead of reused
        if (++s->generation != 0) {
            s->next_free = first_free;
            first_free = static_cast<u32>(id & 0xffffffff);
        }
        --count;
        return true;
    }

    u32 size() const {
        return count;
    }

    // call fn(id, obj) for every live object
    template<typename F>
    void for_each(F fn) {
        for (u32 i = 0; i < slots.size(); ++i) {
            auto& s = slots[i];
            if (s.obj.has_value()) {
                fn(pack(i, s.generation), *s.obj);
            }
        }
    }

    // removes every object. Generations are kept so old ids stay stale.
    void clear() {
        for (u32 i = 0; i < slots.size(); ++i) {
            if (slots[i].obj.has_value()) {
                remove(pack(i, slots[i].generation));
            }
        }
    }
};

}

#endif
