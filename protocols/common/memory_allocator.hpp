#pragma once

#include <cstddef>
#include <new>

#include <mimalloc.h>

// Ledger slots carry a cache-line aligned lock, so they come from mimalloc's aligned heap.
class MemoryAllocator {
public:
    static void* aligned_allocate(size_t size, size_t alignment = 64) {
        void* ptr = mi_malloc_aligned(size, alignment);
        if (ptr == nullptr) throw std::bad_alloc();
        return ptr;
    }

    static void deallocate(void* ptr) { mi_free(ptr); }
};
