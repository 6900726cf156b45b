#pragma once

#include <cstdint>

// Thin wrappers over the GCC __atomic builtins for plain (non std::atomic) fields.

template <typename T>
T load(const T& ref) {
    return __atomic_load_n(&ref, __ATOMIC_RELAXED);
}

template <typename T>
T load_acquire(const T& ref) {
    return __atomic_load_n(&ref, __ATOMIC_ACQUIRE);
}

template <typename T, typename T2>
void store_release(T& ref, T2 val) {
    __atomic_store_n(&ref, (T)val, __ATOMIC_RELEASE);
}

template <typename T, typename T2>
bool compare_exchange(T& m, T& before, T2 after) {
    return __atomic_compare_exchange_n(
        &m, &before, (T)after, false, __ATOMIC_ACQ_REL, __ATOMIC_ACQUIRE);
}

template <typename Int1, typename Int2>
Int1 fetch_add(Int1& m, Int2 v, int memorder = __ATOMIC_ACQ_REL) {
    return __atomic_fetch_add(&m, v, memorder);
}
