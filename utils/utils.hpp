#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>
#include <utility>

/**
 * Better strncpy().
 * out buffer will be null-terminated.
 * returned value is written size excluding the last null character.
 */
inline std::size_t copy_cstr(char* out, const char* in, std::size_t out_buf_size) {
    if (out_buf_size == 0) return 0;
    std::size_t i = 0;
    while (i < out_buf_size - 1) {
        if (in[i] == '\0') break;
        out[i] = in[i];
        i++;
    }
    out[i] = '\0';
    return i;
}

inline std::mt19937_64& get_rand() {
    thread_local std::mt19937_64 r(std::random_device{}());
    return r;
}

inline uint64_t urand_int(uint64_t min, uint64_t max) {
    return (get_rand()() % (max - min + 1)) + min;
}

inline size_t make_random_astring(char* out, size_t min_len, size_t max_len) {
    const char c[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    size_t len_c = sizeof(c) - 1;
    size_t len_out = urand_int(min_len, max_len);
    for (size_t i = 0; i < len_out; i++) {
        out[i] = c[urand_int(static_cast<size_t>(0), len_c - 1)];
    }
    out[len_out] = '\0';
    return len_out;
}

template <std::size_t N>
struct num {
    static const constexpr auto value = N;
};

template <class F, std::size_t... Is>
void constexpr_for(F func, std::index_sequence<Is...>) {
    (func(num<Is>{}), ...);
}

template <std::size_t N, typename F>
void constexpr_for(F func) {
    constexpr_for(func, std::make_index_sequence<N>());
}
