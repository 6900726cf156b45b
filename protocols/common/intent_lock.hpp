#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>

#include "utils/atomic_wrapper.hpp"
#include "utils/logger.hpp"

// Exclusive read-with-intent-to-write lock guarding one ledger row.
// The owner word holds the raw TxID of the holder, 0 when free.
class IntentLock {
public:
    IntentLock()
        : owner(0) {}

    bool try_lock(uint64_t txid) {
        if (txid == 0) throw std::runtime_error("invalid lock owner");
        uint64_t expected = 0;
        return compare_exchange(owner, expected, txid);
    }

    // Spins (yielding every few rounds) until the lock is free or the timeout elapses.
    bool try_lock_for(uint64_t txid, std::chrono::microseconds timeout) {
        if (try_lock(txid)) return true;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        uint32_t rounds = 0;
        while (true) {
            if (load_acquire(owner) == 0 && try_lock(txid)) return true;
            if (++rounds % 32 == 0) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    LOG_DEBUG("lock wait timed out (tx: %lu, owner: %lu)", txid, load(owner));
                    return false;
                }
                std::this_thread::yield();
            }
        }
    }

    void unlock(uint64_t txid) {
        uint64_t expected = txid;
        if (!compare_exchange(owner, expected, 0)) {
            throw std::runtime_error("No exclusive lock to unlock");
        }
    }

    bool is_locked() const { return load_acquire(owner) != 0; }

    uint64_t get_owner() const { return load_acquire(owner); }

private:
    uint64_t owner;
};
