#pragma once

#include <cstdint>

// Identifies one unit of work. Also used as the owner word of IntentLock, so it is never 0.
struct TxID {
    union {
        uint64_t id = 0;
        struct {
            uint64_t tx_counter : 32;
            uint64_t thread_id : 32;
        };
    };

    TxID()
        : id(0) {}
    TxID(const TxID& txid)
        : id(txid.id) {}
    TxID(uint32_t thread_id, uint32_t tx_counter)
        : tx_counter(tx_counter)
        , thread_id(thread_id) {}

    TxID& operator=(const TxID& txid) {
        id = txid.id;
        return *this;
    }
};
