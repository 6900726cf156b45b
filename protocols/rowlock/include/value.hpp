#pragma once

#include <cstdint>

#include "protocols/common/intent_lock.hpp"
#include "retail/include/record_layout.hpp"
#include "utils/atomic_wrapper.hpp"

// One ledger slot. The row is written only by the lock holder; quantity and present are
// additionally published with release stores so that peek() may read them without the lock.
struct Value {
    Value()
        : lock()
        , row{0, 0, 0}
        , present(false) {}

    alignas(64) IntentLock lock;
    InventoryRow row;
    bool present;  // false until the first committed insert

    bool peek(Quantity& quantity) const {
        if (!load_acquire(present)) return false;
        quantity = load_acquire(row.quantity);
        return true;
    }
};
