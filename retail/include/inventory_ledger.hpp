#pragma once

#include <cstddef>
#include <optional>

#include "indexes/sharded_index.hpp"
#include "protocols/rowlock/include/rowlock.hpp"
#include "protocols/rowlock/include/value.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"

using LedgerIndex = ShardedIndex<Value>;
using LedgerProtocol = RowLock<LedgerIndex>;

// Authoritative quantity per (store, product). Writes go through LedgerProtocol transactions;
// the accessors here are lock-free peeks at the last installed value.
class InventoryLedger {
public:
    InventoryLedger() = default;
    InventoryLedger(const InventoryLedger&) = delete;
    InventoryLedger& operator=(const InventoryLedger&) = delete;

    LedgerIndex& get_index() { return idx; }

    std::optional<Quantity> peek_quantity(StoreID store_id, ProductID product_id) {
        Value* val = nullptr;
        InventoryKey key = InventoryKey::create_key(store_id, product_id);
        if (idx.find(key.get_raw_key(), val) == LedgerIndex::Result::NOT_FOUND) {
            return std::nullopt;
        }
        Quantity q = 0;
        if (!val->peek(q)) return std::nullopt;
        return q;
    }

    // Calls func(const InventoryRow&) for every installed row, ordered by key.
    template <typename Func>
    void for_each_row(Func&& func) {
        for (auto& [raw_key, val]: idx.get_all()) {
            Quantity q = 0;
            if (!val->peek(q)) continue;
            InventoryKey key(raw_key);
            InventoryRow row{
                static_cast<StoreID>(key.store_id), static_cast<ProductID>(key.product_id), q};
            func(row);
        }
    }

    size_t num_rows() {
        size_t n = 0;
        for_each_row([&n](const InventoryRow&) { ++n; });
        return n;
    }

private:
    LedgerIndex idx;
};
