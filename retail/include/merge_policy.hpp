#pragma once

#include "retail/include/record_layout.hpp"

// How an incoming record is folded into the stored one. The policy belongs to the entity:
// deliveries accumulate into stock, a profitability recompute replaces the whole row.

struct AccumulateMerge {
    static InventoryRow merge(const InventoryRow* existing, const InventoryRow& incoming);
};

struct OverwriteMerge {
    template <typename Record>
    static Record merge([[maybe_unused]] const Record* existing, const Record& incoming) {
        return incoming;
    }
};

template <typename Record>
struct MergePolicy;

template <>
struct MergePolicy<InventoryRow> {
    using type = AccumulateMerge;
};

template <>
struct MergePolicy<StoreProfitability> {
    using type = OverwriteMerge;
};

template <typename Record>
Record merge_record(const Record* existing, const Record& incoming) {
    return MergePolicy<Record>::type::merge(existing, incoming);
}
