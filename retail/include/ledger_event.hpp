#pragma once

#include <cstdint>
#include <optional>

#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"
#include "utils/date.hpp"

// Published after a quantity change is installed and its row lock released.
struct LedgerEvent {
    enum Cause : uint8_t { SALE = 0, DELIVERY };

    InventoryKey key;
    StoreID store_id;
    ProductID product_id;
    Quantity old_quantity;
    Quantity new_quantity;
    Cause cause;
    bool created;  // first delivery for the pair
    std::optional<Date> sale_date;  // date of the sale behind a SALE event

    bool is_decrease() const { return new_quantity < old_quantity; }
};

class LedgerEventListener {
public:
    virtual ~LedgerEventListener() = default;
    virtual void on_ledger_event(const LedgerEvent& ev) = 0;
};
