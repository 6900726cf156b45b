#pragma once

#include <cstdint>
#include <cstring>
#include <optional>

#include "utils/date.hpp"
#include "utils/utils.hpp"

using StoreID = uint32_t;
using ProductID = uint32_t;
using VendorID = uint32_t;
using SaleID = uint64_t;
using DeliveryID = uint64_t;

// Signed so that a subtraction that would oversell is observable before it is installed.
using Quantity = int64_t;

// Amounts are kept in cents, numeric(12, 2) in the upstream tables.
using Money = int64_t;

// Keys defined in record_key.hpp
struct InventoryKey;
struct RestockAlertKey;
struct StoreProfitabilityKey;
struct VendorPriceKey;

// Primary Key (store_id, product_id)
struct InventoryRow {
    using Key = InventoryKey;
    StoreID store_id;
    ProductID product_id;
    Quantity quantity;  // >= 0 for every installed row
    void print() const;
};

// External: sale header, owned by sale capture.
struct Sale {
    SaleID sale_id;
    StoreID store_id;
    Date sale_date;
};

// External: one line of a sale. Also used as the proposal checked by the admission gate.
struct SaleLine {
    SaleID sale_id;
    ProductID product_id;
    Quantity quantity;
};

// External: received delivery, owned by delivery receiving.
struct Delivery {
    DeliveryID delivery_id;
    StoreID store_id;
    ProductID product_id;
    Quantity quantity;
    VendorID vendor_id;
    Date delivery_date;
};

// External: product master data.
struct Product {
    static const int MIN_NAME = 8;
    static const int MAX_NAME = 63;
    ProductID product_id;
    char name[MAX_NAME + 1];
    Money unit_price;
    void generate(ProductID product_id_);
    void print() const;
};

// External: purchase price of a product from one vendor.
struct VendorPrice {
    using Key = VendorPriceKey;
    VendorID vendor_id;
    ProductID product_id;
    Money purchase_price;
    void generate(VendorID vendor_id_, const Product& p);
    void print() const;
};

// External: operating expense of a store.
struct Expense {
    StoreID store_id;
    Date expense_date;
    Money amount;
};

// Primary Key (product_id, store_id)
struct RestockAlert {
    using Key = RestockAlertKey;
    static const int MAX_NAME = Product::MAX_NAME;
    ProductID product_id;
    StoreID store_id;
    char product_name[MAX_NAME + 1];  // snapshot at open time, empty if the lookup failed
    Quantity quantity;                // snapshot at open time
    std::optional<Date> alert_date;   // most recent sale of the pair, the triggering one included
    void print() const;
};

// Primary Key store_profitability_id, packed from (year, month, store_id)
struct StoreProfitability {
    using Key = StoreProfitabilityKey;
    uint64_t store_profitability_id;
    StoreID store_id;
    Date profit_month;  // first day of the month
    Money total_revenue;
    Money total_expense;  // cost of goods + operating expense
    Money net_profit;     // total_revenue - total_expense

    bool operator==(const StoreProfitability& rhs) const noexcept {
        return store_profitability_id == rhs.store_profitability_id && store_id == rhs.store_id
            && profit_month == rhs.profit_month && total_revenue == rhs.total_revenue
            && total_expense == rhs.total_expense && net_profit == rhs.net_profit;
    }
    void print() const;
};
