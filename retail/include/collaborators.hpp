#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "retail/include/record_layout.hpp"
#include "utils/date.hpp"

// Thrown by a collaborator that cannot answer right now (as opposed to "no such record").
class UpstreamLookupFailure : public std::runtime_error {
public:
    explicit UpstreamLookupFailure(const std::string& what)
        : std::runtime_error(what) {}
};

// Sale capture.
class SaleDirectory {
public:
    virtual ~SaleDirectory() = default;
    virtual std::optional<Sale> resolve_sale(SaleID sale_id) const = 0;
};

// Read-only view of committed sales.
class SalesHistory {
public:
    virtual ~SalesHistory() = default;
    virtual std::optional<Date> latest_sale_date(StoreID store_id, ProductID product_id) const = 0;
    virtual void for_each_sale_line(
        StoreID store_id, DateRange range, const std::function<void(const SaleLine&)>& func) const = 0;
};

// Read-only view of received deliveries.
class DeliveryHistory {
public:
    virtual ~DeliveryHistory() = default;
    virtual void for_each_delivery(
        StoreID store_id, DateRange range, const std::function<void(const Delivery&)>& func) const = 0;
};

// Product master data. nullopt means the product is unknown.
class ProductCatalog {
public:
    virtual ~ProductCatalog() = default;
    virtual std::optional<std::string> lookup_product_name(ProductID product_id) const = 0;
    virtual std::optional<Money> lookup_unit_price(ProductID product_id) const = 0;
};

// Vendor pricing. nullopt means the vendor does not supply the product.
class VendorPricing {
public:
    virtual ~VendorPricing() = default;
    virtual std::optional<Money> lookup_purchase_price(VendorID vendor_id, ProductID product_id) const = 0;
};

class ExpenseLedger {
public:
    virtual ~ExpenseLedger() = default;
    virtual Money sum_expenses(StoreID store_id, DateRange range) const = 0;
};

struct Collaborators {
    const SaleDirectory& sale_directory;
    const SalesHistory& sales_history;
    const DeliveryHistory& delivery_history;
    const ProductCatalog& product_catalog;
    const VendorPricing& vendor_pricing;
    const ExpenseLedger& expense_ledger;
};
