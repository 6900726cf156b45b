#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "retail/include/collaborators.hpp"
#include "retail/include/outcome.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"
#include "utils/date.hpp"

class InventoryEngine;

// In-memory sales, deliveries, products, vendor prices and expenses. Implements every
// collaborator interface the inventory core reads, and the two producer paths that feed it.
class RetailTables : public SaleDirectory,
                     public SalesHistory,
                     public DeliveryHistory,
                     public ProductCatalog,
                     public VendorPricing,
                     public ExpenseLedger {
public:
    RetailTables() = default;
    RetailTables(const RetailTables&) = delete;
    RetailTables& operator=(const RetailTables&) = delete;

    Collaborators get_collaborators() const {
        return Collaborators{*this, *this, *this, *this, *this, *this};
    }

    // Creates a sale header and returns its id.
    SaleID open_sale(StoreID store_id, Date sale_date);
    void add_sale(const Sale& sale);
    void add_sale_line(const SaleLine& line);
    void add_delivery(const Delivery& delivery);
    void add_product(const Product& product);
    void add_vendor_price(const VendorPrice& vp);
    void add_expense(const Expense& expense);

    DeliveryID next_delivery_id() { return ++last_delivery_id; }

    // Sale capture: the line passes the gate, is committed, and is recorded only if the
    // committer applied it.
    CommitResult capture_sale_line(InventoryEngine& engine, const SaleLine& line);

    // Delivery receiving: the delivery is recorded once the accumulator has applied it.
    ReceiveResult receive_delivery(InventoryEngine& engine, const Delivery& delivery);

    size_t num_sale_lines() const;
    size_t num_deliveries() const;

    std::optional<Sale> resolve_sale(SaleID sale_id) const override;

    std::optional<Date> latest_sale_date(StoreID store_id, ProductID product_id) const override;
    void for_each_sale_line(
        StoreID store_id, DateRange range,
        const std::function<void(const SaleLine&)>& func) const override;

    void for_each_delivery(
        StoreID store_id, DateRange range,
        const std::function<void(const Delivery&)>& func) const override;

    std::optional<std::string> lookup_product_name(ProductID product_id) const override;
    std::optional<Money> lookup_unit_price(ProductID product_id) const override;

    std::optional<Money> lookup_purchase_price(
        VendorID vendor_id, ProductID product_id) const override;

    Money sum_expenses(StoreID store_id, DateRange range) const override;

private:
    mutable std::mutex sales_latch;
    std::map<SaleID, Sale> sales;
    std::vector<SaleLine> sale_lines;
    std::atomic<SaleID> last_sale_id{0};

    mutable std::mutex deliveries_latch;
    std::vector<Delivery> deliveries;
    std::atomic<DeliveryID> last_delivery_id{0};

    mutable std::mutex products_latch;
    std::map<ProductID, Product> products;

    mutable std::mutex vendor_prices_latch;
    std::map<uint64_t, VendorPrice> vendor_prices;

    mutable std::mutex expenses_latch;
    std::vector<Expense> expenses;
};
