#include "retail/include/record_layout.hpp"

#include <inttypes.h>

#include "retail/include/merge_policy.hpp"
#include "utils/logger.hpp"
#include "utils/utils.hpp"

void InventoryRow::print() const {
    LOG_TRACE(
        "[INVENTORY] store_id:%" PRIu32 " product_id:%" PRIu32 " quantity:%" PRId64, store_id,
        product_id, quantity);
}

void Product::generate(ProductID product_id_) {
    product_id = product_id_;
    make_random_astring(name, Product::MIN_NAME, Product::MAX_NAME);
    unit_price = urand_int(100, 10000);  // numeric(12, 2)
}

void Product::print() const {
    LOG_TRACE(
        "[PRODUCT] product_id:%" PRIu32 " name:%s unit_price:%" PRId64, product_id, name,
        unit_price);
}

void VendorPrice::generate(VendorID vendor_id_, const Product& p) {
    vendor_id = vendor_id_;
    product_id = p.product_id;
    purchase_price = p.unit_price * static_cast<Money>(urand_int(50, 90)) / 100;
}

void VendorPrice::print() const {
    LOG_TRACE(
        "[VENDOR_PRICE] vendor_id:%" PRIu32 " product_id:%" PRIu32 " purchase_price:%" PRId64,
        vendor_id, product_id, purchase_price);
}

void RestockAlert::print() const {
    std::string date = alert_date ? date_to_string(*alert_date) : std::string("null");
    LOG_TRACE(
        "[RESTOCK_ALERT] product_id:%" PRIu32 " store_id:%" PRIu32
        " product_name:%s quantity:%" PRId64 " alert_date:%s",
        product_id, store_id, product_name, quantity, date.c_str());
}

void StoreProfitability::print() const {
    std::string month = date_to_string(profit_month);
    LOG_TRACE(
        "[STORE_PROFITABILITY] id:%" PRIu64 " store_id:%" PRIu32 " profit_month:%s"
        " total_revenue:%" PRId64 " total_expense:%" PRId64 " net_profit:%" PRId64,
        store_profitability_id, store_id, month.c_str(), total_revenue, total_expense,
        net_profit);
}

InventoryRow AccumulateMerge::merge(const InventoryRow* existing, const InventoryRow& incoming) {
    if (existing == nullptr) return incoming;
    InventoryRow resolved = *existing;
    resolved.quantity += incoming.quantity;
    return resolved;
}
