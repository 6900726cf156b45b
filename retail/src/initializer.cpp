#include "retail/include/initializer.hpp"

#include <stdexcept>

#include "utils/logger.hpp"
#include "utils/utils.hpp"

namespace Initializer {

void load_products_table(RetailTables& t, uint32_t num_products) {
    for (ProductID product_id = 1; product_id <= num_products; product_id++) {
        Product p;
        p.generate(product_id);
        p.print();
        t.add_product(p);
    }
}

void load_vendor_prices_table(RetailTables& t, uint32_t num_products) {
    for (ProductID product_id = 1; product_id <= num_products; product_id++) {
        std::optional<Money> unit_price = t.lookup_unit_price(product_id);
        if (!unit_price) throw std::runtime_error("vendor prices loaded before products");
        Product p;
        p.product_id = product_id;
        p.unit_price = *unit_price;
        for (VendorID vendor_id = 1; vendor_id <= VENDORS; vendor_id++) {
            VendorPrice vp;
            vp.generate(vendor_id, p);
            vp.print();
            t.add_vendor_price(vp);
        }
    }
}

void load_expenses_table(RetailTables& t, uint32_t num_stores, Date d) {
    for (StoreID store_id = 1; store_id <= num_stores; store_id++) {
        t.add_expense(Expense{store_id, d, static_cast<Money>(urand_int(10000, 1000000))});
    }
}

void load_opening_stock(
    RetailTables& t, InventoryEngine& engine, uint32_t num_stores, uint32_t num_products, Date d) {
    for (StoreID store_id = 1; store_id <= num_stores; store_id++) {
        for (ProductID product_id = 1; product_id <= num_products; product_id++) {
            Delivery delivery;
            delivery.delivery_id = t.next_delivery_id();
            delivery.store_id = store_id;
            delivery.product_id = product_id;
            delivery.quantity = urand_int(MIN_OPENING_STOCK, MAX_OPENING_STOCK);
            delivery.vendor_id = urand_int(1, VENDORS);
            delivery.delivery_date = d;
            ReceiveResult r = t.receive_delivery(engine, delivery);
            if (r.kind == ReceiveResult::REJECTED) {
                throw std::runtime_error("opening delivery rejected: " + r.rejection.message());
            }
        }
    }
}

void load_all_tables(
    RetailTables& t, InventoryEngine& engine, uint32_t num_stores, uint32_t num_products,
    Date d) {
    load_products_table(t, num_products);
    load_vendor_prices_table(t, num_products);
    load_expenses_table(t, num_stores, d);
    load_opening_stock(t, engine, num_stores, num_products, d);
    LOG_INFO("loaded %u store(s) x %u product(s)", num_stores, num_products);
}

}  // namespace Initializer
