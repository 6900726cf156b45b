#include "retail/include/retail_tables.hpp"

#include "retail/include/inventory_engine.hpp"

SaleID RetailTables::open_sale(StoreID store_id, Date sale_date) {
    SaleID id = ++last_sale_id;
    std::lock_guard<std::mutex> guard(sales_latch);
    sales.emplace(id, Sale{id, store_id, sale_date});
    return id;
}

void RetailTables::add_sale(const Sale& sale) {
    std::lock_guard<std::mutex> guard(sales_latch);
    sales[sale.sale_id] = sale;
    SaleID last = last_sale_id.load();
    while (last < sale.sale_id && !last_sale_id.compare_exchange_weak(last, sale.sale_id)) {
    }
}

void RetailTables::add_sale_line(const SaleLine& line) {
    std::lock_guard<std::mutex> guard(sales_latch);
    sale_lines.push_back(line);
}

void RetailTables::add_delivery(const Delivery& delivery) {
    std::lock_guard<std::mutex> guard(deliveries_latch);
    deliveries.push_back(delivery);
}

void RetailTables::add_product(const Product& product) {
    std::lock_guard<std::mutex> guard(products_latch);
    products[product.product_id] = product;
}

void RetailTables::add_vendor_price(const VendorPrice& vp) {
    std::lock_guard<std::mutex> guard(vendor_prices_latch);
    vendor_prices[VendorPrice::Key::create_key(vp).get_raw_key()] = vp;
}

void RetailTables::add_expense(const Expense& expense) {
    std::lock_guard<std::mutex> guard(expenses_latch);
    expenses.push_back(expense);
}

CommitResult RetailTables::capture_sale_line(InventoryEngine& engine, const SaleLine& line) {
    AdmitResult admitted = engine.admit(line);
    if (!admitted.allowed) {
        CommitResult r;
        r.applied = false;
        r.quantity_after = admitted.rejection.have;
        r.rejection = admitted.rejection;
        return r;
    }
    CommitResult r = engine.commit(line);
    if (r.applied) add_sale_line(line);
    return r;
}

ReceiveResult RetailTables::receive_delivery(InventoryEngine& engine, const Delivery& delivery) {
    ReceiveResult r = engine.receive(delivery);
    if (r.kind != ReceiveResult::REJECTED) add_delivery(delivery);
    return r;
}

size_t RetailTables::num_sale_lines() const {
    std::lock_guard<std::mutex> guard(sales_latch);
    return sale_lines.size();
}

size_t RetailTables::num_deliveries() const {
    std::lock_guard<std::mutex> guard(deliveries_latch);
    return deliveries.size();
}

std::optional<Sale> RetailTables::resolve_sale(SaleID sale_id) const {
    std::lock_guard<std::mutex> guard(sales_latch);
    auto it = sales.find(sale_id);
    if (it == sales.end()) return std::nullopt;
    return it->second;
}

std::optional<Date> RetailTables::latest_sale_date(StoreID store_id, ProductID product_id) const {
    std::optional<Date> latest;
    std::lock_guard<std::mutex> guard(sales_latch);
    for (const SaleLine& line: sale_lines) {
        if (line.product_id != product_id) continue;
        auto it = sales.find(line.sale_id);
        if (it == sales.end() || it->second.store_id != store_id) continue;
        if (!latest || *latest < it->second.sale_date) latest = it->second.sale_date;
    }
    return latest;
}

void RetailTables::for_each_sale_line(
    StoreID store_id, DateRange range, const std::function<void(const SaleLine&)>& func) const {
    std::vector<SaleLine> matched;
    {
        std::lock_guard<std::mutex> guard(sales_latch);
        for (const SaleLine& line: sale_lines) {
            auto it = sales.find(line.sale_id);
            if (it == sales.end()) continue;
            if (it->second.store_id != store_id || !range.contains(it->second.sale_date)) continue;
            matched.push_back(line);
        }
    }
    for (const SaleLine& line: matched) func(line);
}

void RetailTables::for_each_delivery(
    StoreID store_id, DateRange range, const std::function<void(const Delivery&)>& func) const {
    std::vector<Delivery> matched;
    {
        std::lock_guard<std::mutex> guard(deliveries_latch);
        for (const Delivery& d: deliveries) {
            if (d.store_id == store_id && range.contains(d.delivery_date)) matched.push_back(d);
        }
    }
    for (const Delivery& d: matched) func(d);
}

std::optional<std::string> RetailTables::lookup_product_name(ProductID product_id) const {
    std::lock_guard<std::mutex> guard(products_latch);
    auto it = products.find(product_id);
    if (it == products.end()) return std::nullopt;
    return std::string(it->second.name);
}

std::optional<Money> RetailTables::lookup_unit_price(ProductID product_id) const {
    std::lock_guard<std::mutex> guard(products_latch);
    auto it = products.find(product_id);
    if (it == products.end()) return std::nullopt;
    return it->second.unit_price;
}

std::optional<Money> RetailTables::lookup_purchase_price(
    VendorID vendor_id, ProductID product_id) const {
    std::lock_guard<std::mutex> guard(vendor_prices_latch);
    auto it = vendor_prices.find(VendorPrice::Key::create_key(vendor_id, product_id).get_raw_key());
    if (it == vendor_prices.end()) return std::nullopt;
    return it->second.purchase_price;
}

Money RetailTables::sum_expenses(StoreID store_id, DateRange range) const {
    Money total = 0;
    std::lock_guard<std::mutex> guard(expenses_latch);
    for (const Expense& e: expenses) {
        if (e.store_id == store_id && range.contains(e.expense_date)) total += e.amount;
    }
    return total;
}
