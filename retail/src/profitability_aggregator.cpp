#include "retail/include/profitability_aggregator.hpp"

#include <inttypes.h>

#include <optional>
#include <stdexcept>

#include "retail/include/config.hpp"
#include "retail/include/record_key.hpp"
#include "utils/logger.hpp"

ProfitabilityAggregator::RunReport ProfitabilityAggregator::recompute(int year, unsigned month) {
    if (month < 1 || month > 12) throw std::invalid_argument("month must be in 1..12");
    if (year < 1 || year > 9999) throw std::invalid_argument("year must be in 1..9999");

    RunReport report;
    for (StoreID store_id: get_config().get_reporting_stores()) {
        try {
            StoreProfitability row = compute_store(store_id, year, month);
            table.upsert(row);
            ++report.rows_written;
            LOG_INFO(
                "profitability %04d-%02u store_id=%" PRIu32 " revenue=%" PRId64
                " expense=%" PRId64 " net=%" PRId64,
                year, month, store_id, row.total_revenue, row.total_expense, row.net_profit);
            row.print();
        } catch (const UpstreamLookupFailure& e) {
            LOG_ERROR(
                "profitability %04d-%02u store_id=%" PRIu32 " skipped: %s", year, month,
                store_id, e.what());
            report.failed_stores.push_back(store_id);
        }
    }
    return report;
}

StoreProfitability ProfitabilityAggregator::compute_store(
    StoreID store_id, int year, unsigned month) const {
    DateRange range = DateRange::month(year, month);

    Money revenue = sum_revenue(store_id, range);
    Money cost_of_goods = sum_cost_of_goods(store_id, range);
    Money operating = expenses.sum_expenses(store_id, range);

    StoreProfitability row;
    row.store_profitability_id =
        StoreProfitability::Key::create_key(year, month, store_id).get_raw_key();
    row.store_id = store_id;
    row.profit_month = range.from;
    row.total_revenue = revenue;
    row.total_expense = cost_of_goods + operating;
    row.net_profit = row.total_revenue - row.total_expense;
    return row;
}

// Lines of unknown products contribute nothing.
Money ProfitabilityAggregator::sum_revenue(StoreID store_id, DateRange range) const {
    Money total = 0;
    sales.for_each_sale_line(store_id, range, [&](const SaleLine& line) {
        std::optional<Money> price = products.lookup_unit_price(line.product_id);
        if (price) total += line.quantity * *price;
    });
    return total;
}

// Deliveries without a price for their (vendor, product) contribute nothing.
Money ProfitabilityAggregator::sum_cost_of_goods(StoreID store_id, DateRange range) const {
    Money total = 0;
    deliveries.for_each_delivery(store_id, range, [&](const Delivery& d) {
        std::optional<Money> price = vendors.lookup_purchase_price(d.vendor_id, d.product_id);
        if (price) total += d.quantity * *price;
    });
    return total;
}
