#pragma once

#include <cstddef>
#include <vector>

#include "retail/include/collaborators.hpp"
#include "retail/include/profitability_table.hpp"
#include "retail/include/record_layout.hpp"
#include "utils/date.hpp"

// Monthly batch: revenue, cost of goods, operating expense and net profit per reporting
// store. Holds no ledger locks; every input is a read-only scan of a fixed date range.
class ProfitabilityAggregator {
public:
    struct RunReport {
        size_t rows_written = 0;
        std::vector<StoreID> failed_stores;  // upstream lookups failed, row left as it was
    };

    ProfitabilityAggregator(const Collaborators& collab, ProfitabilityTable& table)
        : sales(collab.sales_history)
        , deliveries(collab.delivery_history)
        , products(collab.product_catalog)
        , vendors(collab.vendor_pricing)
        , expenses(collab.expense_ledger)
        , table(table) {}

    // Idempotent. Throws std::invalid_argument for a month outside 1..12.
    RunReport recompute(int year, unsigned month);

    // Throws UpstreamLookupFailure if any source cannot be read.
    StoreProfitability compute_store(StoreID store_id, int year, unsigned month) const;

private:
    Money sum_revenue(StoreID store_id, DateRange range) const;
    Money sum_cost_of_goods(StoreID store_id, DateRange range) const;

    const SalesHistory& sales;
    const DeliveryHistory& deliveries;
    const ProductCatalog& products;
    const VendorPricing& vendors;
    const ExpenseLedger& expenses;
    ProfitabilityTable& table;
};
