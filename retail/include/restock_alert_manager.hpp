#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "retail/include/collaborators.hpp"
#include "retail/include/inventory_ledger.hpp"
#include "retail/include/ledger_event.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"

enum class AlertState : uint8_t { NO_ALERT = 0, ALERT_OPEN };

const char* alert_state_name(AlertState state);

// Tracks the NO_ALERT / ALERT_OPEN lifecycle of every (product, store) pair.
//
// An alert opens when a decrease leaves a watched store's quantity below the open threshold,
// and closes once the ledger shows the recovery threshold or more. Opening is a latch: while
// the pair is ALERT_OPEN, further breaches neither reopen it nor refresh its snapshot.
// Product name and latest sale date are looked up outside the latch; a lookup that fails with
// UpstreamLookupFailure leaves the corresponding snapshot field empty.
class RestockAlertManager : public LedgerEventListener {
public:
    RestockAlertManager(
        InventoryLedger& ledger, const SalesHistory& sales, const ProductCatalog& products)
        : ledger(ledger)
        , sales(sales)
        , products(products) {}

    RestockAlertManager(const RestockAlertManager&) = delete;
    RestockAlertManager& operator=(const RestockAlertManager&) = delete;

    // Returns true if this call opened the alert. sale_date is the date of the sale that caused
    // the decrease; the snapshot takes it when no later sale of the pair is on record.
    bool open_check(
        StoreID store_id, ProductID product_id, Quantity new_quantity,
        std::optional<Date> sale_date = std::nullopt);

    // Returns true if this call closed the alert.
    bool close_check(StoreID store_id, ProductID product_id);

    // Reconciliation pass over every open alert. Returns the number of alerts closed.
    size_t sweep();

    AlertState get_state(ProductID product_id, StoreID store_id) const;
    std::optional<RestockAlert> get_alert(ProductID product_id, StoreID store_id) const;
    std::vector<RestockAlert> get_open_alerts() const;
    size_t num_open_alerts() const;

    // Decreases run the open check, increases the close check.
    void on_ledger_event(const LedgerEvent& ev) override;

private:
    struct Entry {
        AlertState state = AlertState::NO_ALERT;
        RestockAlert alert;
    };

    bool is_open(RestockAlertKey key) const;
    bool has_recovered(const RestockAlert& alert, Quantity recovery_threshold);
    RestockAlert make_snapshot(
        StoreID store_id, ProductID product_id, Quantity quantity, std::optional<Date> sale_date);

    InventoryLedger& ledger;
    const SalesHistory& sales;
    const ProductCatalog& products;

    mutable std::mutex latch;
    std::map<RestockAlertKey, Entry> entries;
};
