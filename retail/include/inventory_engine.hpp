#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "protocols/common/worker.hpp"
#include "protocols/rowlock/retail/transaction.hpp"
#include "retail/include/collaborators.hpp"
#include "retail/include/inventory_ledger.hpp"
#include "retail/include/ledger_event.hpp"
#include "retail/include/outcome.hpp"
#include "retail/include/profitability_aggregator.hpp"
#include "retail/include/profitability_table.hpp"
#include "retail/include/restock_alert_manager.hpp"
#include "retail/include/tx_runner.hpp"
#include "retail/include/tx_utils.hpp"

// Entry point of the inventory core. admit/commit/receive may be called from any number of
// threads; each runs as one single-key transaction on the calling thread. Ledger events are
// published after the transaction has released its lock, and a listener that throws is
// logged and counted without affecting the result of the mutation.
class InventoryEngine {
public:
    explicit InventoryEngine(const Collaborators& collab);

    InventoryEngine(const InventoryEngine&) = delete;
    InventoryEngine& operator=(const InventoryEngine&) = delete;

    // Stock reservation gate. Never mutates the ledger.
    AdmitResult admit(const SaleLine& line);

    // Decrement committer.
    CommitResult commit(const SaleLine& line);

    // Delivery accumulator.
    ReceiveResult receive(const Delivery& delivery);

    ProfitabilityAggregator::RunReport recompute(int year, unsigned month);

    size_t sweep_alerts();

    // Listeners are not owned and must be registered before concurrent use.
    void add_listener(LedgerEventListener* listener) { listeners.push_back(listener); }

    std::optional<Quantity> quantity(StoreID store_id, ProductID product_id) {
        return ledger.peek_quantity(store_id, product_id);
    }
    std::optional<RestockAlert> alert(ProductID product_id, StoreID store_id) const {
        return alerts.get_alert(product_id, store_id);
    }
    AlertState alert_state(ProductID product_id, StoreID store_id) const {
        return alerts.get_state(product_id, store_id);
    }
    std::vector<RestockAlert> open_alerts() const { return alerts.get_open_alerts(); }
    std::optional<StoreProfitability> profitability(int year, unsigned month, StoreID store_id) const {
        return profitability_table.get(StoreProfitability::Key::create_key(year, month, store_id));
    }

    Stat get_stat() const {
        std::lock_guard<std::mutex> guard(stat_latch);
        return stat;
    }

    InventoryLedger& get_ledger() { return ledger; }
    RestockAlertManager& get_alert_manager() { return alerts; }
    ProfitabilityTable& get_profitability_table() { return profitability_table; }

private:
    using Tx = Transaction<LedgerProtocol>;

    static Worker<LedgerProtocol>& get_worker();

    template <typename TxProfile>
    Status execute(
        TxProfile& p, typename TxProfile::Output& out, std::vector<RowChange>& changes) {
        Stat local;
        Status res;
        {
            Tx tx(get_worker(), ledger.get_index(), get_config().get_lock_wait_timeout());
            res = run_with_retry(p, tx, local, out);
            if (res == Status::SUCCESS) changes = tx.get_changes();
        }
        std::lock_guard<std::mutex> guard(stat_latch);
        stat.add(local);
        return res;
    }

    void publish(
        const std::vector<RowChange>& changes, LedgerEvent::Cause cause,
        std::optional<Date> sale_date = std::nullopt);
    void count_listener_failure();

    Collaborators collab;
    InventoryLedger ledger;
    RestockAlertManager alerts;
    ProfitabilityTable profitability_table;
    ProfitabilityAggregator aggregator;
    std::vector<LedgerEventListener*> listeners;

    mutable std::mutex stat_latch;
    Stat stat;
};
