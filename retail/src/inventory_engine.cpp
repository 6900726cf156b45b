#include "retail/include/inventory_engine.hpp"

#include <inttypes.h>

#include <atomic>
#include <exception>

#include "retail/include/admit_sale_line_tx.hpp"
#include "retail/include/commit_sale_line_tx.hpp"
#include "retail/include/config.hpp"
#include "retail/include/receive_delivery_tx.hpp"
#include "utils/logger.hpp"

InventoryEngine::InventoryEngine(const Collaborators& collab)
    : collab(collab)
    , ledger()
    , alerts(ledger, collab.sales_history, collab.product_catalog)
    , profitability_table()
    , aggregator(collab, profitability_table) {
    listeners.push_back(&alerts);
}

Worker<LedgerProtocol>& InventoryEngine::get_worker() {
    static std::atomic<uint32_t> next_worker_id{0};
    thread_local Worker<LedgerProtocol> worker(next_worker_id.fetch_add(1));
    return worker;
}

AdmitResult InventoryEngine::admit(const SaleLine& line) {
    AdmitSaleLineTx p(collab.sale_directory, line);
    AdmitSaleLineTx::Output out;
    std::vector<RowChange> changes;
    Status res = execute(p, out, changes);

    AdmitResult r;
    r.allowed = res == Status::SUCCESS;
    r.rejection = out.rejection;
    return r;
}

CommitResult InventoryEngine::commit(const SaleLine& line) {
    CommitSaleLineTx p(collab.sale_directory, line);
    CommitSaleLineTx::Output out;
    std::vector<RowChange> changes;
    Status res = execute(p, out, changes);

    CommitResult r;
    r.rejection = out.rejection;
    if (res != Status::SUCCESS) {
        r.applied = false;
        r.quantity_after = out.quantity_before;
        return r;
    }
    r.applied = true;
    r.quantity_after = out.quantity_after;
    publish(changes, LedgerEvent::SALE, p.input.sale_date);
    return r;
}

ReceiveResult InventoryEngine::receive(const Delivery& delivery) {
    ReceiveDeliveryTx p(delivery);
    ReceiveDeliveryTx::Output out;
    std::vector<RowChange> changes;
    Status res = execute(p, out, changes);

    ReceiveResult r;
    r.rejection = out.rejection;
    if (res != Status::SUCCESS) {
        r.kind = ReceiveResult::REJECTED;
        return r;
    }
    r.kind = out.is_new ? ReceiveResult::NEW_ROW : ReceiveResult::MERGED_ROW;
    r.quantity_after = out.quantity_after;
    publish(changes, LedgerEvent::DELIVERY);

    if (get_config().get_sweep_alerts_on_delivery_flag()) {
        try {
            alerts.sweep();
        } catch (const std::exception& e) {
            LOG_WARN("alert sweep failed: %s", e.what());
            count_listener_failure();
        }
    }
    return r;
}

ProfitabilityAggregator::RunReport InventoryEngine::recompute(int year, unsigned month) {
    return aggregator.recompute(year, month);
}

size_t InventoryEngine::sweep_alerts() {
    return alerts.sweep();
}

void InventoryEngine::publish(
    const std::vector<RowChange>& changes, LedgerEvent::Cause cause,
    std::optional<Date> sale_date) {
    for (const RowChange& c: changes) {
        LedgerEvent ev;
        ev.key = InventoryKey(c.key);
        ev.store_id = c.row.store_id;
        ev.product_id = c.row.product_id;
        ev.old_quantity = c.old_quantity;
        ev.new_quantity = c.row.quantity;
        ev.cause = cause;
        ev.created = c.created;
        ev.sale_date = sale_date;

        for (LedgerEventListener* l: listeners) {
            try {
                l->on_ledger_event(ev);
            } catch (const std::exception& e) {
                LOG_WARN(
                    "ledger event listener failed (store_id=%" PRIu32 " product_id=%" PRIu32
                    "): %s",
                    ev.store_id, ev.product_id, e.what());
                count_listener_failure();
            }
        }
    }
}

void InventoryEngine::count_listener_failure() {
    std::lock_guard<std::mutex> guard(stat_latch);
    stat.num_listener_failures++;
}
