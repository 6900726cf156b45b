#pragma once

#include <inttypes.h>

#include <cstdint>
#include <optional>
#include <stdexcept>

#include "retail/include/collaborators.hpp"
#include "retail/include/outcome.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"
#include "retail/include/tx_utils.hpp"
#include "utils/logger.hpp"

// Decrement committer. Repeats the gate's checks under the row lock and subtracts in the same
// critical section, so concurrent sales of one key are totally ordered.
class CommitSaleLineTx {
public:
    CommitSaleLineTx(const SaleDirectory& sales, const SaleLine& line) {
        input.generate(sales, line);
        input.print();
    }

    static constexpr char name[] = "CommitSaleLine";
    static constexpr TxProfileID id = TxProfileID::COMMIT_SALE_LINE_TX;

    struct Input {
        SaleID sale_id;
        bool resolved;
        StoreID store_id;
        ProductID product_id;
        Quantity quantity;
        std::optional<Date> sale_date;

        void generate(const SaleDirectory& sales, const SaleLine& line) {
            if (line.quantity <= 0) throw std::invalid_argument("sale line quantity must be positive");
            sale_id = line.sale_id;
            product_id = line.product_id;
            quantity = line.quantity;
            std::optional<Sale> s = sales.resolve_sale(line.sale_id);
            resolved = s.has_value();
            store_id = resolved ? s->store_id : 0;
            if (resolved) sale_date = s->sale_date;
        }

        void print() {
            LOG_TRACE(
                "commit: sale_id=%" PRIu64 " store_id=%" PRIu32 " product_id=%" PRIu32
                " quantity=%" PRId64 " resolved=%s",
                sale_id, store_id, product_id, quantity, resolved ? "t" : "f");
        }

    } input;

    struct Output {
        Rejection rejection;
        Quantity quantity_before = 0;
        Quantity quantity_after = 0;
    };

    enum AbortID : uint8_t {
        PREPARE_UPDATE_INVENTORY = 0,
        FINISH_UPDATE_INVENTORY = 1,
        PRECOMMIT = 2,
        MAX = 3,
    };

    static constexpr const char* abort_reason(AbortID a) {
        switch (a) {
        case AbortID::PREPARE_UPDATE_INVENTORY: return "PREPARE_UPDATE_INVENTORY";
        case AbortID::FINISH_UPDATE_INVENTORY: return "FINISH_UPDATE_INVENTORY";
        case AbortID::PRECOMMIT: return "PRECOMMIT";
        default: return "UNKNOWN";
        }
    }

    template <typename Transaction>
    Status run(Transaction& tx, Stat& stat, Output& out) {
        typename Transaction::Result res;
        TxHelper<Transaction> helper(tx, stat[TxProfileID::COMMIT_SALE_LINE_TX]);

        StoreID store_id = input.store_id;
        ProductID product_id = input.product_id;
        Quantity need = input.quantity;
        out = Output{};

        if (!input.resolved) {
            out.rejection = Rejection{RejectReason::NO_INVENTORY_ROW, store_id, product_id, 0, need};
            return helper.usr_abort();
        }

        InventoryRow* inv = nullptr;
        InventoryRow::Key inv_key = InventoryRow::Key::create_key(store_id, product_id);
        res = tx.prepare_record_for_update(inv, inv_key);
        LOG_TRACE("res: %d", static_cast<int>(res));
        if (res == Transaction::Result::FAIL) {
            out.rejection = Rejection{RejectReason::NO_INVENTORY_ROW, store_id, product_id, 0, need};
            return helper.usr_abort();
        }
        if (not_succeeded(tx, res)) return helper.kill(res, PREPARE_UPDATE_INVENTORY);

        out.quantity_before = inv->quantity;
        if (inv->quantity < need) {
            out.rejection = Rejection{
                RejectReason::INSUFFICIENT_STOCK, store_id, product_id, inv->quantity, need};
            return helper.usr_abort();
        }
        inv->quantity -= need;
        out.quantity_after = inv->quantity;
        res = tx.finish_update(inv);
        LOG_TRACE("res: %d", static_cast<int>(res));
        if (not_succeeded(tx, res)) return helper.kill(res, FINISH_UPDATE_INVENTORY);

        return helper.commit(PRECOMMIT);
    }
};
