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

// Stock reservation gate. Reads the row under its intent lock, checks it and releases the
// lock without writing anything.
class AdmitSaleLineTx {
public:
    AdmitSaleLineTx(const SaleDirectory& sales, const SaleLine& line) {
        input.generate(sales, line);
        input.print();
    }

    static constexpr char name[] = "AdmitSaleLine";
    static constexpr TxProfileID id = TxProfileID::ADMIT_SALE_LINE_TX;

    struct Input {
        SaleID sale_id;
        bool resolved;
        StoreID store_id;
        ProductID product_id;
        Quantity quantity;

        void generate(const SaleDirectory& sales, const SaleLine& line) {
            if (line.quantity <= 0) throw std::invalid_argument("sale line quantity must be positive");
            sale_id = line.sale_id;
            product_id = line.product_id;
            quantity = line.quantity;
            std::optional<Sale> s = sales.resolve_sale(line.sale_id);
            resolved = s.has_value();
            store_id = resolved ? s->store_id : 0;
        }

        void print() {
            LOG_TRACE(
                "admit: sale_id=%" PRIu64 " store_id=%" PRIu32 " product_id=%" PRIu32
                " quantity=%" PRId64 " resolved=%s",
                sale_id, store_id, product_id, quantity, resolved ? "t" : "f");
        }

    } input;

    struct Output {
        Rejection rejection;
        Quantity quantity_on_hand = 0;
    };

    enum AbortID : uint8_t {
        GET_INVENTORY = 0,
        PRECOMMIT = 1,
        MAX = 2,
    };

    static constexpr const char* abort_reason(AbortID a) {
        switch (a) {
        case AbortID::GET_INVENTORY: return "GET_INVENTORY";
        case AbortID::PRECOMMIT: return "PRECOMMIT";
        default: return "UNKNOWN";
        }
    }

    template <typename Transaction>
    Status run(Transaction& tx, Stat& stat, Output& out) {
        typename Transaction::Result res;
        TxHelper<Transaction> helper(tx, stat[TxProfileID::ADMIT_SALE_LINE_TX]);

        StoreID store_id = input.store_id;
        ProductID product_id = input.product_id;
        Quantity need = input.quantity;
        out = Output{};

        if (!input.resolved) {
            out.rejection = Rejection{RejectReason::NO_INVENTORY_ROW, store_id, product_id, 0, need};
            return helper.usr_abort();
        }

        const InventoryRow* inv = nullptr;
        InventoryRow::Key inv_key = InventoryRow::Key::create_key(store_id, product_id);
        res = tx.get_record_for_update(inv, inv_key);
        LOG_TRACE("res: %d", static_cast<int>(res));
        if (res == Transaction::Result::FAIL) {
            out.rejection = Rejection{RejectReason::NO_INVENTORY_ROW, store_id, product_id, 0, need};
            return helper.usr_abort();
        }
        if (not_succeeded(tx, res)) return helper.kill(res, GET_INVENTORY);

        out.quantity_on_hand = inv->quantity;
        if (inv->quantity < need) {
            out.rejection = Rejection{
                RejectReason::INSUFFICIENT_STOCK, store_id, product_id, inv->quantity, need};
            return helper.usr_abort();
        }

        // read-only: precommit only releases the lock
        return helper.commit(PRECOMMIT);
    }
};
