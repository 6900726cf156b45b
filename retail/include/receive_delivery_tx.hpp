#pragma once

#include <inttypes.h>

#include <cstdint>
#include <stdexcept>

#include "retail/include/merge_policy.hpp"
#include "retail/include/outcome.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"
#include "retail/include/tx_utils.hpp"
#include "utils/logger.hpp"

// Delivery accumulator. Creates the row on the first delivery of a pair and adds to it
// afterwards; the merge happens under the row lock so no increment is lost.
class ReceiveDeliveryTx {
public:
    explicit ReceiveDeliveryTx(const Delivery& delivery) {
        input.generate(delivery);
        input.print();
    }

    static constexpr char name[] = "ReceiveDelivery";
    static constexpr TxProfileID id = TxProfileID::RECEIVE_DELIVERY_TX;

    struct Input {
        DeliveryID delivery_id;
        StoreID store_id;
        ProductID product_id;
        Quantity quantity;

        void generate(const Delivery& delivery) {
            if (delivery.quantity <= 0) throw std::invalid_argument("delivery quantity must be positive");
            delivery_id = delivery.delivery_id;
            store_id = delivery.store_id;
            product_id = delivery.product_id;
            quantity = delivery.quantity;
        }

        void print() {
            LOG_TRACE(
                "receive: delivery_id=%" PRIu64 " store_id=%" PRIu32 " product_id=%" PRIu32
                " quantity=%" PRId64,
                delivery_id, store_id, product_id, quantity);
        }

    } input;

    struct Output {
        Rejection rejection;
        bool is_new = false;
        Quantity quantity_before = 0;
        Quantity quantity_after = 0;
    };

    enum AbortID : uint8_t {
        PREPARE_UPSERT_INVENTORY = 0,
        FINISH_UPSERT_INVENTORY = 1,
        PRECOMMIT = 2,
        MAX = 3,
    };

    static constexpr const char* abort_reason(AbortID a) {
        switch (a) {
        case AbortID::PREPARE_UPSERT_INVENTORY: return "PREPARE_UPSERT_INVENTORY";
        case AbortID::FINISH_UPSERT_INVENTORY: return "FINISH_UPSERT_INVENTORY";
        case AbortID::PRECOMMIT: return "PRECOMMIT";
        default: return "UNKNOWN";
        }
    }

    template <typename Transaction>
    Status run(Transaction& tx, Stat& stat, Output& out) {
        typename Transaction::Result res;
        TxHelper<Transaction> helper(tx, stat[TxProfileID::RECEIVE_DELIVERY_TX]);

        InventoryRow incoming{input.store_id, input.product_id, input.quantity};
        out = Output{};

        InventoryRow* inv = nullptr;
        bool is_new = false;
        InventoryRow::Key inv_key = InventoryRow::Key::create_key(incoming);
        res = tx.prepare_record_for_upsert(inv, inv_key, is_new);
        LOG_TRACE("res: %d", static_cast<int>(res));
        if (not_succeeded(tx, res)) return helper.kill(res, PREPARE_UPSERT_INVENTORY);

        out.is_new = is_new;
        out.quantity_before = is_new ? 0 : inv->quantity;
        *inv = merge_record<InventoryRow>(is_new ? nullptr : inv, incoming);
        out.quantity_after = inv->quantity;
        res = tx.finish_upsert(inv);
        LOG_TRACE("res: %d", static_cast<int>(res));
        if (not_succeeded(tx, res)) return helper.kill(res, FINISH_UPSERT_INVENTORY);

        return helper.commit(PRECOMMIT);
    }
};
