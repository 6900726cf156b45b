#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "protocols/common/transaction_id.hpp"
#include "retail/include/config.hpp"
#include "retail/include/inventory_engine.hpp"
#include "retail/include/retail_tables.hpp"
#include "utils/date.hpp"
#include "utils/utils.hpp"

class SaleLineTxTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_mutable_config() = Config();
        engine = std::make_unique<InventoryEngine>(tables.get_collaborators());
    }

    void stock(StoreID store_id, ProductID product_id, Quantity quantity) {
        Delivery d{
            tables.next_delivery_id(), store_id, product_id, quantity, 1, make_date(2024, 3, 1)};
        ASSERT_NE(tables.receive_delivery(*engine, d).kind, ReceiveResult::REJECTED);
    }

    SaleLine line(StoreID store_id, ProductID product_id, Quantity quantity) {
        return SaleLine{tables.open_sale(store_id, make_date(2024, 3, 10)), product_id, quantity};
    }

    // store 3 is outside the alert watch set
    static constexpr StoreID store = 3;

    RetailTables tables;
    std::unique_ptr<InventoryEngine> engine;
};

TEST_F(SaleLineTxTest, AdmitAllowsWhenStockSuffices) {
    stock(store, 1, 10);
    AdmitResult r = engine->admit(line(store, 1, 10));
    EXPECT_TRUE(r.allowed);
    EXPECT_FALSE(r.rejection.is_rejected());
    EXPECT_EQ(engine->quantity(store, 1), 10);
}

TEST_F(SaleLineTxTest, AdmitRejectsMissingRow) {
    AdmitResult r = engine->admit(line(store, 9, 1));
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.rejection.reason, RejectReason::NO_INVENTORY_ROW);
    EXPECT_FALSE(r.rejection.is_retryable());
    EXPECT_EQ(r.rejection.message(), "No inventory row for store_id=3 product_id=9");
    EXPECT_FALSE(engine->quantity(store, 9).has_value());
}

TEST_F(SaleLineTxTest, AdmitRejectsUnknownSale) {
    stock(store, 1, 10);
    AdmitResult r = engine->admit(SaleLine{987654321, 1, 1});
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.rejection.reason, RejectReason::NO_INVENTORY_ROW);
}

TEST_F(SaleLineTxTest, AdmitRejectsInsufficientStockWithNumbers) {
    stock(store, 1, 5);
    AdmitResult r = engine->admit(line(store, 1, 6));
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.rejection.reason, RejectReason::INSUFFICIENT_STOCK);
    EXPECT_EQ(r.rejection.have, 5);
    EXPECT_EQ(r.rejection.need, 6);
    EXPECT_EQ(r.rejection.message(), "Insufficient stock: have 5, need 6 (store 3, product 1)");
    EXPECT_EQ(engine->quantity(store, 1), 5);
}

TEST_F(SaleLineTxTest, AdmitNeverMutatesAndReleasesLock) {
    stock(store, 1, 5);
    for (int i = 0; i < 10; i++) EXPECT_TRUE(engine->admit(line(store, 1, 5)).allowed);
    EXPECT_EQ(engine->quantity(store, 1), 5);

    CommitResult c = engine->commit(line(store, 1, 5));
    EXPECT_TRUE(c.applied);
    EXPECT_EQ(c.quantity_after, 0);
}

TEST_F(SaleLineTxTest, CommitSubtracts) {
    stock(store, 1, 10);
    CommitResult r = engine->commit(line(store, 1, 4));
    EXPECT_TRUE(r.applied);
    EXPECT_EQ(r.quantity_after, 6);
    EXPECT_EQ(engine->quantity(store, 1), 6);

    Stat stat = engine->get_stat();
    EXPECT_EQ(stat[TxProfileID::COMMIT_SALE_LINE_TX].num_commits, 1u);
    EXPECT_EQ(stat[TxProfileID::RECEIVE_DELIVERY_TX].num_commits, 1u);
}

TEST_F(SaleLineTxTest, CommitRevalidatesAfterAdmission) {
    stock(store, 1, 5);
    SaleLine a = line(store, 1, 3);
    SaleLine b = line(store, 1, 3);
    EXPECT_TRUE(engine->admit(a).allowed);
    EXPECT_TRUE(engine->admit(b).allowed);

    EXPECT_TRUE(engine->commit(a).applied);
    CommitResult r = engine->commit(b);
    EXPECT_FALSE(r.applied);
    EXPECT_EQ(r.rejection.reason, RejectReason::INSUFFICIENT_STOCK);
    EXPECT_EQ(r.rejection.have, 2);
    EXPECT_EQ(r.rejection.need, 3);
    EXPECT_EQ(engine->quantity(store, 1), 2);

    Stat stat = engine->get_stat();
    EXPECT_EQ(stat[TxProfileID::COMMIT_SALE_LINE_TX].num_usr_aborts, 1u);
}

TEST_F(SaleLineTxTest, CommitRejectsMissingRowWithoutCreatingIt) {
    CommitResult r = engine->commit(line(store, 2, 1));
    EXPECT_FALSE(r.applied);
    EXPECT_EQ(r.rejection.reason, RejectReason::NO_INVENTORY_ROW);
    EXPECT_EQ(engine->get_ledger().num_rows(), 0u);
}

TEST_F(SaleLineTxTest, RejectsNonPositiveQuantity) {
    stock(store, 1, 5);
    EXPECT_THROW(engine->commit(line(store, 1, 0)), std::invalid_argument);
    EXPECT_THROW(engine->admit(line(store, 1, -2)), std::invalid_argument);
    EXPECT_EQ(engine->quantity(store, 1), 5);
}

TEST_F(SaleLineTxTest, HeldLockSurfacesAsContention) {
    Config& c = get_mutable_config();
    c.set_lock_wait_timeout(std::chrono::microseconds(200));
    c.set_max_lock_retries(2);
    stock(store, 1, 5);

    Value* val = nullptr;
    InventoryKey key = InventoryKey::create_key(store, 1);
    ASSERT_EQ(engine->get_ledger().get_index().find(key.get_raw_key(), val), LedgerIndex::Result::OK);
    uint64_t foreign = TxID(0xFFFFFFFF, 1).id;
    ASSERT_TRUE(val->lock.try_lock(foreign));

    CommitResult r = engine->commit(line(store, 1, 1));
    EXPECT_FALSE(r.applied);
    EXPECT_EQ(r.rejection.reason, RejectReason::LOCK_CONTENTION);
    EXPECT_TRUE(r.rejection.is_retryable());
    EXPECT_EQ(engine->quantity(store, 1), 5);

    Stat stat = engine->get_stat();
    EXPECT_EQ(stat[TxProfileID::COMMIT_SALE_LINE_TX].num_sys_aborts, 3u);
    EXPECT_EQ(stat[TxProfileID::COMMIT_SALE_LINE_TX].num_gave_up, 1u);

    val->lock.unlock(foreign);
    EXPECT_TRUE(engine->commit(line(store, 1, 1)).applied);
    EXPECT_EQ(engine->quantity(store, 1), 4);
}

TEST_F(SaleLineTxTest, GateWaitsOnHeldLock) {
    Config& c = get_mutable_config();
    c.set_lock_wait_timeout(std::chrono::microseconds(200));
    c.set_max_lock_retries(1);
    stock(store, 1, 5);

    Value* val = nullptr;
    InventoryKey key = InventoryKey::create_key(store, 1);
    ASSERT_EQ(engine->get_ledger().get_index().find(key.get_raw_key(), val), LedgerIndex::Result::OK);
    uint64_t foreign = TxID(0xFFFFFFFF, 2).id;
    ASSERT_TRUE(val->lock.try_lock(foreign));

    AdmitResult r = engine->admit(line(store, 1, 1));
    EXPECT_FALSE(r.allowed);
    EXPECT_EQ(r.rejection.reason, RejectReason::LOCK_CONTENTION);
    EXPECT_EQ(r.rejection.store_id, store);
    EXPECT_EQ(r.rejection.product_id, 1u);

    Stat stat = engine->get_stat();
    EXPECT_EQ(stat[TxProfileID::ADMIT_SALE_LINE_TX].num_sys_aborts, 2u);
    EXPECT_EQ(stat[TxProfileID::ADMIT_SALE_LINE_TX].num_gave_up, 1u);

    CommitResult captured = tables.capture_sale_line(*engine, line(store, 1, 1));
    EXPECT_FALSE(captured.applied);
    EXPECT_EQ(captured.rejection.reason, RejectReason::LOCK_CONTENTION);
    EXPECT_EQ(tables.num_sale_lines(), 0u);

    val->lock.unlock(foreign);
    EXPECT_TRUE(engine->admit(line(store, 1, 1)).allowed);
    EXPECT_EQ(engine->quantity(store, 1), 5);
}

TEST_F(SaleLineTxTest, CaptureRecordsOnlyAppliedLines) {
    stock(store, 1, 5);
    EXPECT_TRUE(tables.capture_sale_line(*engine, line(store, 1, 4)).applied);
    CommitResult r = tables.capture_sale_line(*engine, line(store, 1, 4));
    EXPECT_FALSE(r.applied);
    EXPECT_EQ(r.rejection.reason, RejectReason::INSUFFICIENT_STOCK);
    EXPECT_FALSE(tables.capture_sale_line(*engine, line(store, 8, 1)).applied);
    EXPECT_EQ(tables.num_sale_lines(), 1u);
    EXPECT_EQ(engine->quantity(store, 1), 1);
}

TEST_F(SaleLineTxTest, OversellRace) {
    const ProductID num_rounds = 100;
    for (ProductID p = 1; p <= num_rounds; p++) stock(store, p, 5);

    for (ProductID p = 1; p <= num_rounds; p++) {
        SaleLine a = line(store, p, 3);
        SaleLine b = line(store, p, 3);
        std::atomic<bool> go{false};
        CommitResult ra, rb;
        std::thread ta([&] {
            while (!go.load()) std::this_thread::yield();
            ra = engine->commit(a);
        });
        std::thread tb([&] {
            while (!go.load()) std::this_thread::yield();
            rb = engine->commit(b);
        });
        go.store(true);
        ta.join();
        tb.join();

        ASSERT_NE(ra.applied, rb.applied);
        const CommitResult& loser = ra.applied ? rb : ra;
        EXPECT_EQ(loser.rejection.reason, RejectReason::INSUFFICIENT_STOCK);
        EXPECT_EQ(loser.rejection.have, 2);
        EXPECT_EQ(engine->quantity(store, p), 2);
    }
}

TEST_F(SaleLineTxTest, ConcurrentMixNeverGoesNegative) {
    get_mutable_config().set_lock_wait_timeout(std::chrono::milliseconds(50));
    const ProductID num_products = 4;
    const Quantity opening = 50;
    for (ProductID p = 1; p <= num_products; p++) stock(store, p, opening);

    const int num_threads = 8;
    const int ops = 2000;
    std::vector<Quantity> sold(num_threads, 0);
    std::vector<Quantity> delivered(num_threads, 0);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            for (int n = 0; n < ops; n++) {
                ProductID p = urand_int(1, num_products);
                Quantity q = urand_int(1, 5);
                if (urand_int(1, 100) <= 20) {
                    Delivery d{tables.next_delivery_id(), store, p, q, 1, make_date(2024, 3, 2)};
                    if (engine->receive(d).kind != ReceiveResult::REJECTED) delivered[i] += q;
                } else {
                    CommitResult r = engine->commit(line(store, p, q));
                    if (r.applied) {
                        EXPECT_GE(r.quantity_after, 0);
                        sold[i] += q;
                    }
                }
            }
        });
    }
    go.store(true);
    for (auto& th: threads) th.join();

    Quantity total_sold = 0;
    Quantity total_delivered = 0;
    for (int i = 0; i < num_threads; i++) {
        total_sold += sold[i];
        total_delivered += delivered[i];
    }

    Quantity on_hand = 0;
    engine->get_ledger().for_each_row([&](const InventoryRow& row) {
        EXPECT_GE(row.quantity, 0);
        on_hand += row.quantity;
    });
    EXPECT_EQ(on_hand, opening * num_products + total_delivered - total_sold);
}
