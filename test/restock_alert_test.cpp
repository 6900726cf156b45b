#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"
#include "retail/include/config.hpp"
#include "retail/include/inventory_engine.hpp"
#include "retail/include/restock_alert_manager.hpp"
#include "retail/include/retail_tables.hpp"
#include "utils/date.hpp"
#include "utils/utils.hpp"

namespace {
// Product master data that can be switched into an unavailable state.
class FlakyCatalogTables : public RetailTables {
public:
    std::optional<std::string> lookup_product_name(ProductID product_id) const override {
        if (upstream_down) throw UpstreamLookupFailure("product service unavailable");
        if (broken) throw std::runtime_error("unexpected catalog error");
        return RetailTables::lookup_product_name(product_id);
    }
    bool upstream_down = false;
    bool broken = false;
};
}  // namespace

class RestockAlertTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_mutable_config() = Config();
        Product p;
        p.product_id = 1;
        copy_cstr(p.name, "Widget", sizeof(p.name));
        p.unit_price = 250;
        tables.add_product(p);
        engine = std::make_unique<InventoryEngine>(tables.get_collaborators());
    }

    void stock(StoreID store_id, ProductID product_id, Quantity quantity) {
        Delivery d{
            tables.next_delivery_id(), store_id, product_id, quantity, 1, make_date(2024, 3, 1)};
        ASSERT_NE(tables.receive_delivery(*engine, d).kind, ReceiveResult::REJECTED);
    }

    CommitResult sell(StoreID store_id, ProductID product_id, Quantity quantity, Date d) {
        return tables.capture_sale_line(
            *engine, SaleLine{tables.open_sale(store_id, d), product_id, quantity});
    }

    CommitResult sell(StoreID store_id, ProductID product_id, Quantity quantity) {
        return sell(store_id, product_id, quantity, make_date(2024, 3, 10));
    }

    FlakyCatalogTables tables;
    std::unique_ptr<InventoryEngine> engine;
};

TEST_F(RestockAlertTest, OpensOnceAndKeepsFirstSnapshot) {
    stock(1, 1, 150);
    EXPECT_TRUE(sell(1, 1, 70).applied);

    std::optional<RestockAlert> a = engine->alert(1, 1);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::ALERT_OPEN);
    EXPECT_EQ(a->quantity, 80);
    EXPECT_STREQ(a->product_name, "Widget");

    EXPECT_TRUE(sell(1, 1, 10).applied);
    std::optional<RestockAlert> b = engine->alert(1, 1);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->quantity, 80);
    EXPECT_EQ(engine->open_alerts().size(), 1u);
}

TEST_F(RestockAlertTest, OpenThresholdIsExclusive) {
    stock(1, 1, 150);
    sell(1, 1, 50);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
    sell(1, 1, 1);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::ALERT_OPEN);
}

TEST_F(RestockAlertTest, SnapshotCarriesTriggeringSaleDate) {
    stock(1, 1, 150);
    sell(1, 1, 10, make_date(2024, 3, 5));
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
    sell(1, 1, 60, make_date(2024, 3, 9));

    std::optional<RestockAlert> a = engine->alert(1, 1);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->quantity, 80);
    ASSERT_TRUE(a->alert_date.has_value());
    EXPECT_EQ(*a->alert_date, make_date(2024, 3, 9));
}

TEST_F(RestockAlertTest, FirstSaleOfPairDatesTheAlert) {
    stock(2, 1, 120);
    sell(2, 1, 30, make_date(2024, 3, 12));
    std::optional<RestockAlert> a = engine->alert(1, 2);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(a->alert_date.has_value());
    EXPECT_EQ(*a->alert_date, make_date(2024, 3, 12));
}

TEST_F(RestockAlertTest, BackdatedSaleKeepsLatestRecordedDate) {
    stock(1, 1, 150);
    sell(1, 1, 10, make_date(2024, 3, 20));
    sell(1, 1, 60, make_date(2024, 3, 2));
    std::optional<RestockAlert> a = engine->alert(1, 1);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(a->alert_date.has_value());
    EXPECT_EQ(*a->alert_date, make_date(2024, 3, 20));
}

TEST_F(RestockAlertTest, DirectOpenWithoutSaleHasNoDate) {
    stock(1, 1, 10);
    ASSERT_TRUE(engine->get_alert_manager().open_check(1, 1, 10));
    std::optional<RestockAlert> a = engine->alert(1, 1);
    ASSERT_TRUE(a.has_value());
    EXPECT_FALSE(a->alert_date.has_value());
}

TEST_F(RestockAlertTest, HysteresisBand) {
    stock(1, 1, 150);
    sell(1, 1, 130);
    ASSERT_EQ(engine->alert_state(1, 1), AlertState::ALERT_OPEN);

    stock(1, 1, 4);
    EXPECT_EQ(engine->quantity(1, 1), 24);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::ALERT_OPEN);

    stock(1, 1, 1);
    EXPECT_EQ(engine->quantity(1, 1), 25);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
    EXPECT_FALSE(engine->alert(1, 1).has_value());
    EXPECT_TRUE(engine->open_alerts().empty());
}

TEST_F(RestockAlertTest, ReopensWithFreshSnapshotAfterClose) {
    stock(1, 1, 150);
    sell(1, 1, 130);
    stock(1, 1, 10);
    ASSERT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);

    sell(1, 1, 5);
    std::optional<RestockAlert> a = engine->alert(1, 1);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->quantity, 25);
}

TEST_F(RestockAlertTest, UnwatchedStoreNeverAlerts) {
    stock(3, 1, 150);
    sell(3, 1, 149);
    EXPECT_EQ(engine->quantity(3, 1), 1);
    EXPECT_EQ(engine->alert_state(1, 3), AlertState::NO_ALERT);
    EXPECT_TRUE(engine->open_alerts().empty());
}

TEST_F(RestockAlertTest, WatchSetIsConfigurable) {
    get_mutable_config().set_alert_watch_stores({3});
    stock(1, 1, 150);
    stock(3, 1, 150);
    sell(1, 1, 100);
    sell(3, 1, 100);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
    EXPECT_EQ(engine->alert_state(1, 3), AlertState::ALERT_OPEN);
}

TEST_F(RestockAlertTest, NameLookupFailureDegrades) {
    tables.upstream_down = true;
    stock(1, 1, 150);
    CommitResult r = sell(1, 1, 100);
    EXPECT_TRUE(r.applied);

    std::optional<RestockAlert> a = engine->alert(1, 1);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::strlen(a->product_name), 0u);
    EXPECT_EQ(a->quantity, 50);
    EXPECT_EQ(engine->get_stat().num_listener_failures, 0u);
}

TEST_F(RestockAlertTest, UnknownProductOpensWithEmptyName) {
    stock(1, 2, 150);
    sell(1, 2, 100);
    std::optional<RestockAlert> a = engine->alert(2, 1);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(std::strlen(a->product_name), 0u);
}

TEST_F(RestockAlertTest, BookkeepingErrorDoesNotFailTheSale) {
    tables.broken = true;
    stock(1, 1, 150);
    CommitResult r = sell(1, 1, 100);
    EXPECT_TRUE(r.applied);
    EXPECT_EQ(engine->quantity(1, 1), 50);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
    EXPECT_EQ(engine->get_stat().num_listener_failures, 1u);
}

TEST_F(RestockAlertTest, CloseOfMissingAlertIsNoop) {
    RestockAlertManager& m = engine->get_alert_manager();
    EXPECT_FALSE(m.close_check(1, 42));
    EXPECT_EQ(m.num_open_alerts(), 0u);
}

TEST_F(RestockAlertTest, SweepClosesRecoveredPairsOnly) {
    stock(1, 1, 20);
    stock(1, 2, 10);
    RestockAlertManager& m = engine->get_alert_manager();
    EXPECT_TRUE(m.open_check(1, 1, 10));
    EXPECT_TRUE(m.open_check(1, 2, 10));
    EXPECT_EQ(m.num_open_alerts(), 2u);

    // lowering the recovery level leaves pair 1 recovered without any delivery
    get_mutable_config().set_alert_thresholds(100, 15);
    EXPECT_EQ(engine->sweep_alerts(), 1u);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
    EXPECT_EQ(engine->alert_state(2, 1), AlertState::ALERT_OPEN);
}

TEST_F(RestockAlertTest, OpenSkippedWhenPairAlreadyRecovered) {
    stock(1, 1, 150);
    EXPECT_FALSE(engine->get_alert_manager().open_check(1, 1, 10));
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
}

TEST_F(RestockAlertTest, LateOpenAfterRecoveringDeliveryIsSkipped) {
    // sale left the pair at 10, a delivery then lifted it to 30 and its close check ran first
    stock(1, 1, 30);
    RestockAlertManager& m = engine->get_alert_manager();
    EXPECT_FALSE(m.close_check(1, 1));
    EXPECT_FALSE(m.open_check(1, 1, 10, make_date(2024, 3, 10)));
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
}

TEST_F(RestockAlertTest, LateOpenBelowRecoveryStillOpens) {
    stock(1, 1, 24);
    EXPECT_TRUE(engine->get_alert_manager().open_check(1, 1, 10));
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::ALERT_OPEN);
}

TEST_F(RestockAlertTest, SweepOnDeliveryWhenEnabled) {
    stock(1, 1, 20);
    RestockAlertManager& m = engine->get_alert_manager();
    ASSERT_TRUE(m.open_check(1, 1, 10));
    get_mutable_config().set_alert_thresholds(100, 15);

    stock(2, 9, 500);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::ALERT_OPEN);

    get_mutable_config().enable_sweep_alerts_on_delivery();
    stock(2, 9, 500);
    EXPECT_EQ(engine->alert_state(1, 1), AlertState::NO_ALERT);
}

TEST(RestockAlertConfigTest, RecoveryAboveOpenIsRejected) {
    Config c;
    EXPECT_THROW(c.set_alert_thresholds(25, 100), std::runtime_error);
    EXPECT_THROW(c.set_alert_thresholds(-1, 0), std::runtime_error);
    c.set_alert_thresholds(50, 10);
    EXPECT_EQ(c.get_alert_open_threshold(), 50);
    EXPECT_EQ(c.get_alert_recovery_threshold(), 10);
}
