#include "retail/include/restock_alert_manager.hpp"

#include <inttypes.h>

#include <string>

#include "retail/include/config.hpp"
#include "utils/logger.hpp"
#include "utils/utils.hpp"

const char* alert_state_name(AlertState state) {
    switch (state) {
    case AlertState::NO_ALERT: return "NO_ALERT";
    case AlertState::ALERT_OPEN: return "ALERT_OPEN";
    }
    return "UNKNOWN";
}

bool RestockAlertManager::open_check(
    StoreID store_id, ProductID product_id, Quantity new_quantity, std::optional<Date> sale_date) {
    const Config& c = get_config();
    if (!c.is_watched_store(store_id)) return false;
    if (new_quantity >= c.get_alert_open_threshold()) return false;

    RestockAlertKey key = RestockAlertKey::create_key(product_id, store_id);
    if (is_open(key)) return false;  // latched, skip the lookups

    RestockAlert snapshot = make_snapshot(store_id, product_id, new_quantity, sale_date);

    std::lock_guard<std::mutex> guard(latch);
    Entry& e = entries[key];
    if (e.state == AlertState::ALERT_OPEN) return false;  // first snapshot wins

    // a later increase already brought the pair back to the recovery level; its close check
    // has run or will find nothing to close
    std::optional<Quantity> current = ledger.peek_quantity(store_id, product_id);
    if (current && *current > new_quantity && *current >= c.get_alert_recovery_threshold()) {
        return false;
    }

    e.state = AlertState::ALERT_OPEN;
    e.alert = snapshot;
    LOG_INFO(
        "alert opened: store_id=%" PRIu32 " product_id=%" PRIu32 " quantity=%" PRId64,
        store_id, product_id, new_quantity);
    e.alert.print();
    return true;
}

bool RestockAlertManager::close_check(StoreID store_id, ProductID product_id) {
    Quantity recovery = get_config().get_alert_recovery_threshold();
    RestockAlertKey key = RestockAlertKey::create_key(product_id, store_id);

    std::lock_guard<std::mutex> guard(latch);
    auto it = entries.find(key);
    if (it == entries.end() || it->second.state != AlertState::ALERT_OPEN) return false;
    if (!has_recovered(it->second.alert, recovery)) return false;
    it->second.state = AlertState::NO_ALERT;
    LOG_INFO("alert closed: store_id=%" PRIu32 " product_id=%" PRIu32, store_id, product_id);
    return true;
}

size_t RestockAlertManager::sweep() {
    Quantity recovery = get_config().get_alert_recovery_threshold();
    size_t closed = 0;

    std::lock_guard<std::mutex> guard(latch);
    for (auto& [key, e]: entries) {
        if (e.state != AlertState::ALERT_OPEN) continue;
        if (!has_recovered(e.alert, recovery)) continue;
        e.state = AlertState::NO_ALERT;
        LOG_INFO(
            "alert closed by sweep: store_id=%" PRIu32 " product_id=%" PRIu32,
            e.alert.store_id, e.alert.product_id);
        ++closed;
    }
    return closed;
}

AlertState RestockAlertManager::get_state(ProductID product_id, StoreID store_id) const {
    std::lock_guard<std::mutex> guard(latch);
    auto it = entries.find(RestockAlertKey::create_key(product_id, store_id));
    if (it == entries.end()) return AlertState::NO_ALERT;
    return it->second.state;
}

std::optional<RestockAlert> RestockAlertManager::get_alert(
    ProductID product_id, StoreID store_id) const {
    std::lock_guard<std::mutex> guard(latch);
    auto it = entries.find(RestockAlertKey::create_key(product_id, store_id));
    if (it == entries.end() || it->second.state != AlertState::ALERT_OPEN) return std::nullopt;
    return it->second.alert;
}

std::vector<RestockAlert> RestockAlertManager::get_open_alerts() const {
    std::vector<RestockAlert> out;
    std::lock_guard<std::mutex> guard(latch);
    for (auto& [key, e]: entries) {
        if (e.state == AlertState::ALERT_OPEN) out.push_back(e.alert);
    }
    return out;
}

size_t RestockAlertManager::num_open_alerts() const {
    size_t n = 0;
    std::lock_guard<std::mutex> guard(latch);
    for (auto& [key, e]: entries) {
        if (e.state == AlertState::ALERT_OPEN) ++n;
    }
    return n;
}

void RestockAlertManager::on_ledger_event(const LedgerEvent& ev) {
    if (ev.is_decrease()) {
        open_check(ev.store_id, ev.product_id, ev.new_quantity, ev.sale_date);
    } else if (ev.new_quantity > ev.old_quantity) {
        close_check(ev.store_id, ev.product_id);
    }
}

bool RestockAlertManager::is_open(RestockAlertKey key) const {
    std::lock_guard<std::mutex> guard(latch);
    auto it = entries.find(key);
    return it != entries.end() && it->second.state == AlertState::ALERT_OPEN;
}

bool RestockAlertManager::has_recovered(const RestockAlert& alert, Quantity recovery_threshold) {
    std::optional<Quantity> q = ledger.peek_quantity(alert.store_id, alert.product_id);
    return q && *q >= recovery_threshold;
}

RestockAlert RestockAlertManager::make_snapshot(
    StoreID store_id, ProductID product_id, Quantity quantity, std::optional<Date> sale_date) {
    RestockAlert a;
    a.product_id = product_id;
    a.store_id = store_id;
    a.quantity = quantity;
    a.product_name[0] = '\0';
    a.alert_date = sale_date;

    try {
        std::optional<std::string> name = products.lookup_product_name(product_id);
        if (name) copy_cstr(a.product_name, name->c_str(), sizeof(a.product_name));
    } catch (const UpstreamLookupFailure& e) {
        LOG_WARN("product name lookup failed (product_id=%" PRIu32 "): %s", product_id, e.what());
    }

    try {
        std::optional<Date> latest = sales.latest_sale_date(store_id, product_id);
        if (latest && (!a.alert_date || *a.alert_date < *latest)) a.alert_date = latest;
    } catch (const UpstreamLookupFailure& e) {
        LOG_WARN(
            "latest sale lookup failed (store_id=%" PRIu32 " product_id=%" PRIu32 "): %s",
            store_id, product_id, e.what());
    }
    return a;
}
