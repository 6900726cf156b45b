#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>
#include <stdexcept>

#include "retail/include/record_layout.hpp"

class Config {
public:
    Config() = default;

    void set_alert_watch_stores(const std::set<StoreID>& stores) { watch_stores = stores; }
    const std::set<StoreID>& get_alert_watch_stores() const { return watch_stores; }
    bool is_watched_store(StoreID store_id) const { return watch_stores.count(store_id) != 0; }

    // Alerts open when quantity < open threshold and close when quantity >= recovery
    // threshold. The band between them keeps an alert from flapping.
    void set_alert_thresholds(Quantity open, Quantity recovery) {
        if (open < 0 || recovery < 0) throw std::runtime_error("negative alert threshold");
        if (recovery > open) throw std::runtime_error("recovery threshold above open threshold");
        open_threshold = open;
        recovery_threshold = recovery;
    }
    Quantity get_alert_open_threshold() const { return open_threshold; }
    Quantity get_alert_recovery_threshold() const { return recovery_threshold; }

    void set_reporting_stores(const std::set<StoreID>& stores) { reporting_stores = stores; }
    const std::set<StoreID>& get_reporting_stores() const { return reporting_stores; }

    void set_lock_wait_timeout(std::chrono::microseconds t) {
        if (t.count() < 0) throw std::runtime_error("negative lock wait timeout");
        lock_wait_timeout = t;
    }
    std::chrono::microseconds get_lock_wait_timeout() const { return lock_wait_timeout; }

    void set_max_lock_retries(uint32_t n) { max_lock_retries = n; }
    uint32_t get_max_lock_retries() const { return max_lock_retries; }

    void enable_sweep_alerts_on_delivery() { sweep_on_delivery = true; }
    void disable_sweep_alerts_on_delivery() { sweep_on_delivery = false; }
    bool get_sweep_alerts_on_delivery_flag() const { return sweep_on_delivery; }

    void set_num_threads(size_t n) {
        if (n == 0) throw std::runtime_error("num_threads must be positive");
        num_threads = n;
    }
    size_t get_num_threads() const { return num_threads; }

private:
    std::set<StoreID> watch_stores = {1, 2};
    Quantity open_threshold = 100;
    Quantity recovery_threshold = 25;
    std::set<StoreID> reporting_stores = {1, 2};
    std::chrono::microseconds lock_wait_timeout = std::chrono::milliseconds(10);
    uint32_t max_lock_retries = 8;
    bool sweep_on_delivery = false;
    size_t num_threads = 1;
};

inline Config& get_mutable_config() {
    static Config c;
    return c;
}

inline const Config& get_config() {
    return get_mutable_config();
}
