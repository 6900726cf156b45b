#pragma once

#include <cstdint>

#include "retail/include/record_layout.hpp"

struct InventoryKey {
    union {
        struct {
            uint64_t product_id : 32;
            uint64_t store_id : 32;
        };
        uint64_t inv_key;
    };
    InventoryKey()
        : inv_key(0) {}
    InventoryKey(uint64_t inv_key)
        : inv_key(inv_key) {}
    bool operator<(const InventoryKey& rhs) const noexcept { return inv_key < rhs.inv_key; }
    bool operator==(const InventoryKey& rhs) const noexcept { return inv_key == rhs.inv_key; }
    uint64_t get_raw_key() const { return inv_key; }
    static InventoryKey create_key(StoreID store_id, ProductID product_id) {
        InventoryKey k;
        k.store_id = store_id;
        k.product_id = product_id;
        return k;
    }
    static InventoryKey create_key(const InventoryRow& r) {
        return create_key(r.store_id, r.product_id);
    }
};

struct RestockAlertKey {
    union {
        struct {
            uint64_t store_id : 32;
            uint64_t product_id : 32;
        };
        uint64_t ra_key;
    };
    RestockAlertKey()
        : ra_key(0) {}
    RestockAlertKey(uint64_t ra_key)
        : ra_key(ra_key) {}
    bool operator<(const RestockAlertKey& rhs) const noexcept { return ra_key < rhs.ra_key; }
    bool operator==(const RestockAlertKey& rhs) const noexcept { return ra_key == rhs.ra_key; }
    uint64_t get_raw_key() const { return ra_key; }
    static RestockAlertKey create_key(ProductID product_id, StoreID store_id) {
        RestockAlertKey k;
        k.product_id = product_id;
        k.store_id = store_id;
        return k;
    }
    static RestockAlertKey create_key(const RestockAlert& ra) {
        return create_key(ra.product_id, ra.store_id);
    }
};

// The raw key is the persisted store_profitability_id: a rerun for the same
// (year, month, store) always lands on the same row.
struct StoreProfitabilityKey {
    union {
        struct {
            uint64_t store_id : 32;
            uint64_t month : 8;
            uint64_t year : 16;
        };
        uint64_t sp_key;
    };
    StoreProfitabilityKey()
        : sp_key(0) {}
    StoreProfitabilityKey(uint64_t sp_key)
        : sp_key(sp_key) {}
    bool operator<(const StoreProfitabilityKey& rhs) const noexcept {
        return sp_key < rhs.sp_key;
    }
    bool operator==(const StoreProfitabilityKey& rhs) const noexcept {
        return sp_key == rhs.sp_key;
    }
    uint64_t get_raw_key() const { return sp_key; }
    static StoreProfitabilityKey create_key(int year, unsigned month, StoreID store_id) {
        StoreProfitabilityKey k;
        k.year = static_cast<uint16_t>(year);
        k.month = static_cast<uint8_t>(month);
        k.store_id = store_id;
        return k;
    }
};

struct VendorPriceKey {
    union {
        struct {
            uint64_t product_id : 32;
            uint64_t vendor_id : 32;
        };
        uint64_t vp_key;
    };
    VendorPriceKey()
        : vp_key(0) {}
    VendorPriceKey(uint64_t vp_key)
        : vp_key(vp_key) {}
    bool operator<(const VendorPriceKey& rhs) const noexcept { return vp_key < rhs.vp_key; }
    bool operator==(const VendorPriceKey& rhs) const noexcept { return vp_key == rhs.vp_key; }
    uint64_t get_raw_key() const { return vp_key; }
    static VendorPriceKey create_key(VendorID vendor_id, ProductID product_id) {
        VendorPriceKey k;
        k.vendor_id = vendor_id;
        k.product_id = product_id;
        return k;
    }
    static VendorPriceKey create_key(const VendorPrice& vp) {
        return create_key(vp.vendor_id, vp.product_id);
    }
};
