#include "retail/include/outcome.hpp"

#include <inttypes.h>

#include <cstdio>

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
    case RejectReason::NONE: return "NONE";
    case RejectReason::NO_INVENTORY_ROW: return "NO_INVENTORY_ROW";
    case RejectReason::INSUFFICIENT_STOCK: return "INSUFFICIENT_STOCK";
    case RejectReason::LOCK_CONTENTION: return "LOCK_CONTENTION";
    }
    return "UNKNOWN";
}

std::string Rejection::message() const {
    char buf[160];
    switch (reason) {
    case RejectReason::NONE: return std::string();
    case RejectReason::NO_INVENTORY_ROW:
        ::snprintf(
            buf, sizeof(buf), "No inventory row for store_id=%" PRIu32 " product_id=%" PRIu32,
            store_id, product_id);
        break;
    case RejectReason::INSUFFICIENT_STOCK:
        ::snprintf(
            buf, sizeof(buf),
            "Insufficient stock: have %" PRId64 ", need %" PRId64 " (store %" PRIu32
            ", product %" PRIu32 ")",
            have, need, store_id, product_id);
        break;
    case RejectReason::LOCK_CONTENTION:
        ::snprintf(
            buf, sizeof(buf), "Lock contention on store_id=%" PRIu32 " product_id=%" PRIu32
            ", retry later",
            store_id, product_id);
        break;
    default: return std::string("unknown rejection");
    }
    return std::string(buf);
}
