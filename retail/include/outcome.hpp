#pragma once

#include <cstdint>
#include <string>

#include "retail/include/record_layout.hpp"

enum class RejectReason : uint8_t {
    NONE = 0,
    NO_INVENTORY_ROW,    // the pair has never received stock; hard reject
    INSUFFICIENT_STOCK,  // have < need; hard reject
    LOCK_CONTENTION,     // key lock not acquired within the bounded wait; retryable
};

const char* reject_reason_name(RejectReason reason);

// Carries the numbers involved so the caller can present an actionable message.
struct Rejection {
    RejectReason reason = RejectReason::NONE;
    StoreID store_id = 0;
    ProductID product_id = 0;
    Quantity have = 0;
    Quantity need = 0;

    bool is_rejected() const { return reason != RejectReason::NONE; }
    bool is_retryable() const { return reason == RejectReason::LOCK_CONTENTION; }
    std::string message() const;
};

struct AdmitResult {
    bool allowed = false;
    Rejection rejection;
};

struct CommitResult {
    bool applied = false;
    Quantity quantity_after = 0;
    Rejection rejection;
};

struct ReceiveResult {
    enum Kind : uint8_t { NEW_ROW = 0, MERGED_ROW, REJECTED };
    Kind kind = REJECTED;
    Quantity quantity_after = 0;
    Rejection rejection;
};
