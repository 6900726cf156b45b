#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>

enum Status {
    SUCCESS = 0,   // if all stages of transaction return Result::SUCCESS
    USER_ABORT,    // if the line is rejected for a domain reason (no row, insufficient stock)
    SYSTEM_ABORT,  // if any stage of a transaction returns Result::ABORT
    BUG            // if any stage of a transaction returns unexpected Result::FAIL
};

enum TxProfileID : uint8_t {
    ADMIT_SALE_LINE_TX = 0,
    COMMIT_SALE_LINE_TX = 1,
    RECEIVE_DELIVERY_TX = 2,
    MAX = 3,
};

class AdmitSaleLineTx;
class CommitSaleLineTx;
class ReceiveDeliveryTx;

template <TxProfileID i>
struct TxType;

template <>
struct TxType<TxProfileID::ADMIT_SALE_LINE_TX> {
    using Profile = AdmitSaleLineTx;
};

template <>
struct TxType<TxProfileID::COMMIT_SALE_LINE_TX> {
    using Profile = CommitSaleLineTx;
};

template <>
struct TxType<TxProfileID::RECEIVE_DELIVERY_TX> {
    using Profile = ReceiveDeliveryTx;
};

template <TxProfileID i>
using TxProfile = typename TxType<i>::Profile;

struct Stat {
    static const size_t ABORT_DETAILS_SIZE = 8;
    struct PerTxType {
        size_t num_commits = 0;
        size_t num_usr_aborts = 0;
        size_t num_sys_aborts = 0;
        size_t num_gave_up = 0;  // retries exhausted, surfaced as LOCK_CONTENTION
        size_t abort_details[ABORT_DETAILS_SIZE] = {};

        void add(const PerTxType& rhs, bool with_abort_details) {
            num_commits += rhs.num_commits;
            num_usr_aborts += rhs.num_usr_aborts;
            num_sys_aborts += rhs.num_sys_aborts;
            num_gave_up += rhs.num_gave_up;

            if (with_abort_details) {
                for (size_t i = 0; i < ABORT_DETAILS_SIZE; ++i) {
                    abort_details[i] += rhs.abort_details[i];
                }
            }
        }
    };

    PerTxType& operator[](TxProfileID tx_type) { return per_type_[tx_type]; }
    const PerTxType& operator[](TxProfileID tx_type) const { return per_type_[tx_type]; }

    void add(const Stat& rhs) {
        for (size_t i = 0; i < TxProfileID::MAX; i++) {
            per_type_[i].add(rhs.per_type_[i], true);
        }
        num_listener_failures += rhs.num_listener_failures;
    }

    PerTxType aggregate_perf() const {
        PerTxType out;
        for (size_t i = 0; i < TxProfileID::MAX; i++) {
            out.add(per_type_[i], false);
        }
        return out;
    }

    size_t num_listener_failures = 0;  // alert bookkeeping errors swallowed after commit

private:
    PerTxType per_type_[TxProfileID::MAX];
};

template <typename Transaction>
inline bool not_succeeded(Transaction& tx, typename Transaction::Result& res) {
    if (res == Transaction::Result::ABORT) {
        tx.abort();
    }
    return res != Transaction::Result::SUCCESS;
}

template <typename Transaction>
struct TxHelper {
    Transaction& tx_;
    Stat::PerTxType& per_type_;

    explicit TxHelper(Transaction& tx, Stat::PerTxType& per_type_)
        : tx_(tx)
        , per_type_(per_type_) {}

    Status kill(typename Transaction::Result res, uint8_t abort_id) {
        switch (res) {
        case Transaction::Result::FAIL: tx_.abort(); return Status::BUG;
        case Transaction::Result::ABORT:
            per_type_.num_sys_aborts++;
            per_type_.abort_details[abort_id]++;
            return Status::SYSTEM_ABORT;
        default: throw std::runtime_error("wrong Transaction::Result");
        }
    }

    Status commit(uint8_t abort_id) {
        if (tx_.commit()) {
            per_type_.num_commits++;
            return Status::SUCCESS;
        } else {
            per_type_.num_sys_aborts++;
            per_type_.abort_details[abort_id]++;
            return Status::SYSTEM_ABORT;
        }
    }

    // Domain rejection: release every lock, nothing is installed.
    Status usr_abort() {
        tx_.abort();
        per_type_.num_usr_aborts++;
        return Status::USER_ABORT;
    }
};
