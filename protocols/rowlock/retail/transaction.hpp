#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "protocols/common/worker.hpp"
#include "protocols/rowlock/include/rowlock.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"

template <typename Protocol>
class Transaction {
public:
    uint32_t thread_id = 0;

    Transaction(
        Worker<Protocol>& worker, typename Protocol::Index& idx,
        std::chrono::microseconds lock_wait)
        : thread_id(worker.get_id())
        , protocol(worker.begin_tx(idx, lock_wait)) {}

    void abort() { protocol->abort(); }

    bool commit() {
        changes.clear();
        if (protocol->precommit(changes)) {
            return true;
        } else {
            abort();
            return false;
        }
    }

    enum Result {
        SUCCESS,
        FAIL,  // e.g. no such row
        ABORT  // could not acquire the row lock within the bounded wait
    };

    // Reads the row and keeps it locked until commit or abort.
    Result get_record_for_update(const InventoryRow*& rec_ptr, InventoryRow::Key rec_key) {
        return to_result(protocol->read(rec_key.get_raw_key(), rec_ptr));
    }

    // rec_ptr points to a copy in the read-write set; changes are installed at commit.
    Result prepare_record_for_update(InventoryRow*& rec_ptr, InventoryRow::Key rec_key) {
        return to_result(protocol->update(rec_key.get_raw_key(), rec_ptr));
    }

    Result finish_update([[maybe_unused]] InventoryRow* rec_ptr) { return Result::SUCCESS; }

    Result prepare_record_for_upsert(
        InventoryRow*& rec_ptr, InventoryRow::Key rec_key, bool& is_new) {
        return to_result(protocol->upsert(rec_key.get_raw_key(), rec_ptr, is_new));
    }

    Result finish_upsert([[maybe_unused]] InventoryRow* rec_ptr) { return Result::SUCCESS; }

    // Rows installed by the last successful commit.
    const std::vector<RowChange>& get_changes() const { return changes; }

    TxID get_txid() const { return protocol->get_txid(); }

private:
    Result to_result(typename Protocol::Outcome o) {
        switch (o) {
        case Protocol::Outcome::OK: return Result::SUCCESS;
        case Protocol::Outcome::NOT_FOUND: return Result::FAIL;
        case Protocol::Outcome::CONTENDED: return Result::ABORT;
        }
        return Result::FAIL;
    }

    std::unique_ptr<Protocol> protocol = nullptr;
    std::vector<RowChange> changes;
};
