#pragma once

#include <chrono>
#include <stdexcept>
#include <vector>

#include "protocols/common/transaction_id.hpp"
#include "protocols/rowlock/include/readwriteset.hpp"
#include "utils/atomic_wrapper.hpp"
#include "utils/logger.hpp"

// Row change installed by a successful precommit.
struct RowChange {
    uint64_t key;
    InventoryRow row;  // row after install
    Quantity old_quantity;
    bool created;
};

// Pessimistic per-key protocol. Every access to a row is a read with intent to write: the
// row's IntentLock is taken on first touch (bounded wait) and held until precommit or abort,
// so check-then-modify sequences on one key are serialized while different keys run in
// parallel. A transaction that cannot get its lock in time gives up instead of blocking.
template <typename Index_>
class RowLock {
public:
    using Index = Index_;
    using Key = typename Index::Key;

    enum Outcome {
        OK = 0,
        NOT_FOUND,
        CONTENDED,
    };

    RowLock(TxID txid, Index& idx, std::chrono::microseconds lock_wait)
        : txid(txid)
        , idx(idx)
        , lock_wait(lock_wait) {
        LOG_TRACE("START Tx (w: %u, c: %u)", static_cast<uint32_t>(txid.thread_id),
            static_cast<uint32_t>(txid.tx_counter));
    }

    ~RowLock() {
        // locks must never outlive the transaction
        if (!rws.get_table().empty()) abort();
    }

    RowLock(const RowLock&) = delete;
    RowLock& operator=(const RowLock&) = delete;

    Outcome read(Key key, const InventoryRow*& rec) {
        LOG_TRACE("READ (tx: %lu, k: %lu)", txid.id, key);
        auto& rw_table = rws.get_table();
        auto rw_iter = rw_table.find(key);
        if (rw_iter != rw_table.end()) {
            rec = &rw_iter->second.rec;
            return OK;
        }

        Value* val = nullptr;
        if (idx.find(key, val) == Index::Result::NOT_FOUND) return NOT_FOUND;
        if (!val->lock.try_lock_for(txid.id, lock_wait)) return CONTENDED;
        if (!val->present) {
            // slot of an insert that never committed
            val->lock.unlock(txid.id);
            return NOT_FOUND;
        }
        auto [it, inserted] =
            rw_table.try_emplace(key, val->row, ReadWriteType::READ, val);
        rec = &it->second.rec;
        return OK;
    }

    Outcome update(Key key, InventoryRow*& rec) {
        LOG_TRACE("UPDATE (tx: %lu, k: %lu)", txid.id, key);
        const InventoryRow* read_rec = nullptr;
        Outcome o = read(key, read_rec);
        if (o != OK) return o;
        ReadWriteElement& e = rws.get_table().at(key);
        if (e.rwt == ReadWriteType::READ) e.rwt = ReadWriteType::UPDATE;
        rec = &e.rec;
        return OK;
    }

    // Locks the row for key, creating an absent slot if the key was never seen. is_new
    // tells the caller the row has to be initialized rather than merged into.
    Outcome upsert(Key key, InventoryRow*& rec, bool& is_new) {
        LOG_TRACE("UPSERT (tx: %lu, k: %lu)", txid.id, key);
        auto& rw_table = rws.get_table();
        auto rw_iter = rw_table.find(key);
        if (rw_iter != rw_table.end()) {
            ReadWriteElement& e = rw_iter->second;
            if (e.rwt == ReadWriteType::READ) e.rwt = ReadWriteType::UPDATE;
            is_new = e.rwt == ReadWriteType::INSERT;
            rec = &e.rec;
            return OK;
        }

        Value* val = nullptr;
        idx.get_or_insert(key, val);
        if (!val->lock.try_lock_for(txid.id, lock_wait)) return CONTENDED;
        is_new = !val->present;
        ReadWriteType rwt = is_new ? ReadWriteType::INSERT : ReadWriteType::UPDATE;
        auto [it, inserted] = rw_table.try_emplace(key, val->row, rwt, val);
        if (is_new) it->second.rec = InventoryRow{0, 0, 0};
        rec = &it->second.rec;
        return OK;
    }

    bool precommit(std::vector<RowChange>& changes) {
        LOG_TRACE("PRECOMMIT (tx: %lu)", txid.id);
        auto& rw_table = rws.get_table();

        // validate before installing anything so that a broken write leaves no partial state
        for (auto& [key, e]: rw_table) {
            if (e.rwt != ReadWriteType::READ && e.rec.quantity < 0) {
                abort();
                throw std::runtime_error("negative quantity reached precommit");
            }
        }

        for (auto& [key, e]: rw_table) {
            Value* val = e.val;
            if (e.rwt == ReadWriteType::UPDATE || e.rwt == ReadWriteType::INSERT) {
                Quantity old_quantity = val->present ? val->row.quantity : 0;
                val->row.store_id = e.rec.store_id;
                val->row.product_id = e.rec.product_id;
                store_release(val->row.quantity, e.rec.quantity);
                store_release(val->present, true);
                changes.push_back(
                    RowChange{key, e.rec, old_quantity, e.rwt == ReadWriteType::INSERT});
            }
            val->lock.unlock(txid.id);
        }
        rw_table.clear();
        return true;
    }

    void abort() {
        LOG_TRACE("ABORT (tx: %lu)", txid.id);
        auto& rw_table = rws.get_table();
        for (auto& [key, e]: rw_table) {
            e.val->lock.unlock(txid.id);
        }
        rw_table.clear();
    }

    TxID get_txid() const { return txid; }

private:
    TxID txid;
    Index& idx;
    std::chrono::microseconds lock_wait;
    ReadWriteSet<Key> rws;
};
