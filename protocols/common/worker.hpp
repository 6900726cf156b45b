#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "protocols/common/transaction_id.hpp"

// Per-thread transaction factory. Hands out TxIDs (worker_id, counter) and constructs the
// protocol instance for each new unit of work.
template <typename Protocol>
class Worker {
public:
    explicit Worker(uint32_t worker_id)
        : worker_id(worker_id)
        , tx_counter(1) {}

    template <typename... Args>
    std::unique_ptr<Protocol> begin_tx(Args&&... args) {
        TxID txid(worker_id, tx_counter);
        ++tx_counter;
        if (tx_counter == 0) tx_counter = 1;
        return std::make_unique<Protocol>(txid, std::forward<Args>(args)...);
    }

    uint32_t get_id() const { return worker_id; }

private:
    uint32_t worker_id;
    uint32_t tx_counter;
};
