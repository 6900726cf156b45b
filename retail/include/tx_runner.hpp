#pragma once

#include <stdexcept>

#include "retail/include/admit_sale_line_tx.hpp"
#include "retail/include/commit_sale_line_tx.hpp"
#include "retail/include/config.hpp"
#include "retail/include/outcome.hpp"
#include "retail/include/receive_delivery_tx.hpp"
#include "retail/include/tx_utils.hpp"
#include "utils/logger.hpp"

// Runs p until it commits, is rejected, or has been aborted by the lock wait more than
// max_lock_retries times. The last case is reported as LOCK_CONTENTION in out.
template <typename TxProfile, typename Transaction>
inline Status run_with_retry(
    TxProfile& p, Transaction& tx, Stat& stat, typename TxProfile::Output& out) {
    const uint32_t max_retries = get_config().get_max_lock_retries();
    for (uint32_t attempt = 0;; ++attempt) {
        Status res = p.run(tx, stat, out);
        switch (res) {
        case SUCCESS: LOG_TRACE("success"); return res;
        case USER_ABORT:
            LOG_DEBUG("%s rejected: %s", TxProfile::name, out.rejection.message().c_str());
            return res;  // aborted by the ledger rules
        case SYSTEM_ABORT:
            if (attempt < max_retries) {
                LOG_TRACE("system abort");
                continue;  // aborted by the lock wait
            }
            stat[TxProfile::id].num_gave_up++;
            out.rejection = Rejection{
                RejectReason::LOCK_CONTENTION, p.input.store_id, p.input.product_id, 0,
                p.input.quantity};
            LOG_WARN(
                "%s gave up after %u attempts: %s", TxProfile::name, attempt + 1,
                out.rejection.message().c_str());
            return res;
        case BUG: throw std::runtime_error("Unexpected Transaction Bug");
        }
        throw std::runtime_error("wrong Status");
    }
}
