#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "retail/include/merge_policy.hpp"
#include "retail/include/record_key.hpp"
#include "retail/include/record_layout.hpp"

// StoreProfitability rows keyed by store_profitability_id.
class ProfitabilityTable {
public:
    // Rows are replaced whole, never patched.
    void upsert(const StoreProfitability& row) {
        std::lock_guard<std::mutex> guard(latch);
        auto it = rows.find(row.store_profitability_id);
        if (it == rows.end()) {
            rows.emplace(row.store_profitability_id, merge_record<StoreProfitability>(nullptr, row));
        } else {
            it->second = merge_record<StoreProfitability>(&it->second, row);
        }
    }

    std::optional<StoreProfitability> get(StoreProfitability::Key key) const {
        std::lock_guard<std::mutex> guard(latch);
        auto it = rows.find(key.get_raw_key());
        if (it == rows.end()) return std::nullopt;
        return it->second;
    }

    std::vector<StoreProfitability> get_all() const {
        std::vector<StoreProfitability> out;
        std::lock_guard<std::mutex> guard(latch);
        out.reserve(rows.size());
        for (auto& [id, row]: rows) out.push_back(row);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> guard(latch);
        return rows.size();
    }

private:
    mutable std::mutex latch;
    std::map<uint64_t, StoreProfitability> rows;
};
