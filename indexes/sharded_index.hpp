#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <new>
#include <unordered_map>
#include <vector>

#include "protocols/common/memory_allocator.hpp"
#include "utils/logger.hpp"

// Hash index split into independently latched shards. The shard latch only protects the map
// structure; row contents are guarded by the lock embedded in each Value. Slots are never
// removed while the index is alive, so Value pointers stay valid for its whole lifetime.
template <typename Value_, size_t NumShards = 64>
class ShardedIndex {
public:
    using Key = uint64_t;
    using Value = Value_;

    enum Result {
        OK = 0,
        NOT_FOUND,
        NOT_INSERTED,
    };

    ShardedIndex() = default;
    ShardedIndex(const ShardedIndex&) = delete;
    ShardedIndex& operator=(const ShardedIndex&) = delete;

    ~ShardedIndex() {
        for (Shard& shard: shards) {
            for (auto& [key, val]: shard.map) {
                val->~Value();
                MemoryAllocator::deallocate(val);
            }
            shard.map.clear();
        }
    }

    Result find(Key key, Value*& val) {
        Shard& shard = get_shard(key);
        std::lock_guard<std::mutex> guard(shard.latch);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            val = nullptr;
            return NOT_FOUND;
        }
        val = it->second;
        return OK;
    }

    // Returns OK with a freshly constructed slot, or NOT_INSERTED with the slot another
    // thread inserted first. Either way val points to the slot for key.
    Result get_or_insert(Key key, Value*& val) {
        Shard& shard = get_shard(key);
        std::lock_guard<std::mutex> guard(shard.latch);
        auto it = shard.map.find(key);
        if (it != shard.map.end()) {
            val = it->second;
            return NOT_INSERTED;
        }
        void* mem = MemoryAllocator::aligned_allocate(sizeof(Value), alignof(Value));
        val = new (mem) Value();
        shard.map.emplace(key, val);
        return OK;
    }

    // Snapshot of every slot, ordered by key. Used by sweeps; the caller reads row contents
    // through the slot's own synchronization.
    std::map<Key, Value*> get_all() {
        std::map<Key, Value*> kv_map;
        for (Shard& shard: shards) {
            std::lock_guard<std::mutex> guard(shard.latch);
            for (auto& [key, val]: shard.map) kv_map.emplace(key, val);
        }
        return kv_map;
    }

    size_t size() {
        size_t n = 0;
        for (Shard& shard: shards) {
            std::lock_guard<std::mutex> guard(shard.latch);
            n += shard.map.size();
        }
        return n;
    }

    static constexpr size_t get_num_shards() { return NumShards; }

private:
    struct Shard {
        alignas(64) std::mutex latch;
        std::unordered_map<Key, Value*> map;
    };

    Shard& get_shard(Key key) {
        // keys of one store are adjacent, so mix the bits before picking a shard
        uint64_t h = key * 0x9E3779B97F4A7C15ULL;
        return shards[(h >> 32) % NumShards];
    }

    Shard shards[NumShards];
};
