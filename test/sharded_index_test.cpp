#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "indexes/sharded_index.hpp"

namespace {
struct Slot {
    int64_t v = 0;
};
}  // namespace

using SmallIndex = ShardedIndex<Slot, 8>;

TEST(ShardedIndexTest, GetOrInsertThenFind) {
    SmallIndex idx;
    Slot* s1 = nullptr;
    Slot* s2 = nullptr;
    Slot* found = nullptr;

    EXPECT_EQ(idx.find(42, found), SmallIndex::Result::NOT_FOUND);
    EXPECT_EQ(found, nullptr);

    EXPECT_EQ(idx.get_or_insert(42, s1), SmallIndex::Result::OK);
    ASSERT_NE(s1, nullptr);
    s1->v = 7;
    EXPECT_EQ(idx.get_or_insert(42, s2), SmallIndex::Result::NOT_INSERTED);
    EXPECT_EQ(s1, s2);

    ASSERT_EQ(idx.find(42, found), SmallIndex::Result::OK);
    EXPECT_EQ(found->v, 7);
    EXPECT_EQ(idx.size(), 1u);
}

TEST(ShardedIndexTest, GetAllIsOrderedAndComplete) {
    SmallIndex idx;
    const uint64_t n = 1000;
    for (uint64_t k = n; k >= 1; k--) {
        Slot* s = nullptr;
        idx.get_or_insert(k << 32, s);
        s->v = static_cast<int64_t>(k);
    }
    EXPECT_EQ(idx.size(), n);

    auto all = idx.get_all();
    ASSERT_EQ(all.size(), n);
    uint64_t expected = 1;
    for (auto& [key, slot]: all) {
        EXPECT_EQ(key, expected << 32);
        EXPECT_EQ(slot->v, static_cast<int64_t>(expected));
        expected++;
    }
}

TEST(ShardedIndexTest, ConcurrentInsertOfOneKeyCreatesOneSlot) {
    SmallIndex idx;
    const int num_threads = 8;
    std::atomic<bool> go{false};
    std::atomic<int> created{0};
    std::vector<Slot*> seen(num_threads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            Slot* s = nullptr;
            if (idx.get_or_insert(99, s) == SmallIndex::Result::OK) created++;
            seen[i] = s;
        });
    }
    go.store(true);
    for (auto& th: threads) th.join();

    EXPECT_EQ(created.load(), 1);
    for (int i = 1; i < num_threads; i++) EXPECT_EQ(seen[i], seen[0]);
    EXPECT_EQ(idx.size(), 1u);
}
