#include "gtest/gtest.h"

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include "arcrw/Arc/RefCounter.hpp"
#include "arcrw/Lock/LockConfig.hpp"

namespace arcrw {

// 越过公开接口直接写入原始计数
class RefCounterTestPeer {
public:
    static void StoreRaw(RefCounter& c, std::size_t raw) { c.word_.store(raw, std::memory_order_release); }
};

} // namespace arcrw

using arcrw::LockConfig;
using arcrw::RefCategory;
using arcrw::RefCounter;
using arcrw::RefCounterTestPeer;

TEST(RefCounterTest, StartsWithOneUnitOfFirstCategory) {
    RefCounter s(RefCategory::Shared);
    EXPECT_EQ(s.load_raw(), LockConfig::kSharedOne);
    EXPECT_EQ(s.shared_count(), 1u);
    EXPECT_EQ(s.unique_count(), 0u);

    RefCounter u(RefCategory::Unique);
    EXPECT_EQ(u.load_raw(), LockConfig::kUniqueOne);
    EXPECT_EQ(u.shared_count(), 0u);
    EXPECT_EQ(u.unique_count(), 1u);
}

TEST(RefCounterTest, HalvesCountIndependently) {
    RefCounter c(RefCategory::Unique);
    c.increment_shared();
    c.increment_shared();
    c.increment_unique();

    EXPECT_EQ(c.shared_count(), 2u);
    EXPECT_EQ(c.unique_count(), 2u);
    EXPECT_EQ(c.load_raw(), 2 * LockConfig::kSharedOne + 2 * LockConfig::kUniqueOne);
}

// 只有把总数减到 0 的那次递减返回 true，与递减顺序无关
TEST(RefCounterTest, OnlyLastDecrementEmpties) {
    RefCounter c(RefCategory::Unique);
    c.increment_shared();
    c.increment_unique();

    EXPECT_FALSE(c.decrement_unique());
    EXPECT_FALSE(c.decrement_shared());  // 还剩一个 unique
    EXPECT_TRUE(c.decrement_unique());
    EXPECT_EQ(c.load_raw(), 0u);
}

TEST(RefCounterTest, SharedLastAfterUniqueEmpties) {
    RefCounter c(RefCategory::Unique);
    c.increment_shared();

    EXPECT_FALSE(c.decrement_unique());
    EXPECT_EQ(c.unique_count(), 0u);
    EXPECT_TRUE(c.decrement_shared());
}

TEST(RefCounterTest, ConcurrentCloneDropEmptiesExactlyOnce) {
    RefCounter c(RefCategory::Shared);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 10000;

    // 先把名额分发出去，再并发归还
    for (int i = 0; i < kThreads * kPerThread; ++i) {
        c.increment(i % 2 ? RefCategory::Shared : RefCategory::Unique);
    }

    std::atomic<int> emptied{0};
    std::vector<std::thread> ts;
    for (int t = 0; t < kThreads; ++t) {
        ts.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const int k = t * kPerThread + i;
                if (c.decrement(k % 2 ? RefCategory::Shared : RefCategory::Unique)) emptied.fetch_add(1);
            }
        });
    }
    for (auto& th : ts) th.join();

    // 仍剩初始的那个 shared 名额
    EXPECT_EQ(emptied.load(), 0);
    EXPECT_EQ(c.load_raw(), LockConfig::kSharedOne);
    EXPECT_TRUE(c.decrement_shared());
}

TEST(RefCounterDeathTest, SharedOverflowAborts) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    ASSERT_DEATH({
        RefCounter c(RefCategory::Shared);
        RefCounterTestPeer::StoreRaw(c, LockConfig::kSharedMax);
        c.increment_shared();
    }, "overflow");
}

TEST(RefCounterDeathTest, UniqueOverflowAborts) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    ASSERT_DEATH({
        RefCounter c(RefCategory::Unique);
        RefCounterTestPeer::StoreRaw(c, LockConfig::kUniqueMax);
        c.increment_unique();
    }, "overflow");
}
