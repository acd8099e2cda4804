#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

#include "arcrw/Lock/LockConfig.hpp"
#include "arcrw/Lock/LockWord.hpp"

namespace arcrw {

// 越过公开接口直接写入原始字值
class LockWordTestPeer {
public:
    static void StoreRaw(LockWord& w, std::uint32_t raw) { w.word_.store(raw, std::memory_order_release); }
};

} // namespace arcrw

using arcrw::LockConfig;
using arcrw::LockMode;
using arcrw::LockWord;
using arcrw::LockWordTestPeer;

// 检查“两种模式不同时出现”：计数为 0 时字必须整体为 0
static void ExpectConsistent(const LockWord& w) {
    const std::uint32_t raw = w.load_raw();
    if ((raw >> LockConfig::kCounterShift) == 0) {
        EXPECT_EQ(raw, 0u) << "idle word must not carry the write flag";
    }
}

TEST(LockWordTest, StartsIdle) {
    LockWord w;
    EXPECT_EQ(w.load_raw(), 0u);
    EXPECT_EQ(w.load_mode(), LockMode::Idle);
    EXPECT_EQ(w.load_count(), 0u);
}

TEST(LockWordTest, WritersStackAndReleaseToIdle) {
    LockWord w;
    w.acquire_write();
    EXPECT_EQ(w.load_mode(), LockMode::Writing);
    EXPECT_EQ(w.load_count(), 1u);

    w.acquire_write();
    ASSERT_TRUE(w.try_acquire_write());
    EXPECT_EQ(w.load_count(), 3u);

    // Writing(n>1) -> Writing(n-1)
    w.release_writer();
    EXPECT_EQ(w.load_mode(), LockMode::Writing);
    EXPECT_EQ(w.load_count(), 2u);
    ExpectConsistent(w);

    w.release_writer();
    w.release_writer();
    EXPECT_EQ(w.load_mode(), LockMode::Idle);
    EXPECT_EQ(w.load_raw(), LockWord::kEmpty);
}

TEST(LockWordTest, ReadersStackAndReleaseToIdle) {
    LockWord w;
    w.acquire_read_whole();
    ASSERT_TRUE(w.try_acquire_read_whole());
    EXPECT_EQ(w.load_mode(), LockMode::Reading);
    EXPECT_EQ(w.load_count(), 2u);
    // 读者模式不带写标志
    EXPECT_EQ(w.load_raw() & LockConfig::kWriteFlag, 0u);

    w.release_reader();
    EXPECT_EQ(w.load_count(), 1u);
    w.release_reader();
    EXPECT_EQ(w.load_mode(), LockMode::Idle);
    EXPECT_EQ(w.load_raw(), 0u);
}

TEST(LockWordTest, TryOppositeModeWouldBlock) {
    LockWord w;

    w.acquire_read_whole();
    EXPECT_FALSE(w.try_acquire_write());
    EXPECT_EQ(w.load_mode(), LockMode::Reading);
    EXPECT_EQ(w.load_count(), 1u);
    w.release_reader();

    w.acquire_write();
    EXPECT_FALSE(w.try_acquire_read_whole());
    EXPECT_EQ(w.load_mode(), LockMode::Writing);
    EXPECT_EQ(w.load_count(), 1u);
    w.release_writer();

    // 释放后两种模式都能重新获取
    EXPECT_TRUE(w.try_acquire_write());
    w.release_writer();
    EXPECT_TRUE(w.try_acquire_read_whole());
    w.release_reader();
    EXPECT_EQ(w.load_raw(), 0u);
}

// 写者挂起等待读者离开，读者释放后写者被唤醒
TEST(LockWordTest, BlockedWriterWakesWhenLastReaderLeaves) {
    LockWord w;
    w.acquire_read_whole();
    w.acquire_read_whole();

    std::atomic<bool> acquired{false};
    std::thread writer([&] {
        w.acquire_write();
        acquired.store(true, std::memory_order_release);
        w.release_writer();
    });

    // 足够让写者越过自旋进入挂起
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load(std::memory_order_acquire));

    w.release_reader();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(acquired.load(std::memory_order_acquire)) << "one reader still holds the word";

    w.release_reader();
    writer.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(w.load_raw(), 0u);
}

TEST(LockWordTest, BlockedReaderWakesWhenLastWriterLeaves) {
    LockWord w;
    w.acquire_write();

    std::atomic<bool> acquired{false};
    std::thread reader([&] {
        w.acquire_read_whole();
        acquired.store(true, std::memory_order_release);
        w.release_reader();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load(std::memory_order_acquire));

    w.release_writer();
    reader.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(w.load_raw(), 0u);
}

// 多线程交替两种模式：任何时刻都不会同时存在写者和读者
TEST(LockWordTest, ModesNeverOverlapUnderContention) {
    LockWord w;
    std::atomic<int> writers{0};
    std::atomic<int> readers{0};
    std::atomic<bool> violation{false};

    constexpr int kThreads = 8;
    constexpr int kRounds  = 2000;

    std::vector<std::thread> ts;
    for (int t = 0; t < kThreads; ++t) {
        ts.emplace_back([&, t] {
            for (int i = 0; i < kRounds; ++i) {
                if ((i + t) % 2 == 0) {
                    w.acquire_write();
                    writers.fetch_add(1);
                    if (readers.load() != 0) violation.store(true);
                    writers.fetch_sub(1);
                    w.release_writer();
                } else {
                    w.acquire_read_whole();
                    readers.fetch_add(1);
                    if (writers.load() != 0) violation.store(true);
                    readers.fetch_sub(1);
                    w.release_reader();
                }
            }
        });
    }
    for (auto& th : ts) th.join();

    EXPECT_FALSE(violation.load());
    EXPECT_EQ(w.load_raw(), 0u);
}

TEST(LockWordDeathTest, WriterOverflowAborts) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    ASSERT_DEATH({
        LockWord w;
        LockWordTestPeer::StoreRaw(w, (LockConfig::kLockCounterMax << LockConfig::kCounterShift) | LockConfig::kWriteFlag);
        w.acquire_write();
    }, "counter overflow");
}

TEST(LockWordDeathTest, ReaderOverflowAborts) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    ASSERT_DEATH({
        LockWord w;
        LockWordTestPeer::StoreRaw(w, LockConfig::kLockCounterMax << LockConfig::kCounterShift);
        (void)w.try_acquire_read_whole();
    }, "counter overflow");
}
