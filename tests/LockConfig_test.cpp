// LockConfig_test.cpp
#include <gtest/gtest.h>

#include <cstddef>

#include "arcrw/Arc/ArcAllocation.hpp"
#include "arcrw/Lock/LockConfig.hpp"

using arcrw::LockConfig;

TEST(LockConfig, LockWordLayout) {
    // 写标志独占 bit0，计数单位是 bit1
    EXPECT_EQ(LockConfig::kWriteFlag, 1u);
    EXPECT_EQ(LockConfig::kCounterOne, 2u);
    EXPECT_EQ(LockConfig::kCounterOne & LockConfig::kWriteFlag, 0u);

    // 最大计数左移后恰好占满除写标志外的所有位
    const std::uint32_t max_shifted = LockConfig::kLockCounterMax << LockConfig::kCounterShift;
    EXPECT_EQ(max_shifted | LockConfig::kWriteFlag, 0xFFFFFFFFu);
    EXPECT_GT(LockConfig::kSpinLimit, 0u);
}

TEST(LockConfig, RefcountHalvesDoNotOverlap) {
    EXPECT_EQ(LockConfig::kRefHalfBits * 2, sizeof(std::size_t) * 8);
    EXPECT_EQ(LockConfig::kSharedMax & LockConfig::kUniqueMax, 0u);
    EXPECT_EQ(LockConfig::kUniqueMax % LockConfig::kUniqueOne, 0u);
    EXPECT_EQ(LockConfig::kSharedMax + 1, LockConfig::kUniqueOne);
}

TEST(LockConfig, PayloadOffsetRespectsAlignment) {
    using arcrw::detail::ArcHeader;

    for (std::size_t align : {1u, 2u, 4u, 8u, 16u, 64u, 128u}) {
        const std::size_t off = ArcHeader::PayloadOffset(align);
        EXPECT_GE(off, sizeof(ArcHeader)) << "align=" << align;
        EXPECT_EQ(off % align, 0u) << "align=" << align;
        EXPECT_LT(off - sizeof(ArcHeader), align) << "align=" << align;
    }
}
