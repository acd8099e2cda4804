#include "gtest/gtest.h"

#include <numeric>

#include "arcrw/Lock/SliceRef.hpp"

using arcrw::SliceRef;

TEST(SliceRefTest, DefaultIsEmpty) {
    SliceRef<int> s;
    EXPECT_EQ(s.data(), nullptr);
    EXPECT_EQ(s.size(), 0u);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.begin(), s.end());
}

TEST(SliceRefTest, ViewsAndWritesThroughToStorage) {
    int buf[5] = {0, 1, 2, 3, 4};
    SliceRef<int> s(buf, 5);

    EXPECT_EQ(s.front(), 0);
    EXPECT_EQ(s.back(), 4);
    EXPECT_EQ(std::accumulate(s.begin(), s.end(), 0), 10);

    s[2] = 20;
    EXPECT_EQ(buf[2], 20);
}

TEST(SliceRefTest, SubsliceStaysInsideParent) {
    int buf[6] = {};
    SliceRef<int> s(buf, 6);

    auto mid = s.subslice(2, 3);
    EXPECT_EQ(mid.data(), buf + 2);
    EXPECT_EQ(mid.size(), 3u);

    auto tail = s.subslice(6, 0);
    EXPECT_TRUE(tail.empty());
    EXPECT_EQ(tail.data(), buf + 6);
}

TEST(SliceRefTest, ConvertsToConstView) {
    int buf[2] = {7, 8};
    SliceRef<int> s(buf, 2);
    SliceRef<const int> c = s;
    EXPECT_EQ(c.data(), buf);
    EXPECT_EQ(c[1], 8);
}
