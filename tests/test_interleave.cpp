#include <gtest/gtest.h>
#include "finegeo/interleave.hpp"
#include <random>

using namespace finegeo;

// ============================================================================
// spread / squash
// ============================================================================

TEST(InterleaveTest, SpreadPlacesBitsOnEvenPositions) {
    EXPECT_EQ(spread(0), 0ULL);
    EXPECT_EQ(spread(1), 1ULL);
    EXPECT_EQ(spread(2), 4ULL);
    EXPECT_EQ(spread(0x80000000u), 0x4000000000000000ULL);
    EXPECT_EQ(spread(0xFFFFFFFFu), 0x5555555555555555ULL);
}

TEST(InterleaveTest, SquashIgnoresOddBits) {
    EXPECT_EQ(squash(0x5555555555555555ULL), 0xFFFFFFFFu);
    EXPECT_EQ(squash(0xAAAAAAAAAAAAAAAAULL), 0u);
    EXPECT_EQ(squash(0xFFFFFFFFFFFFFFFFULL), 0xFFFFFFFFu);
    EXPECT_EQ(squash(spread(0x12345678u) | 0xAAAAAAAAAAAAAAAAULL), 0x12345678u);
}

// ============================================================================
// interleave / deinterleave
// ============================================================================

TEST(InterleaveTest, KnownKeys) {
    EXPECT_EQ(interleave(0xFFFFFFFFu, 0), 0x5555555555555555ULL);
    EXPECT_EQ(interleave(0, 0xFFFFFFFFu), 0xAAAAAAAAAAAAAAAAULL);
    EXPECT_EQ(interleave(1, 0), 0x1ULL);
    EXPECT_EQ(interleave(0, 1), 0x2ULL);
    EXPECT_EQ(interleave(0x80000000u, 0), 0x4000000000000000ULL);
    EXPECT_EQ(interleave(0, 0x80000000u), 0x8000000000000000ULL);
}

TEST(InterleaveTest, DeinterleaveEdgeValues) {
    const uint32_t values[] = {0u, 1u, 0x80000000u, 0xFFFFFFFFu, 0xDEADBEEFu, 0x0F0F0F0Fu};
    for (uint32_t x : values) {
        for (uint32_t y : values) {
            auto [dx, dy] = deinterleave(interleave(x, y));
            EXPECT_EQ(dx, x);
            EXPECT_EQ(dy, y);
        }
    }
}

TEST(InterleaveTest, DeinterleaveRandomValues) {
    std::mt19937 rng(12345);
    std::uniform_int_distribution<uint32_t> dist;

    for (int i = 0; i < 10000; ++i) {
        uint32_t x = dist(rng);
        uint32_t y = dist(rng);
        auto [dx, dy] = deinterleave(interleave(x, y));
        ASSERT_EQ(dx, x) << "i = " << i;
        ASSERT_EQ(dy, y) << "i = " << i;
    }
}

TEST(InterleaveTest, OrderFollowsZCurve) {
    // Within one 2x2 block the Z-order is (0,0), (1,0), (0,1), (1,1)
    EXPECT_LT(interleave(0, 0), interleave(1, 0));
    EXPECT_LT(interleave(1, 0), interleave(0, 1));
    EXPECT_LT(interleave(0, 1), interleave(1, 1));
}
