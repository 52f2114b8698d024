// COINKEY - Random Number Generation Tests
// Copyright (c) 2024 COINKEY Developers
// MIT License

#include <gtest/gtest.h>
#include "coinkey/core/random.h"
#include "coinkey/core/types.h"
#include <vector>
#include <algorithm>

using namespace coinkey;

// ============================================================================
// GetRandBytes Tests
// ============================================================================

TEST(RandomTest, GetRandBytesNonZero) {
    // Random bytes should not all be zero (extremely unlikely)
    std::vector<uint8_t> bytes(32);
    GetRandBytes(bytes.data(), bytes.size());
    
    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandBytesDifferent) {
    std::vector<uint8_t> bytes1(32);
    std::vector<uint8_t> bytes2(32);
    
    GetRandBytes(bytes1.data(), bytes1.size());
    GetRandBytes(bytes2.data(), bytes2.size());
    
    EXPECT_NE(bytes1, bytes2);
}

TEST(RandomTest, GetRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetRandBytes(&dummy, 0));
}

TEST(RandomTest, GetRandBytesLargeBuffer) {
    std::vector<uint8_t> bytes(4096);
    EXPECT_NO_THROW(GetRandBytes(bytes.data(), bytes.size()));
    
    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandUint64) {
    // Four draws colliding is astronomically unlikely
    uint64_t a = GetRandUint64();
    uint64_t b = GetRandUint64();
    uint64_t c = GetRandUint64();
    uint64_t d = GetRandUint64();
    EXPECT_FALSE(a == b && b == c && c == d);
}

// ============================================================================
// EntropySource Tests
// ============================================================================

TEST(EntropySourceTest, OsSourceFillsBuffer) {
    std::vector<uint8_t> bytes(32, 0);
    GetOsEntropySource().GetBytes(bytes.data(), bytes.size());
    
    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(EntropySourceTest, SharedInstance) {
    EXPECT_EQ(&GetOsEntropySource(), &GetOsEntropySource());
}
