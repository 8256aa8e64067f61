#include "securevault/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <vector>

TEST(SecureRandom, FillEmptyIsNoOp)
{
    std::array<std::uint8_t, 0> bytes{};
    EXPECT_TRUE(securevault::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, FillNonEmptyReturnsTrue)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> bytes{};
    EXPECT_TRUE(securevault::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, ConsecutiveFillsDiffer)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> a{};
    std::array<std::uint8_t, kBytesLen> b{};
    ASSERT_TRUE(securevault::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(securevault::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);
}

TEST(SecureRandom, LargeFillSucceeds)
{
    // Larger than a single getrandom() guarantee.
    std::vector<std::uint8_t> bytes(1024U * 1024U);
    ASSERT_TRUE(securevault::security::secureRandomFill(std::span{ bytes }));
    EXPECT_FALSE(std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0U; }));
}
