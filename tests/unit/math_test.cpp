// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "evm/math.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>

using agentpay::evm::operator+;
using agentpay::evm::operator-;

class math_test : public ::testing::Test {
  protected:
    void SetUp() override {
        for(size_t i = sizeof(m_u128_max.bytes) / 2;
            i < sizeof(m_u128_max.bytes);
            i++) {
            m_u128_max.bytes[i] = 0xff;
        }
        m_u256_max = evmc::uint256be{} - evmc::uint256be(1);
    }

    evmc::uint256be m_u128_max{};
    evmc::uint256be m_u256_max{};
};

TEST_F(math_test, div_small_divisor) {
    auto rem = uint64_t{};
    auto q = agentpay::evm::div_u64(evmc::uint256be(1234567), 100, &rem);
    EXPECT_EQ(q, evmc::uint256be(12345));
    EXPECT_EQ(rem, 67U);

    q = agentpay::evm::div_u64(evmc::uint256be(5), 7, &rem);
    EXPECT_EQ(q, evmc::uint256be());
    EXPECT_EQ(rem, 5U);
}

TEST_F(math_test, div_full_width_divisor) {
    // (2^64 - 1) * (2^64 + 1) = 2^128 - 1
    constexpr auto divisor = std::numeric_limits<uint64_t>::max();
    auto expected = evmc::uint256be();
    expected.bytes[sizeof(expected.bytes) - 9] = 1;
    expected.bytes[sizeof(expected.bytes) - 1] = 1;

    auto rem = uint64_t{1};
    auto q = agentpay::evm::div_u64(m_u128_max, divisor, &rem);
    EXPECT_EQ(q, expected);
    EXPECT_EQ(rem, 0U);

    q = agentpay::evm::div_u64(m_u128_max + evmc::uint256be(5), divisor, &rem);
    EXPECT_EQ(q, expected);
    EXPECT_EQ(rem, 5U);

    // (2^256 - 1) / 2^63 = 2^193 - 1 remainder 2^63 - 1
    auto high = evmc::uint256be();
    high.bytes[7] = 1;
    for(size_t i = 8; i < sizeof(high.bytes); i++) {
        high.bytes[i] = 0xff;
    }
    q = agentpay::evm::div_u64(m_u256_max, uint64_t{1} << 63U, &rem);
    EXPECT_EQ(q, high);
    EXPECT_EQ(rem, (uint64_t{1} << 63U) - 1);
}

TEST_F(math_test, decimal) {
    const auto max_str = std::string("1157920892373161954235709850086879078532"
                                     "69984665640564039457584007913129639935");
    EXPECT_EQ(agentpay::evm::to_decimal(m_u256_max), max_str);
    EXPECT_EQ(agentpay::evm::from_decimal(max_str), m_u256_max);
    EXPECT_FALSE(agentpay::evm::from_decimal(
                     "115792089237316195423570985008687907853269984665640564"
                     "039457584007913129639936")
                     .has_value());
    EXPECT_EQ(agentpay::evm::to_decimal(evmc::uint256be()), "0");
    EXPECT_EQ(agentpay::evm::from_decimal("250000"),
              evmc::uint256be(250000));
    EXPECT_FALSE(agentpay::evm::from_decimal("").has_value());
    EXPECT_FALSE(agentpay::evm::from_decimal("12a").has_value());
}
