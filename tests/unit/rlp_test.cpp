// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "evm/rlp.hpp"

#include <gtest/gtest.h>

namespace {
    auto str_value(const std::string& s) -> agentpay::evm::rlp_value {
        auto buf = agentpay::buffer();
        buf.append(s.data(), s.size());
        return agentpay::evm::rlp_value(buf);
    }
}

TEST(rlp_test, encode_strings) {
    EXPECT_EQ(agentpay::evm::rlp_encode(str_value("dog")).to_hex(),
              "83646f67");
    EXPECT_EQ(agentpay::evm::rlp_encode(str_value("")).to_hex(), "80");
    EXPECT_EQ(agentpay::evm::rlp_encode(str_value("a")).to_hex(), "61");

    auto lorem = std::string(
        "Lorem ipsum dolor sit amet, consectetur adipisicing elit");
    ASSERT_EQ(lorem.size(), 56U);
    auto enc = agentpay::evm::rlp_encode(str_value(lorem));
    ASSERT_EQ(enc.size(), 58U);
    EXPECT_EQ(enc.to_hex().substr(0, 4), "b838");
}

TEST(rlp_test, encode_lists) {
    auto list = agentpay::evm::make_rlp_array(str_value("cat"),
                                              str_value("dog"));
    EXPECT_EQ(agentpay::evm::rlp_encode(list).to_hex(),
              "c88363617483646f67");

    auto empty = agentpay::evm::rlp_value(
        agentpay::evm::rlp_value_type::array);
    EXPECT_EQ(agentpay::evm::rlp_encode(empty).to_hex(), "c0");

    // [ [], [[]], [ [], [[]] ] ]
    auto one = agentpay::evm::make_rlp_array(empty);
    auto nested = agentpay::evm::make_rlp_array(
        empty,
        one,
        agentpay::evm::make_rlp_array(empty, one));
    EXPECT_EQ(agentpay::evm::rlp_encode(nested).to_hex(), "c7c0c1c0c3c0c1c0");
}

TEST(rlp_test, encode_integers) {
    auto zero = agentpay::evm::make_rlp_value(evmc::uint256be(0), true);
    EXPECT_EQ(agentpay::evm::rlp_encode(zero).to_hex(), "80");
    auto fifteen = agentpay::evm::make_rlp_value(evmc::uint256be(15), true);
    EXPECT_EQ(agentpay::evm::rlp_encode(fifteen).to_hex(), "0f");
    auto kilo = agentpay::evm::make_rlp_value(evmc::uint256be(1024), true);
    EXPECT_EQ(agentpay::evm::rlp_encode(kilo).to_hex(), "820400");
}

TEST(rlp_test, decode_list) {
    auto buf = agentpay::buffer::from_hex("c88363617483646f67").value();
    auto val = agentpay::evm::rlp_decode(buf);
    ASSERT_TRUE(val.has_value());
    ASSERT_EQ(val->type(), agentpay::evm::rlp_value_type::array);
    ASSERT_EQ(val->size(), 2U);
    EXPECT_EQ(val->value_at(0).value().to_hex(), "636174");
    EXPECT_EQ(val->value_at(1).value().to_hex(), "646f67");
    EXPECT_EQ(agentpay::evm::rlp_encode(val.value()), buf);
}

TEST(rlp_test, decode_rejects_malformed) {
    auto reject = [](const std::string& hex) {
        auto buf = agentpay::buffer::from_hex(hex).value();
        return !agentpay::evm::rlp_decode(buf).has_value();
    };
    // Truncated payload.
    EXPECT_TRUE(reject("83646f"));
    // Trailing bytes.
    EXPECT_TRUE(reject("83646f6700"));
    // Single byte below 0x80 wrapped in a length prefix.
    EXPECT_TRUE(reject("8100"));
    // Long form used for a short string.
    EXPECT_TRUE(reject("b80161"));
    // Length with a leading zero byte.
    EXPECT_TRUE(reject("b9003861"));
    // List item running past the end of the list.
    EXPECT_TRUE(reject("c283646f67"));
    // Empty input.
    EXPECT_TRUE(reject(""));
}

TEST(rlp_test, integer_conversion) {
    auto val = agentpay::evm::rlp_value(
        agentpay::buffer::from_hex("0400").value());
    auto num = agentpay::evm::rlp_to_uint256(val);
    ASSERT_TRUE(num.has_value());
    EXPECT_EQ(num.value(), evmc::uint256be(1024));

    auto padded = agentpay::evm::rlp_value(
        agentpay::buffer::from_hex("0004").value());
    EXPECT_FALSE(agentpay::evm::rlp_to_uint256(padded).has_value());

    auto empty = agentpay::evm::rlp_value(agentpay::buffer());
    EXPECT_EQ(agentpay::evm::rlp_to_uint256(empty).value(),
              evmc::uint256be(0));

    auto short_addr = agentpay::evm::rlp_value(
        agentpay::buffer::from_hex("0011").value());
    EXPECT_FALSE(agentpay::evm::rlp_to_address(short_addr).has_value());
}

TEST(rlp_test, access_list_round_trip) {
    auto list = agentpay::evm::evm_access_list();
    auto tuple = agentpay::evm::evm_access_tuple();
    tuple.m_address.bytes[19] = 0x42;
    auto key = evmc::bytes32();
    key.bytes[31] = 0x07;
    tuple.m_storage_keys.push_back(key);
    list.push_back(tuple);

    auto enc = agentpay::evm::rlp_encode(
        agentpay::evm::make_rlp_access_list(list));
    auto dec = agentpay::evm::rlp_decode(enc);
    ASSERT_TRUE(dec.has_value());
    auto parsed = agentpay::evm::parse_rlp_access_list(dec.value());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), list);
}
