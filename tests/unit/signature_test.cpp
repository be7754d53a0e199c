// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "evm/hash.hpp"
#include "evm/math.hpp"
#include "evm/serialization.hpp"
#include "evm/signature.hpp"
#include "evm/util.hpp"

#include <gtest/gtest.h>

class signature_test : public ::testing::Test {
  protected:
    void SetUp() override {
        // Example transaction from EIP-155.
        m_tx.m_type = agentpay::evm::evm_tx_type::legacy;
        m_tx.m_nonce = evmc::uint256be(9);
        m_tx.m_gas_price = evmc::uint256be(20000000000);
        m_tx.m_gas_limit = evmc::uint256be(21000);
        m_tx.m_to = agentpay::evm::from_hex<evmc::address>(
            "0x3535353535353535353535353535353535353535");
        m_tx.m_value = evmc::uint256be(1000000000000000000);
    }

    agentpay::secp256k1_context_ptr m_secp{
        agentpay::make_secp256k1_context()};
    agentpay::privkey_t m_key{agentpay::test::make_key(0x46)};
    agentpay::evm::evm_tx m_tx{};
    static constexpr uint64_t m_chain_id = 1;
};

TEST_F(signature_test, address_from_key) {
    auto addr = agentpay::evm::address_from_privkey(m_key, m_secp);
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(agentpay::evm::to_checksum_address(addr.value()),
              "0x9d8A62f656a8d1615C1294fd71e9CFb3E4855A4F");

    auto zero = agentpay::privkey_t();
    EXPECT_FALSE(
        agentpay::evm::address_from_privkey(zero, m_secp).has_value());
}

TEST_F(signature_test, eip155_signing) {
    auto sighash = agentpay::evm::sig_hash(m_tx, m_chain_id);
    EXPECT_EQ(agentpay::to_string(sighash),
              "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e"
              "53");

    m_tx.m_sig = agentpay::evm::eth_sign(m_key,
                                         sighash,
                                         m_tx.m_type,
                                         m_chain_id,
                                         m_secp);
    EXPECT_EQ(m_tx.m_sig.m_v, evmc::uint256be(37));
    auto raw = agentpay::evm::tx_encode(m_tx, m_chain_id);
    EXPECT_EQ(raw.to_hex(),
              "f86c098504a817c800825208943535353535353535353535353535353535353535"
              "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d"
              "3c71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9"
              "f3dc64214b297fb1966a3b6d83");
}

TEST_F(signature_test, legacy_decode_and_recover) {
    m_tx.m_sig = agentpay::evm::eth_sign(m_key,
                                         agentpay::evm::sig_hash(m_tx,
                                                                 m_chain_id),
                                         m_tx.m_type,
                                         m_chain_id,
                                         m_secp);
    auto raw = agentpay::evm::tx_encode(m_tx, m_chain_id);

    auto decoded = agentpay::evm::tx_decode(raw, m_chain_id);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->m_nonce, m_tx.m_nonce);
    EXPECT_EQ(decoded->m_value, m_tx.m_value);
    EXPECT_EQ(decoded->m_to, m_tx.m_to);
    EXPECT_EQ(agentpay::evm::tx_id(decoded.value(), m_chain_id),
              agentpay::keccak_data(raw));

    auto sender
        = agentpay::evm::check_signature(decoded.value(), m_chain_id, m_secp);
    ASSERT_TRUE(sender.has_value());
    EXPECT_EQ(sender.value(), agentpay::test::address_of(m_key));

    // Replay protection binds the signature to the chain.
    EXPECT_FALSE(agentpay::evm::tx_decode(raw, 5).has_value());
}

TEST_F(signature_test, dynamic_fee_round_trip) {
    m_tx.m_type = agentpay::evm::evm_tx_type::dynamic_fee;
    m_tx.m_gas_tip_cap = evmc::uint256be(1000000000);
    m_tx.m_gas_fee_cap = evmc::uint256be(30000000000);
    m_tx.m_input = {0xde, 0xad, 0xbe, 0xef};
    constexpr uint64_t chain_id = 84532;
    m_tx.m_sig = agentpay::evm::eth_sign(m_key,
                                         agentpay::evm::sig_hash(m_tx,
                                                                 chain_id),
                                         m_tx.m_type,
                                         chain_id,
                                         m_secp);
    EXPECT_LE(agentpay::evm::to_uint64(m_tx.m_sig.m_v), 1U);

    auto raw = agentpay::evm::tx_encode(m_tx, chain_id);
    EXPECT_EQ(raw.c_ptr()[0], 0x02);
    auto decoded = agentpay::evm::tx_decode(raw, chain_id);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->m_type, agentpay::evm::evm_tx_type::dynamic_fee);
    EXPECT_EQ(decoded->m_input, m_tx.m_input);
    EXPECT_EQ(decoded->m_gas_fee_cap, m_tx.m_gas_fee_cap);
    auto sender
        = agentpay::evm::check_signature(decoded.value(), chain_id, m_secp);
    ASSERT_TRUE(sender.has_value());
    EXPECT_EQ(sender.value(), agentpay::test::address_of(m_key));

    EXPECT_FALSE(agentpay::evm::tx_decode(raw, 1).has_value());

    // Corrupting the payload breaks decoding or changes the signer.
    auto corrupt = raw;
    static_cast<uint8_t*>(corrupt.data())[corrupt.size() - 40] ^= 0x01;
    auto bad = agentpay::evm::tx_decode(corrupt, chain_id);
    if(bad.has_value()) {
        auto other
            = agentpay::evm::check_signature(bad.value(), chain_id, m_secp);
        EXPECT_NE(other, sender);
    }
}

TEST_F(signature_test, digest_sign_and_recover) {
    auto digest = agentpay::keccak_data("payload", 7);
    auto sig = agentpay::evm::sign_hash(m_key, digest, m_secp);
    ASSERT_EQ(sig.size(), agentpay::evm::signature_size);
    auto v = sig.c_ptr()[agentpay::evm::signature_size - 1];
    EXPECT_TRUE(v == 27 || v == 28);

    auto parsed = agentpay::evm::parse_signature(sig);
    ASSERT_TRUE(parsed.has_value());
    auto res = agentpay::evm::recover_address(digest, parsed.value(), m_secp);
    ASSERT_TRUE(std::holds_alternative<evmc::address>(res));
    EXPECT_EQ(std::get<evmc::address>(res),
              agentpay::test::address_of(m_key));

    // A different digest recovers a different address.
    auto other = agentpay::evm::recover_address(agentpay::keccak_data("x", 1),
                                                parsed.value(),
                                                m_secp);
    if(std::holds_alternative<evmc::address>(other)) {
        EXPECT_NE(std::get<evmc::address>(other),
                  agentpay::test::address_of(m_key));
    }
}

TEST_F(signature_test, malformed_signatures) {
    auto digest = agentpay::keccak_data("payload", 7);
    auto sig = agentpay::evm::sign_hash(m_key, digest, m_secp);

    auto short_sig = agentpay::buffer();
    short_sig.append(sig.data(), sig.size() - 1);
    EXPECT_FALSE(agentpay::evm::parse_signature(short_sig).has_value());

    auto bad_v = sig;
    static_cast<uint8_t*>(bad_v.data())[sig.size() - 1] = 29;
    EXPECT_FALSE(agentpay::evm::parse_signature(bad_v).has_value());

    auto zero_v = sig;
    static_cast<uint8_t*>(zero_v.data())[sig.size() - 1]
        = static_cast<uint8_t>(sig.c_ptr()[sig.size() - 1] - 27);
    EXPECT_TRUE(agentpay::evm::parse_signature(zero_v).has_value());

    // The high-s twin of a valid signature is rejected.
    auto parsed = agentpay::evm::parse_signature(sig).value();
    auto order = agentpay::evm::from_hex<evmc::bytes32>(
                     "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")
                     .value();
    using agentpay::evm::operator-;
    parsed.m_s = order - parsed.m_s;
    parsed.m_v = evmc::uint256be(1) - parsed.m_v;
    auto res = agentpay::evm::recover_address(digest, parsed, m_secp);
    ASSERT_TRUE(std::holds_alternative<agentpay::evm::recover_error>(res));
    EXPECT_EQ(std::get<agentpay::evm::recover_error>(res),
              agentpay::evm::recover_error::malformed);
}
