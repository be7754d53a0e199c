// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "evm/hash.hpp"
#include "evm/util.hpp"
#include "facilitator/format.hpp"

#include <gtest/gtest.h>

class format_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_domain = agentpay::test::make_chain_config("net-x", 84532).domain();
        m_auth = agentpay::test::make_authorization(
            agentpay::test::make_key(0x11),
            agentpay::test::make_address(0x42),
            250000,
            m_domain,
            1700000000,
            0x07);
        m_body = agentpay::test::make_payment_body("net-x", m_auth);
    }

    static auto code_of(const std::string& body)
        -> std::optional<agentpay::facilitator::error_code> {
        auto res = agentpay::facilitator::parse_payment_request(body);
        if(auto* err = std::get_if<agentpay::facilitator::error>(&res)) {
            return err->m_code;
        }
        return std::nullopt;
    }

    static auto feedback_code_of(const nlohmann::json& body)
        -> std::optional<agentpay::facilitator::error_code> {
        auto res = agentpay::facilitator::parse_feedback_request(body.dump());
        if(auto* err = std::get_if<agentpay::facilitator::error>(&res)) {
            return err->m_code;
        }
        return std::nullopt;
    }

    agentpay::facilitator::typed_domain m_domain;
    agentpay::facilitator::payment_authorization m_auth;
    nlohmann::json m_body;
};

TEST_F(format_test, payment_request) {
    m_body["requirements"] = {{"amount", "0x3d090"},
                              {"payTo",
                               agentpay::evm::to_checksum_address(
                                   agentpay::test::make_address(0x42))}};
    auto res = agentpay::facilitator::parse_payment_request(m_body.dump());
    ASSERT_TRUE(std::holds_alternative<agentpay::facilitator::payment_request>(
        res));
    auto req = std::get<agentpay::facilitator::payment_request>(res);
    EXPECT_EQ(req.m_network, "net-x");
    EXPECT_EQ(req.m_authorization.m_from, m_auth.m_from);
    EXPECT_EQ(req.m_authorization.m_to, m_auth.m_to);
    EXPECT_EQ(req.m_authorization.m_value, m_auth.m_value);
    EXPECT_EQ(req.m_authorization.m_valid_after, m_auth.m_valid_after);
    EXPECT_EQ(req.m_authorization.m_valid_before, m_auth.m_valid_before);
    EXPECT_EQ(req.m_authorization.m_nonce, m_auth.m_nonce);
    EXPECT_EQ(req.m_authorization.m_signature, m_auth.m_signature);
    EXPECT_FALSE(req.m_authorization.m_domain.has_value());
    EXPECT_EQ(req.m_requirements.m_amount, evmc::uint256be(250000));
    EXPECT_EQ(req.m_requirements.m_pay_to,
              agentpay::test::make_address(0x42));
}

TEST_F(format_test, split_signature_and_domain) {
    auto& auth = m_body["authorization"];
    auth.erase("signature");
    const auto* sig = m_auth.m_signature.c_ptr();
    auto r = agentpay::buffer();
    r.append(sig, 32);
    auto s = agentpay::buffer();
    s.append(sig + 32, 32);
    auth["r"] = r.to_hex_prefixed();
    auth["s"] = s.to_hex_prefixed();
    auth["v"] = sig[64];
    auth["value"] = 250000;
    auth["domain"] = {{"name", m_domain.m_name},
                      {"version", m_domain.m_version},
                      {"chainId", "84532"},
                      {"verifyingContract",
                       agentpay::evm::to_checksum_address(
                           m_domain.m_verifying_contract)}};

    auto res = agentpay::facilitator::parse_payment_request(m_body.dump());
    ASSERT_TRUE(std::holds_alternative<agentpay::facilitator::payment_request>(
        res));
    auto req = std::get<agentpay::facilitator::payment_request>(res);
    EXPECT_EQ(req.m_authorization.m_signature, m_auth.m_signature);
    EXPECT_EQ(req.m_authorization.m_value, evmc::uint256be(250000));
    ASSERT_TRUE(req.m_authorization.m_domain.has_value());
    EXPECT_EQ(req.m_authorization.m_domain.value(), m_domain);
    EXPECT_EQ(req.m_requirements.m_amount, evmc::uint256be(0));
}

TEST_F(format_test, malformed_payment_requests) {
    using agentpay::facilitator::error_code;
    EXPECT_EQ(code_of("not json"), error_code::malformed_request);
    EXPECT_EQ(code_of("[1, 2]"), error_code::malformed_request);

    auto without = [&](const std::string& field) {
        auto body = m_body;
        body["authorization"].erase(field);
        return body.dump();
    };
    EXPECT_EQ(code_of(without("from")), error_code::malformed_request);
    EXPECT_EQ(code_of(without("nonce")), error_code::malformed_request);
    EXPECT_EQ(code_of(without("signature")), error_code::malformed_request);

    auto body = m_body;
    body.erase("network");
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_request);

    body = m_body;
    body["authorization"]["value"] = -5;
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_request);

    body = m_body;
    body["authorization"]["to"] = "0x1234";
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_request);

    body = m_body;
    body["authorization"]["nonce"] = "0x01";
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_request);

    body = m_body;
    body["authorization"]["signature"] = "0xnothex";
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_signature);

    body = m_body;
    body["authorization"]["domain"] = {{"name", "USD Coin"}};
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_request);

    body = m_body;
    body["requirements"] = {{"payTo", "0x00"}};
    EXPECT_EQ(code_of(body.dump()), error_code::malformed_request);

    // A short signature is left for the verifier to report.
    body = m_body;
    body["authorization"]["signature"] = "0x1234";
    EXPECT_FALSE(code_of(body.dump()).has_value());
}

TEST_F(format_test, uint256_values) {
    using agentpay::facilitator::parse_uint256;
    EXPECT_EQ(parse_uint256(nlohmann::json(42)), evmc::uint256be(42));
    EXPECT_EQ(parse_uint256(nlohmann::json("42")), evmc::uint256be(42));
    EXPECT_EQ(parse_uint256(nlohmann::json("0x2a")), evmc::uint256be(42));
    EXPECT_FALSE(parse_uint256(nlohmann::json(-1)).has_value());
    EXPECT_FALSE(parse_uint256(nlohmann::json(1.5)).has_value());
    EXPECT_FALSE(parse_uint256(nlohmann::json("4x2")).has_value());
    EXPECT_FALSE(parse_uint256(nlohmann::json(nullptr)).has_value());
}

TEST_F(format_test, feedback_request) {
    auto raw = agentpay::test::make_signed_call(
        agentpay::test::make_key(0x11),
        84532,
        agentpay::test::make_address(0xcc),
        agentpay::registry::reputation_recorder::make_call_data(
            agentpay::registry::direction::client_to_server,
            evmc::uint256be(3),
            90),
        0);
    auto body = nlohmann::json{{"network", "net-x"},
                               {"direction", "client_to_server"},
                               {"subjectId", "3"},
                               {"score", 90},
                               {"signedTransaction", raw.to_hex_prefixed()}};
    auto res = agentpay::facilitator::parse_feedback_request(body.dump());
    ASSERT_TRUE(
        std::holds_alternative<agentpay::registry::feedback_request>(res));
    auto req = std::get<agentpay::registry::feedback_request>(res);
    EXPECT_EQ(req.m_network, "net-x");
    EXPECT_EQ(req.m_direction,
              agentpay::registry::direction::client_to_server);
    EXPECT_EQ(req.m_subject_id, evmc::uint256be(3));
    EXPECT_EQ(req.m_score, 90);
    EXPECT_EQ(req.m_signed_tx, raw);

    using agentpay::facilitator::error_code;
    auto bad = body;
    bad["score"] = 300;
    EXPECT_EQ(feedback_code_of(bad), error_code::invalid_score);
    bad["score"] = -1;
    EXPECT_EQ(feedback_code_of(bad), error_code::invalid_score);
    bad["score"] = "90";
    EXPECT_EQ(feedback_code_of(bad), error_code::malformed_request);

    bad = body;
    bad["direction"] = "validator_to_server";
    EXPECT_EQ(feedback_code_of(bad), error_code::malformed_request);

    bad = body;
    bad["signedTransaction"] = "0x";
    EXPECT_EQ(feedback_code_of(bad), error_code::malformed_request);

    bad = body;
    bad.erase("subjectId");
    EXPECT_EQ(feedback_code_of(bad), error_code::malformed_request);
}

TEST_F(format_test, responses) {
    auto err = agentpay::facilitator::error{
        agentpay::facilitator::error_code::nonce_already_used,
        "nonce consumed"};
    EXPECT_EQ(agentpay::facilitator::to_json(err),
              (nlohmann::json{{"error", "NonceAlreadyUsed"},
                              {"message", "nonce consumed"}}));

    auto receipt = agentpay::facilitator::settlement_receipt();
    receipt.m_network = "net-x";
    receipt.m_payer = m_auth.m_from;
    receipt.m_nonce = m_auth.m_nonce;
    receipt.m_tx_hash = agentpay::keccak_data("tx", 2);
    receipt.m_status = agentpay::facilitator::settlement_status::confirmed;
    receipt.m_block_number = 12;
    auto j = agentpay::facilitator::to_json(receipt);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["status"], "CONFIRMED");
    EXPECT_EQ(j["payer"], agentpay::evm::to_checksum_address(m_auth.m_from));
    EXPECT_EQ(j["transaction"],
              "0x" + agentpay::to_string(receipt.m_tx_hash));
    EXPECT_EQ(j["blockNumber"], 12);

    auto identity = agentpay::registry::agent_identity{
        evmc::uint256be(7),
        "alice.example",
        agentpay::test::make_address(0x07)};
    j = agentpay::facilitator::to_json(identity);
    EXPECT_EQ(j["agentId"], "7");
    EXPECT_EQ(j["agentDomain"], "alice.example");
    EXPECT_EQ(j["agentAddress"],
              "0x0000000000000000000000000000000000000007");

    auto record = agentpay::registry::reputation_record();
    record.m_direction = agentpay::registry::direction::server_to_validator;
    record.m_rater_id = evmc::uint256be(3);
    record.m_subject_id = evmc::uint256be(9);
    record.m_score = 80;
    j = agentpay::facilitator::to_json(record);
    EXPECT_EQ(j["direction"], "server_to_validator");
    EXPECT_EQ(j["raterId"], "3");
    EXPECT_EQ(j["subjectId"], "9");
    EXPECT_EQ(j["score"], 80);
    EXPECT_TRUE(j["timestamp"].is_null());
    EXPECT_FALSE(j.contains("transaction"));

    record.m_timestamp = 1700000000;
    record.m_tx_hash = receipt.m_tx_hash;
    j = agentpay::facilitator::to_json(record);
    EXPECT_EQ(j["timestamp"], 1700000000);
    EXPECT_TRUE(j.contains("transaction"));
}
