// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "evm/math.hpp"
#include "evm/util.hpp"

#include <limits>

namespace agentpay::facilitator {
    namespace {
        auto malformed(const std::string& field) -> error {
            return error{error_code::malformed_request,
                         "missing or invalid field: " + field};
        }

        auto parse_object(const std::string& body)
            -> std::optional<nlohmann::json> {
            auto doc = nlohmann::json::parse(body, nullptr, false);
            if(doc.is_discarded() || !doc.is_object()) {
                return std::nullopt;
            }
            return doc;
        }

        auto get_string(const nlohmann::json& obj, const char* key)
            -> std::optional<std::string> {
            auto it = obj.find(key);
            if(it == obj.end() || !it->is_string()) {
                return std::nullopt;
            }
            return it->get<std::string>();
        }

        auto get_address(const nlohmann::json& obj, const char* key)
            -> std::optional<evmc::address> {
            auto str = get_string(obj, key);
            if(!str.has_value()) {
                return std::nullopt;
            }
            return evm::from_hex<evmc::address>(str.value());
        }

        auto get_bytes32(const nlohmann::json& obj, const char* key)
            -> std::optional<evmc::bytes32> {
            auto str = get_string(obj, key);
            if(!str.has_value()) {
                return std::nullopt;
            }
            return evm::from_hex<evmc::bytes32>(str.value());
        }

        auto get_uint256(const nlohmann::json& obj, const char* key)
            -> std::optional<evmc::uint256be> {
            auto it = obj.find(key);
            if(it == obj.end()) {
                return std::nullopt;
            }
            return parse_uint256(*it);
        }

        auto parse_domain(const nlohmann::json& obj)
            -> std::optional<typed_domain> {
            if(!obj.is_object()) {
                return std::nullopt;
            }
            auto name = get_string(obj, "name");
            auto version = get_string(obj, "version");
            auto chain_id = get_uint256(obj, "chainId");
            auto contract = get_address(obj, "verifyingContract");
            if(!name || !version || !chain_id || !contract
               || evm::exceeds_uint64(chain_id.value())) {
                return std::nullopt;
            }
            return typed_domain{name.value(),
                                version.value(),
                                evm::to_uint64(chain_id.value()),
                                contract.value()};
        }

        auto parse_signature_fields(const nlohmann::json& auth)
            -> std::variant<buffer, error> {
            if(auto sig = get_string(auth, "signature")) {
                auto bytes = buffer::from_hex_prefixed(sig.value());
                if(!bytes.has_value()) {
                    return error{error_code::malformed_signature,
                                 "signature is not a hex string"};
                }
                return bytes.value();
            }

            auto r = get_bytes32(auth, "r");
            auto s = get_bytes32(auth, "s");
            auto v = get_uint256(auth, "v");
            if(!r || !s || !v) {
                return malformed("authorization.signature");
            }
            if(evm::to_uint64(v.value()) > 0xff
               || evm::exceeds_uint64(v.value())) {
                return error{error_code::malformed_signature,
                             "signature v out of range"};
            }
            auto sig = buffer();
            sig.append(r->bytes, sizeof(r->bytes));
            sig.append(s->bytes, sizeof(s->bytes));
            auto v_byte = static_cast<uint8_t>(evm::to_uint64(v.value()));
            sig.append(&v_byte, sizeof(v_byte));
            return sig;
        }

        auto parse_authorization(const nlohmann::json& obj)
            -> std::variant<payment_authorization, error> {
            if(!obj.is_object()) {
                return malformed("authorization");
            }
            auto auth = payment_authorization();

            auto from = get_address(obj, "from");
            if(!from) {
                return malformed("authorization.from");
            }
            auth.m_from = from.value();
            auto to = get_address(obj, "to");
            if(!to) {
                return malformed("authorization.to");
            }
            auth.m_to = to.value();
            auto value = get_uint256(obj, "value");
            if(!value) {
                return malformed("authorization.value");
            }
            auth.m_value = value.value();
            auto valid_after = get_uint256(obj, "validAfter");
            if(!valid_after) {
                return malformed("authorization.validAfter");
            }
            auth.m_valid_after = valid_after.value();
            auto valid_before = get_uint256(obj, "validBefore");
            if(!valid_before) {
                return malformed("authorization.validBefore");
            }
            auth.m_valid_before = valid_before.value();
            auto nonce = get_bytes32(obj, "nonce");
            if(!nonce) {
                return malformed("authorization.nonce");
            }
            auth.m_nonce = nonce.value();

            auto sig = parse_signature_fields(obj);
            if(auto* err = std::get_if<error>(&sig)) {
                return *err;
            }
            auth.m_signature = std::get<buffer>(sig);

            auto domain = obj.find("domain");
            if(domain != obj.end() && !domain->is_null()) {
                auto parsed = parse_domain(*domain);
                if(!parsed) {
                    return malformed("authorization.domain");
                }
                auth.m_domain = parsed.value();
            }
            return auth;
        }
    }

    auto parse_uint256(const nlohmann::json& val)
        -> std::optional<evmc::uint256be> {
        if(val.is_number_unsigned()) {
            return evmc::uint256be(val.get<uint64_t>());
        }
        if(val.is_number_integer()) {
            auto v = val.get<int64_t>();
            if(v < 0) {
                return std::nullopt;
            }
            return evmc::uint256be(static_cast<uint64_t>(v));
        }
        if(val.is_string()) {
            return evm::parse_uint256(val.get<std::string>());
        }
        return std::nullopt;
    }

    auto parse_payment_request(const std::string& body)
        -> std::variant<payment_request, error> {
        auto doc = parse_object(body);
        if(!doc) {
            return error{error_code::malformed_request,
                         "body is not a JSON object"};
        }

        auto req = payment_request();
        auto network = get_string(doc.value(), "network");
        if(!network) {
            return malformed("network");
        }
        req.m_network = network.value();

        auto auth_it = doc->find("authorization");
        if(auth_it == doc->end()) {
            return malformed("authorization");
        }
        auto auth = parse_authorization(*auth_it);
        if(auto* err = std::get_if<error>(&auth)) {
            return *err;
        }
        req.m_authorization = std::get<payment_authorization>(auth);

        auto reqs = doc->find("requirements");
        if(reqs != doc->end() && !reqs->is_null()) {
            if(!reqs->is_object()) {
                return malformed("requirements");
            }
            auto amount = get_uint256(*reqs, "amount");
            if(!amount) {
                return malformed("requirements.amount");
            }
            req.m_requirements.m_amount = amount.value();
            if(reqs->contains("payTo")) {
                auto pay_to = get_address(*reqs, "payTo");
                if(!pay_to) {
                    return malformed("requirements.payTo");
                }
                req.m_requirements.m_pay_to = pay_to.value();
            }
        }
        return req;
    }

    auto parse_feedback_request(const std::string& body)
        -> std::variant<registry::feedback_request, error> {
        auto doc = parse_object(body);
        if(!doc) {
            return error{error_code::malformed_request,
                         "body is not a JSON object"};
        }

        auto req = registry::feedback_request();
        auto network = get_string(doc.value(), "network");
        if(!network) {
            return malformed("network");
        }
        req.m_network = network.value();

        auto dir_name = get_string(doc.value(), "direction");
        auto dir = dir_name ? registry::parse_direction(dir_name.value())
                            : std::nullopt;
        if(!dir) {
            return malformed("direction");
        }
        req.m_direction = dir.value();

        auto subject = get_uint256(doc.value(), "subjectId");
        if(!subject) {
            return malformed("subjectId");
        }
        req.m_subject_id = subject.value();

        auto score_it = doc->find("score");
        if(score_it == doc->end() || !score_it->is_number_integer()) {
            return malformed("score");
        }
        auto score = score_it->get<int64_t>();
        if(score < 0 || score > std::numeric_limits<uint8_t>::max()) {
            return error{error_code::invalid_score,
                         "score " + std::to_string(score) + " out of range"};
        }
        req.m_score = static_cast<uint8_t>(score);

        auto raw = get_string(doc.value(), "signedTransaction");
        auto raw_bytes = raw ? buffer::from_hex_prefixed(raw.value())
                             : std::nullopt;
        if(!raw_bytes || raw_bytes->size() == 0) {
            return malformed("signedTransaction");
        }
        req.m_signed_tx = std::move(raw_bytes.value());
        return req;
    }

    auto to_json(const error& err) -> nlohmann::json {
        return {{"error", to_string(err.m_code)}, {"message", err.m_message}};
    }

    auto to_json(const settlement_receipt& receipt) -> nlohmann::json {
        return {
            {"success", receipt.m_status == settlement_status::confirmed},
            {"network", receipt.m_network},
            {"payer", evm::to_checksum_address(receipt.m_payer)},
            {"nonce", "0x" + evm::to_hex(receipt.m_nonce)},
            {"transaction", "0x" + agentpay::to_string(receipt.m_tx_hash)},
            {"status", to_string(receipt.m_status)},
            {"blockNumber", receipt.m_block_number},
            {"blockHash", "0x" + agentpay::to_string(receipt.m_block_hash)}};
    }

    auto to_json(const registry::agent_identity& identity) -> nlohmann::json {
        return {{"agentId", evm::to_decimal(identity.m_id)},
                {"agentDomain", identity.m_domain},
                {"agentAddress", evm::to_checksum_address(identity.m_address)}};
    }

    auto to_json(const registry::reputation_record& record)
        -> nlohmann::json {
        auto obj = nlohmann::json{
            {"direction", registry::to_string(record.m_direction)},
            {"raterId", evm::to_decimal(record.m_rater_id)},
            {"subjectId", evm::to_decimal(record.m_subject_id)},
            {"score", record.m_score}};
        if(record.m_timestamp.has_value()) {
            obj["timestamp"] = record.m_timestamp.value();
        } else {
            obj["timestamp"] = nullptr;
        }
        if(record.m_tx_hash.has_value()) {
            obj["transaction"]
                = "0x" + agentpay::to_string(record.m_tx_hash.value());
        }
        return obj;
    }
}
