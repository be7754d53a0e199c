// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "evm_adapter.hpp"

#include "evm/abi.hpp"
#include "evm/hash.hpp"
#include "evm/math.hpp"
#include "evm/serialization.hpp"
#include "evm/signature.hpp"
#include "evm/util.hpp"

#include <cctype>
#include <cstring>

namespace agentpay::chain {
    namespace {
        constexpr auto balance_of_sig = "balanceOf(address)";
        constexpr auto authorization_state_sig
            = "authorizationState(address,bytes32)";
        constexpr auto transfer_sig
            = "transferWithAuthorization(address,address,uint256,uint256,"
              "uint256,bytes32,uint8,bytes32,bytes32)";

        // EIP-1474 code for execution reverted.
        constexpr int64_t execution_reverted_code = 3;
        constexpr uint64_t gas_margin_pct = 120;
        constexpr uint64_t percent = 100;
        constexpr uint8_t v_offset = 27;

        auto contains(const std::string& haystack, const std::string& needle)
            -> bool {
            auto lower = haystack;
            for(auto& c : lower) {
                c = static_cast<char>(
                    std::tolower(static_cast<unsigned char>(c)));
            }
            return lower.find(needle) != std::string::npos;
        }

        auto as_quantity(const nlohmann::json& j)
            -> std::optional<evmc::uint256be> {
            if(!j.is_string()) {
                return std::nullopt;
            }
            return evm::from_quantity(j.get<std::string>());
        }

        auto as_u64(const nlohmann::json& j) -> std::optional<uint64_t> {
            auto q = as_quantity(j);
            if(!q.has_value() || evm::exceeds_uint64(q.value())) {
                return std::nullopt;
            }
            return evm::to_uint64(q.value());
        }

        auto as_data(const nlohmann::json& j) -> std::optional<buffer> {
            if(!j.is_string()) {
                return std::nullopt;
            }
            return buffer::from_hex_prefixed(j.get<std::string>());
        }

        auto as_hash(const nlohmann::json& j) -> std::optional<hash_t> {
            if(!j.is_string()) {
                return std::nullopt;
            }
            return hash_from_hex(j.get<std::string>());
        }

        auto malformed(const std::string& what) -> error {
            return error{error_kind::transient,
                         "unexpected response to " + what};
        }

        auto scale(const evmc::uint256be& v, uint64_t pct)
            -> evmc::uint256be {
            using evm::operator*;
            return evm::div_u64(v * evmc::uint256be(pct), percent);
        }

        auto u64_quantity(uint64_t v) -> std::string {
            return evm::to_quantity(evmc::uint256be(v));
        }
    }

    evm_adapter::evm_adapter(chain_config cfg,
                             std::shared_ptr<rpc::json_rpc_client> client,
                             const privkey_t& facilitator_key,
                             std::shared_ptr<logging::log> log)
        : m_cfg(std::move(cfg)),
          m_client(std::move(client)),
          m_key(facilitator_key),
          m_log(std::move(log)) {
        auto addr = evm::address_from_privkey(m_key, m_secp);
        if(!addr.has_value()) {
            m_log->fatal("Invalid facilitator key for network",
                         m_cfg.m_network);
        }
        m_address = addr.value();
        m_log->info("EVM adapter for",
                    m_cfg.m_network,
                    "chain",
                    m_cfg.m_chain_id,
                    "facilitator",
                    evm::to_checksum_address(m_address));
    }

    auto evm_adapter::config() const -> const chain_config& {
        return m_cfg;
    }

    auto evm_adapter::facilitator_address() const -> evmc::address {
        return m_address;
    }

    auto evm_adapter::to_error(const rpc::failure& fail) -> error {
        if(fail.transient()) {
            return error{error_kind::transient, fail.m_message};
        }
        if(fail.m_kind == rpc::failure_kind::malformed_response) {
            return error{error_kind::transient, fail.m_message};
        }
        if(fail.m_kind == rpc::failure_kind::http_status) {
            return error{error_kind::rejected, fail.m_message};
        }

        const auto& msg = fail.m_message;
        if(contains(msg, "nonce too low")
           || contains(msg, "replacement transaction underpriced")
           || contains(msg, "already known")) {
            return error{error_kind::transient, msg};
        }
        if(fail.m_code == execution_reverted_code || contains(msg, "revert")) {
            auto reason = msg;
            auto data = buffer::from_hex_prefixed(fail.m_data);
            if(data.has_value()) {
                auto decoded = evm::abi_decode_revert(data.value());
                if(decoded.has_value()) {
                    reason = decoded.value();
                }
            }
            return error{error_kind::reverted, reason};
        }
        return error{error_kind::rejected, msg};
    }

    auto evm_adapter::call(const evmc::address& to,
                           const buffer& data,
                           const std::optional<evmc::address>& from)
        -> result<buffer> {
        auto tx = nlohmann::json{{"to", "0x" + evm::to_hex(to)},
                                 {"data", data.to_hex_prefixed()}};
        if(from.has_value()) {
            tx["from"] = "0x" + evm::to_hex(from.value());
        }
        auto res = m_client->call("eth_call",
                                  nlohmann::json::array({tx, "latest"}));
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            return to_error(*fail);
        }
        auto ret = as_data(std::get<nlohmann::json>(res));
        if(!ret.has_value()) {
            return malformed("eth_call");
        }
        return ret.value();
    }

    auto evm_adapter::balance_of(const evmc::address& owner)
        -> result<evmc::uint256be> {
        auto data = evm::abi_encode_call(balance_of_sig,
                                         {evm::abi_value::from_address(owner)});
        auto res = call(m_cfg.m_token, data);
        if(auto* err = std::get_if<error>(&res)) {
            return *err;
        }
        auto values = evm::abi_decode(std::get<buffer>(res),
                                      {evm::abi_type::uint256});
        if(!values.has_value()) {
            return malformed("balanceOf");
        }
        return values->front().as_uint();
    }

    auto evm_adapter::authorization_used(const evmc::address& authorizer,
                                         const evmc::bytes32& nonce)
        -> result<bool> {
        auto data = evm::abi_encode_call(
            authorization_state_sig,
            {evm::abi_value::from_address(authorizer),
             evm::abi_value::from_bytes32(nonce)});
        auto res = call(m_cfg.m_token, data);
        if(auto* err = std::get_if<error>(&res)) {
            return *err;
        }
        auto values = evm::abi_decode(std::get<buffer>(res),
                                      {evm::abi_type::boolean});
        if(!values.has_value()) {
            return malformed("authorizationState");
        }
        return values->front().as_bool();
    }

    auto evm_adapter::estimate_gas(const buffer& data)
        -> result<evmc::uint256be> {
        auto tx = nlohmann::json{{"from", "0x" + evm::to_hex(m_address)},
                                 {"to", "0x" + evm::to_hex(m_cfg.m_token)},
                                 {"data", data.to_hex_prefixed()}};
        auto res = m_client->call("eth_estimateGas",
                                  nlohmann::json::array({tx}));
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            return to_error(*fail);
        }
        auto gas = as_quantity(std::get<nlohmann::json>(res));
        if(!gas.has_value()) {
            return evmc::uint256be(m_cfg.m_gas_limit);
        }
        return scale(gas.value(), gas_margin_pct);
    }

    auto evm_adapter::fill_fees(evm::evm_tx& tx) -> std::optional<error> {
        if(!m_cfg.m_eip1559) {
            auto res = m_client->call("eth_gasPrice", nlohmann::json::array());
            if(auto* fail = std::get_if<rpc::failure>(&res)) {
                return to_error(*fail);
            }
            auto price = as_quantity(std::get<nlohmann::json>(res));
            if(!price.has_value()) {
                return malformed("eth_gasPrice");
            }
            tx.m_type = evm::evm_tx_type::legacy;
            tx.m_gas_price = scale(price.value(),
                                   m_cfg.m_gas_price_multiplier_pct);
            return std::nullopt;
        }

        auto tip_res = m_client->call("eth_maxPriorityFeePerGas",
                                      nlohmann::json::array());
        if(auto* fail = std::get_if<rpc::failure>(&tip_res)) {
            return to_error(*fail);
        }
        auto tip = as_quantity(std::get<nlohmann::json>(tip_res));

        auto block_res
            = m_client->call("eth_getBlockByNumber",
                             nlohmann::json::array({"latest", false}));
        if(auto* fail = std::get_if<rpc::failure>(&block_res)) {
            return to_error(*fail);
        }
        const auto& block = std::get<nlohmann::json>(block_res);
        if(!tip.has_value() || !block.is_object()
           || !block.contains("baseFeePerGas")) {
            return malformed("eth_getBlockByNumber");
        }
        auto base_fee = as_quantity(block["baseFeePerGas"]);
        if(!base_fee.has_value()) {
            return malformed("eth_getBlockByNumber");
        }

        using evm::operator+;
        using evm::operator*;
        tx.m_type = evm::evm_tx_type::dynamic_fee;
        tx.m_gas_tip_cap = scale(tip.value(),
                                 m_cfg.m_gas_price_multiplier_pct);
        tx.m_gas_fee_cap
            = scale(base_fee.value() * evmc::uint256be(2) + tip.value(),
                    m_cfg.m_gas_price_multiplier_pct);
        return std::nullopt;
    }

    auto evm_adapter::pending_nonce() -> result<evmc::uint256be> {
        auto res = m_client->call(
            "eth_getTransactionCount",
            nlohmann::json::array({"0x" + evm::to_hex(m_address), "pending"}));
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            return to_error(*fail);
        }
        auto nonce = as_quantity(std::get<nlohmann::json>(res));
        if(!nonce.has_value()) {
            return malformed("eth_getTransactionCount");
        }
        return nonce.value();
    }

    auto
    evm_adapter::submit_transfer(const facilitator::payment_authorization& auth)
        -> submission {
        auto sig = evm::parse_signature(auth.m_signature);
        if(!sig.has_value()) {
            return {std::nullopt,
                    error{error_kind::rejected, "malformed signature"}};
        }
        auto v = static_cast<uint8_t>(evm::to_uint64(sig->m_v) + v_offset);

        using evm::abi_value;
        auto data = evm::abi_encode_call(
            transfer_sig,
            {abi_value::from_address(auth.m_from),
             abi_value::from_address(auth.m_to),
             abi_value::from_uint(auth.m_value),
             abi_value::from_uint(auth.m_valid_after),
             abi_value::from_uint(auth.m_valid_before),
             abi_value::from_bytes32(auth.m_nonce),
             abi_value::from_uint8(v),
             abi_value::from_bytes32(sig->m_r),
             abi_value::from_bytes32(sig->m_s)});

        auto gas = estimate_gas(data);
        if(auto* err = std::get_if<error>(&gas)) {
            m_log->warn("Transfer pre-flight on",
                        m_cfg.m_network,
                        "failed:",
                        to_string(err->m_kind),
                        err->m_message);
            return {std::nullopt, *err};
        }

        auto tx = evm::evm_tx();
        tx.m_to = m_cfg.m_token;
        tx.m_gas_limit = std::get<evmc::uint256be>(gas);
        tx.m_input.assign(data.c_ptr(), data.c_ptr() + data.size());
        if(auto err = fill_fees(tx)) {
            return {std::nullopt, err};
        }

        std::unique_lock l(m_send_mut);
        auto nonce = pending_nonce();
        if(auto* err = std::get_if<error>(&nonce)) {
            return {std::nullopt, *err};
        }
        tx.m_nonce = std::get<evmc::uint256be>(nonce);
        auto sighash = evm::sig_hash(tx, m_cfg.m_chain_id);
        tx.m_sig = evm::eth_sign(m_key,
                                 sighash,
                                 tx.m_type,
                                 m_cfg.m_chain_id,
                                 m_secp);
        auto raw = evm::tx_encode(tx, m_cfg.m_chain_id);
        auto tx_hash = keccak_data(raw);

        auto res = m_client->call(
            "eth_sendRawTransaction",
            nlohmann::json::array({raw.to_hex_prefixed()}));
        l.unlock();

        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            if(contains(fail->m_message, "already known")) {
                return {tx_hash, std::nullopt};
            }
            auto err = to_error(*fail);
            m_log->warn("Broadcast of",
                        agentpay::to_string(tx_hash),
                        "on",
                        m_cfg.m_network,
                        "failed:",
                        to_string(err.m_kind),
                        err.m_message);
            return {tx_hash, err};
        }

        m_log->info("Broadcast transfer",
                    agentpay::to_string(tx_hash),
                    "on",
                    m_cfg.m_network);
        return {tx_hash, std::nullopt};
    }

    auto evm_adapter::get_receipt(const hash_t& tx_hash)
        -> result<std::optional<evm::evm_tx_receipt>> {
        auto res = m_client->call(
            "eth_getTransactionReceipt",
            nlohmann::json::array({"0x" + agentpay::to_string(tx_hash)}));
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            return to_error(*fail);
        }
        const auto& j = std::get<nlohmann::json>(res);
        if(j.is_null()) {
            return std::optional<evm::evm_tx_receipt>();
        }
        if(!j.is_object() || !j.contains("status")
           || !j.contains("blockNumber") || !j.contains("blockHash")) {
            return malformed("eth_getTransactionReceipt");
        }
        auto status = as_u64(j["status"]);
        auto number = as_u64(j["blockNumber"]);
        auto block = as_hash(j["blockHash"]);
        if(!status.has_value() || !number.has_value() || !block.has_value()) {
            return malformed("eth_getTransactionReceipt");
        }
        auto receipt = evm::evm_tx_receipt();
        receipt.m_tx_hash = tx_hash;
        receipt.m_success = status.value() == 1;
        receipt.m_block_number = number.value();
        receipt.m_block_hash = block.value();
        if(j.contains("gasUsed")) {
            receipt.m_gas_used
                = as_quantity(j["gasUsed"]).value_or(evmc::uint256be());
        }
        return receipt;
    }

    auto evm_adapter::block_number() -> result<uint64_t> {
        auto res = m_client->call("eth_blockNumber", nlohmann::json::array());
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            return to_error(*fail);
        }
        auto number = as_u64(std::get<nlohmann::json>(res));
        if(!number.has_value()) {
            return malformed("eth_blockNumber");
        }
        return number.value();
    }

    auto evm_adapter::block_hash(uint64_t number)
        -> result<std::optional<hash_t>> {
        auto res = m_client->call(
            "eth_getBlockByNumber",
            nlohmann::json::array({u64_quantity(number), false}));
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            return to_error(*fail);
        }
        const auto& j = std::get<nlohmann::json>(res);
        if(j.is_null()) {
            return std::optional<hash_t>();
        }
        if(!j.is_object() || !j.contains("hash")) {
            return malformed("eth_getBlockByNumber");
        }
        auto h = as_hash(j["hash"]);
        if(!h.has_value()) {
            return malformed("eth_getBlockByNumber");
        }
        return h;
    }

    auto evm_adapter::send_raw_transaction(const buffer& raw_tx)
        -> result<hash_t> {
        auto local_hash = keccak_data(raw_tx);
        auto res
            = m_client->call("eth_sendRawTransaction",
                             nlohmann::json::array({raw_tx.to_hex_prefixed()}));
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            if(contains(fail->m_message, "already known")) {
                return local_hash;
            }
            return to_error(*fail);
        }
        auto h = as_hash(std::get<nlohmann::json>(res));
        if(!h.has_value()) {
            return local_hash;
        }
        return h.value();
    }
}
