// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reputation.hpp"

#include "evm/abi.hpp"
#include "evm/serialization.hpp"
#include "evm/signature.hpp"
#include "evm/util.hpp"

#include <algorithm>
#include <thread>

namespace agentpay::registry {
    namespace {
        using facilitator::error;
        using facilitator::error_code;

        constexpr auto max_poll_interval = std::chrono::milliseconds(1000);
        constexpr auto min_poll_interval = std::chrono::milliseconds(1);
        constexpr auto max_sleep_slice = std::chrono::milliseconds(50);

        auto write_signature(direction dir) -> std::string {
            switch(dir) {
                case direction::client_to_server:
                    return "rateServer(uint256,uint8)";
                case direction::server_to_client:
                    return "rateClient(uint256,uint8)";
                case direction::server_to_validator:
                    return "rateValidator(uint256,uint8)";
            }
            return {};
        }

        auto read_signature(direction dir) -> std::string {
            switch(dir) {
                case direction::client_to_server:
                    return "getServerRating(uint256,uint256)";
                case direction::server_to_client:
                    return "getClientRating(uint256,uint256)";
                case direction::server_to_validator:
                    return "getValidatorRating(uint256,uint256)";
            }
            return {};
        }

        auto chain_unavailable(const chain::error& err, const std::string& what)
            -> error {
            if(err.m_kind == chain::error_kind::transient) {
                return error{error_code::settlement_unavailable,
                             what + ": " + err.m_message};
            }
            return error{error_code::settlement_failed,
                         what + ": " + err.m_message};
        }
    }

    auto to_string(direction dir) -> std::string {
        switch(dir) {
            case direction::client_to_server:
                return "client_to_server";
            case direction::server_to_client:
                return "server_to_client";
            case direction::server_to_validator:
                return "server_to_validator";
        }
        return "unknown";
    }

    auto parse_direction(const std::string& name) -> std::optional<direction> {
        for(auto dir : {direction::client_to_server,
                        direction::server_to_client,
                        direction::server_to_validator}) {
            if(name == to_string(dir)) {
                return dir;
            }
        }
        return std::nullopt;
    }

    reputation_recorder::reputation_recorder(
        std::shared_ptr<chain::registry> chains,
        std::shared_ptr<identity_resolver> identities,
        uint8_t min_score,
        uint8_t max_score,
        std::chrono::milliseconds timeout,
        std::shared_ptr<logging::log> log,
        clock_type clock)
        : m_chains(std::move(chains)),
          m_identities(std::move(identities)),
          m_min_score(min_score),
          m_max_score(max_score),
          m_timeout(timeout),
          m_log(std::move(log)),
          m_clock(std::move(clock)) {}

    auto reputation_recorder::make_call_data(direction dir,
                                             const evmc::uint256be& subject_id,
                                             uint8_t score) -> buffer {
        return evm::abi_encode_call(write_signature(dir),
                                    {evm::abi_value::from_uint(subject_id),
                                     evm::abi_value::from_uint8(score)});
    }

    auto reputation_recorder::check_call(const feedback_request& req,
                                         const evmc::address& registry,
                                         const evm::evm_tx& tx)
        -> std::optional<error> {
        if(!tx.m_to.has_value() || tx.m_to.value() != registry) {
            return error{error_code::malformed_request,
                         "transaction does not call the reputation "
                         "registry"};
        }
        auto input = buffer();
        input.append(tx.m_input.data(), tx.m_input.size());
        if(input != make_call_data(req.m_direction,
                                   req.m_subject_id,
                                   req.m_score)) {
            return error{error_code::malformed_request,
                         "transaction does not record "
                             + to_string(req.m_direction) + " feedback "
                             + std::to_string(req.m_score)
                             + " for the declared subject"};
        }
        return std::nullopt;
    }

    auto reputation_recorder::submit_feedback(const feedback_request& req,
                                              const cancel_flag& cancelled)
        -> std::variant<reputation_record, error> {
        auto maybe_adapter = m_chains->get(req.m_network);
        if(auto* err = std::get_if<error>(&maybe_adapter)) {
            return *err;
        }
        auto adapter
            = std::get<std::shared_ptr<chain::interface>>(maybe_adapter);
        const auto& cfg = adapter->config();
        if(!cfg.m_reputation_registry.has_value()) {
            return error{error_code::unsupported_chain,
                         "network " + req.m_network
                             + " has no reputation registry configured"};
        }

        if(req.m_score < m_min_score || req.m_score > m_max_score) {
            return error{error_code::invalid_score,
                         "score " + std::to_string(req.m_score)
                             + " outside [" + std::to_string(m_min_score)
                             + ", " + std::to_string(m_max_score) + "]"};
        }

        auto maybe_tx = evm::tx_decode(req.m_signed_tx, cfg.m_chain_id);
        if(!maybe_tx.has_value()) {
            return error{error_code::malformed_request,
                         "signed transaction could not be decoded for chain "
                             + std::to_string(cfg.m_chain_id)};
        }
        auto sender
            = evm::check_signature(maybe_tx.value(), cfg.m_chain_id, m_secp);
        if(!sender.has_value()) {
            return error{error_code::invalid_signature,
                         "transaction signature does not recover"};
        }
        if(auto err = check_call(req,
                                 cfg.m_reputation_registry.value(),
                                 maybe_tx.value())) {
            return err.value();
        }

        auto rater = m_identities->resolve_by_address(req.m_network,
                                                      sender.value());
        if(auto* err = std::get_if<error>(&rater)) {
            if(err->m_code == error_code::not_found) {
                return error{error_code::unauthorized_rater,
                             "sender " + evm::to_hex(sender.value())
                                 + " is not a registered agent"};
            }
            return *err;
        }
        auto rater_id = std::get<agent_identity>(rater).m_id;

        auto dry_run = adapter->call(cfg.m_reputation_registry.value(),
                                     make_call_data(req.m_direction,
                                                    req.m_subject_id,
                                                    req.m_score),
                                     sender.value());
        if(auto* err = std::get_if<chain::error>(&dry_run)) {
            if(err->m_kind == chain::error_kind::reverted) {
                m_log->info("Registry refused",
                            to_string(req.m_direction),
                            "feedback from agent",
                            evm::to_hex(rater_id),
                            ":",
                            err->m_message);
                return error{error_code::unauthorized_rater,
                             "registry refused the rater: "
                                 + err->m_message};
            }
            return chain_unavailable(*err, "reputation registry dry-run");
        }

        auto sent = adapter->send_raw_transaction(req.m_signed_tx);
        if(auto* err = std::get_if<chain::error>(&sent)) {
            if(err->m_kind == chain::error_kind::reverted) {
                return error{error_code::unauthorized_rater,
                             "registry refused the rater: "
                                 + err->m_message};
            }
            return chain_unavailable(*err, "relaying feedback");
        }
        auto tx_hash = std::get<hash_t>(sent);
        m_log->info("Relayed",
                    to_string(req.m_direction),
                    "feedback on",
                    req.m_network,
                    "tx",
                    agentpay::to_string(tx_hash));

        auto receipt = await_receipt(*adapter, tx_hash, cancelled);
        if(auto* err = std::get_if<error>(&receipt)) {
            return *err;
        }
        if(!std::get<evm::evm_tx_receipt>(receipt).m_success) {
            return error{error_code::settlement_failed,
                         "feedback transaction "
                             + agentpay::to_string(tx_hash) + " reverted"};
        }

        auto record = reputation_record();
        record.m_direction = req.m_direction;
        record.m_rater_id = rater_id;
        record.m_subject_id = req.m_subject_id;
        record.m_score = req.m_score;
        record.m_timestamp = m_clock();
        record.m_tx_hash = tx_hash;
        return record;
    }

    auto reputation_recorder::await_receipt(chain::interface& adapter,
                                            const hash_t& tx_hash,
                                            const cancel_flag& cancelled)
        -> std::variant<evm::evm_tx_receipt, error> {
        auto interval = std::clamp(
            std::chrono::milliseconds(adapter.config().m_block_time_ms / 2),
            min_poll_interval,
            max_poll_interval);
        auto deadline = std::chrono::steady_clock::now() + m_timeout;
        auto last_error = std::string("not yet included");
        for(;;) {
            auto res = adapter.get_receipt(tx_hash);
            if(auto* err = std::get_if<chain::error>(&res)) {
                last_error = err->m_message;
            } else {
                auto& maybe_receipt
                    = std::get<std::optional<evm::evm_tx_receipt>>(res);
                if(maybe_receipt.has_value()) {
                    return maybe_receipt.value();
                }
            }

            auto wake = std::chrono::steady_clock::now() + interval;
            while(std::chrono::steady_clock::now() < wake) {
                if(cancelled && cancelled->load()) {
                    return error{error_code::settlement_unavailable,
                                 "caller went away after broadcasting "
                                     + agentpay::to_string(tx_hash)};
                }
                if(std::chrono::steady_clock::now() >= deadline) {
                    return error{error_code::settlement_unavailable,
                                 "feedback transaction "
                                     + agentpay::to_string(tx_hash)
                                     + " not included in time: "
                                     + last_error};
                }
                std::this_thread::sleep_for(std::min(
                    max_sleep_slice,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        wake - std::chrono::steady_clock::now())));
            }
        }
    }

    auto reputation_recorder::get_record(const std::string& network,
                                         direction dir,
                                         const evmc::uint256be& rater_id,
                                         const evmc::uint256be& subject_id)
        -> std::variant<reputation_record, error> {
        auto maybe_adapter = m_chains->get(network);
        if(auto* err = std::get_if<error>(&maybe_adapter)) {
            return *err;
        }
        auto adapter
            = std::get<std::shared_ptr<chain::interface>>(maybe_adapter);
        const auto& registry = adapter->config().m_reputation_registry;
        if(!registry.has_value()) {
            return error{error_code::unsupported_chain,
                         "network " + network
                             + " has no reputation registry configured"};
        }

        // The registry keys client ratings as (client, server) and
        // validator ratings as (validator, server).
        auto args = std::vector<evm::abi_value>();
        if(dir == direction::client_to_server) {
            args = {evm::abi_value::from_uint(rater_id),
                    evm::abi_value::from_uint(subject_id)};
        } else {
            args = {evm::abi_value::from_uint(subject_id),
                    evm::abi_value::from_uint(rater_id)};
        }

        auto res = adapter->call(registry.value(),
                                 evm::abi_encode_call(read_signature(dir),
                                                      args));
        if(auto* err = std::get_if<chain::error>(&res)) {
            if(err->m_kind == chain::error_kind::reverted) {
                return error{error_code::not_found,
                             "no " + to_string(dir) + " record"};
            }
            return chain_unavailable(*err, "reputation registry read");
        }
        auto values = evm::abi_decode(
            std::get<buffer>(res),
            {evm::abi_type::boolean, evm::abi_type::uint8});
        if(!values.has_value()) {
            return error{error_code::settlement_unavailable,
                         "malformed reputation registry response"};
        }
        if(!(*values)[0].as_bool()) {
            return error{error_code::not_found,
                         "no " + to_string(dir) + " record from agent "
                             + evm::to_hex(rater_id) + " for agent "
                             + evm::to_hex(subject_id)};
        }

        auto record = reputation_record();
        record.m_direction = dir;
        record.m_rater_id = rater_id;
        record.m_subject_id = subject_id;
        record.m_score = (*values)[1].as_uint8();
        return record;
    }
}
