// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "evm/util.hpp"

#include <set>

namespace agentpay::chain {
    namespace {
        constexpr auto network_prefix = "network";
        constexpr uint64_t default_block_time_ms = 2000;
        constexpr uint64_t default_confirmations = 1;
        constexpr uint64_t default_multiplier_pct = 100;
        constexpr uint64_t default_gas_limit = 150000;
        constexpr auto default_domain_version = "1";

        auto read_address(const config::parser& opts,
                          const std::string& key,
                          const std::shared_ptr<logging::log>& log)
            -> std::optional<std::optional<evmc::address>> {
            auto str = opts.get_string(key);
            if(!str.has_value()) {
                return std::optional<evmc::address>();
            }
            auto addr = evm::from_hex<evmc::address>(str.value());
            if(!addr.has_value()) {
                log->error("Invalid address for", key);
                return std::nullopt;
            }
            return addr;
        }
    }

    auto parse_family(const std::string& name) -> std::optional<family> {
        if(name == "evm") {
            return family::evm;
        }
        return std::nullopt;
    }

    auto chain_config::domain() const -> facilitator::typed_domain {
        return {m_domain_name, m_domain_version, m_chain_id, m_token};
    }

    auto read_chain_configs(const config::parser& opts,
                            const std::shared_ptr<logging::log>& log)
        -> std::optional<std::vector<chain_config>> {
        auto count = opts.get_ulong("network_count");
        if(!count.has_value() || count.value() == 0) {
            log->error("network_count must be at least 1");
            return std::nullopt;
        }

        auto ret = std::vector<chain_config>();
        auto seen = std::set<std::string>();
        for(size_t i = 0; i < count.value(); i++) {
            auto key = [&](const std::string& name) {
                return config::get_key(network_prefix, i, name);
            };
            auto cfg = chain_config();

            auto id = opts.get_string(key("id"));
            if(!id.has_value() || id->empty()) {
                log->error("Missing", key("id"));
                return std::nullopt;
            }
            if(!seen.insert(id.value()).second) {
                log->error("Duplicate network", id.value());
                return std::nullopt;
            }
            cfg.m_network = id.value();

            auto fam_name = opts.get_string(key("family")).value_or("evm");
            auto fam = parse_family(fam_name);
            if(!fam.has_value()) {
                log->error("Unsupported network family",
                           fam_name,
                           "for",
                           cfg.m_network);
                return std::nullopt;
            }
            cfg.m_family = fam.value();

            auto endpoint = opts.get_string(key("rpc_endpoint"));
            if(!endpoint.has_value() || endpoint->empty()) {
                log->error("Missing", key("rpc_endpoint"));
                return std::nullopt;
            }
            cfg.m_rpc_endpoint = endpoint.value();

            auto chain_id = opts.get_ulong(key("chain_id"));
            if(!chain_id.has_value() || chain_id.value() == 0) {
                log->error("Missing or invalid", key("chain_id"));
                return std::nullopt;
            }
            cfg.m_chain_id = chain_id.value();

            auto token = read_address(opts, key("token_address"), log);
            if(!token.has_value() || !token->has_value()) {
                log->error("Missing or invalid", key("token_address"));
                return std::nullopt;
            }
            cfg.m_token = token->value();

            auto domain_name = opts.get_string(key("domain_name"));
            if(!domain_name.has_value()) {
                log->error("Missing", key("domain_name"));
                return std::nullopt;
            }
            cfg.m_domain_name = domain_name.value();
            cfg.m_domain_version = opts.get_string(key("domain_version"))
                                       .value_or(default_domain_version);

            auto identity = read_address(opts, key("identity_registry"), log);
            auto reputation
                = read_address(opts, key("reputation_registry"), log);
            if(!identity.has_value() || !reputation.has_value()) {
                return std::nullopt;
            }
            cfg.m_identity_registry = identity.value();
            cfg.m_reputation_registry = reputation.value();

            cfg.m_block_time_ms = opts.get_ulong(key("block_time_ms"))
                                      .value_or(default_block_time_ms);
            cfg.m_confirmations = opts.get_ulong(key("confirmations"))
                                      .value_or(default_confirmations);
            cfg.m_eip1559 = opts.get_ulong(key("eip1559")).value_or(0) != 0;
            cfg.m_gas_price_multiplier_pct
                = opts.get_ulong(key("gas_price_multiplier_pct"))
                      .value_or(default_multiplier_pct);
            cfg.m_gas_limit
                = opts.get_ulong(key("gas_limit")).value_or(default_gas_limit);

            ret.push_back(std::move(cfg));
        }
        return ret;
    }
}
