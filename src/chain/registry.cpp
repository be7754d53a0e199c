// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry.hpp"

#include "evm_adapter.hpp"
#include "util/rpc/http/client.hpp"

namespace agentpay::chain {
    registry::registry(const std::vector<chain_config>& configs,
                       const factory_type& factory) {
        for(const auto& cfg : configs) {
            m_adapters.emplace(cfg.m_network, factory(cfg));
        }
    }

    registry::registry(std::vector<std::shared_ptr<interface>> adapters) {
        for(auto& adapter : adapters) {
            auto network = adapter->config().m_network;
            m_adapters.emplace(std::move(network), std::move(adapter));
        }
    }

    auto registry::get(const std::string& network) const
        -> std::variant<std::shared_ptr<interface>, facilitator::error> {
        auto it = m_adapters.find(network);
        if(it == m_adapters.end()) {
            return facilitator::error{
                facilitator::error_code::unsupported_chain,
                "network " + network + " is not supported"};
        }
        return it->second;
    }

    auto registry::networks() const -> std::vector<std::string> {
        auto ret = std::vector<std::string>();
        ret.reserve(m_adapters.size());
        for(const auto& entry : m_adapters) {
            ret.push_back(entry.first);
        }
        return ret;
    }

    auto registry::domains() const -> std::vector<facilitator::typed_domain> {
        auto ret = std::vector<facilitator::typed_domain>();
        ret.reserve(m_adapters.size());
        for(const auto& entry : m_adapters) {
            ret.push_back(entry.second->config().domain());
        }
        return ret;
    }

    auto make_adapter_factory(const privkey_t& facilitator_key,
                              long rpc_timeout_ms,
                              std::shared_ptr<logging::log> log)
        -> registry::factory_type {
        return [=](const chain_config& cfg) -> std::shared_ptr<interface> {
            switch(cfg.m_family) {
                case family::evm: {
                    auto client = std::make_shared<rpc::json_rpc_http_client>(
                        cfg.m_rpc_endpoint,
                        rpc_timeout_ms,
                        log);
                    return std::make_shared<evm_adapter>(cfg,
                                                         std::move(client),
                                                         facilitator_key,
                                                         log);
                }
            }
            return nullptr;
        };
    }
}
