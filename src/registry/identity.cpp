// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "identity.hpp"

#include "evm/util.hpp"

namespace agentpay::registry {
    namespace {
        constexpr auto by_address_sig = "resolveByAddress(address)";
        constexpr auto by_domain_sig = "resolveByDomain(string)";
        constexpr auto by_id_sig = "getAgent(uint256)";

        using facilitator::error;
        using facilitator::error_code;
    }

    identity_resolver::identity_resolver(
        std::shared_ptr<chain::registry> chains,
        std::chrono::seconds ttl,
        std::shared_ptr<logging::log> log)
        : m_chains(std::move(chains)),
          m_ttl(ttl),
          m_log(std::move(log)) {}

    auto identity_resolver::resolve_by_address(const std::string& network,
                                               const evmc::address& addr)
        -> std::variant<agent_identity, error> {
        return lookup(network,
                      network + "/address/" + evm::to_hex(addr),
                      by_address_sig,
                      evm::abi_value::from_address(addr));
    }

    auto identity_resolver::resolve_by_domain(const std::string& network,
                                              const std::string& domain)
        -> std::variant<agent_identity, error> {
        return lookup(network,
                      network + "/domain/" + domain,
                      by_domain_sig,
                      evm::abi_value::from_string(domain));
    }

    auto identity_resolver::resolve_by_id(const std::string& network,
                                          const evmc::uint256be& id)
        -> std::variant<agent_identity, error> {
        return lookup(network,
                      network + "/id/" + evm::to_hex(id),
                      by_id_sig,
                      evm::abi_value::from_uint(id));
    }

    auto identity_resolver::lookup(const std::string& network,
                                   const std::string& cache_key,
                                   const std::string& signature,
                                   const evm::abi_value& arg)
        -> std::variant<agent_identity, error> {
        auto maybe_adapter = m_chains->get(network);
        if(auto* err = std::get_if<error>(&maybe_adapter)) {
            return *err;
        }
        auto& adapter
            = std::get<std::shared_ptr<chain::interface>>(maybe_adapter);
        const auto& registry = adapter->config().m_identity_registry;
        if(!registry.has_value()) {
            return error{error_code::unsupported_chain,
                         "network " + network
                             + " has no identity registry configured"};
        }

        {
            std::unique_lock l(m_cache_mut);
            auto it = m_cache.find(cache_key);
            if(it != m_cache.end()) {
                if(std::chrono::steady_clock::now() < it->second.m_expiry) {
                    return it->second.m_identity;
                }
                m_cache.erase(it);
            }
        }

        auto res = adapter->call(registry.value(),
                                 evm::abi_encode_call(signature, {arg}));
        if(auto* err = std::get_if<chain::error>(&res)) {
            if(err->m_kind == chain::error_kind::transient) {
                return error{error_code::settlement_unavailable,
                             "identity registry unavailable: "
                                 + err->m_message};
            }
            m_log->debug("Identity lookup",
                         cache_key,
                         "reverted:",
                         err->m_message);
            return error{error_code::not_found,
                         "agent " + cache_key + " is not registered"};
        }

        auto values = evm::abi_decode_tuple(std::get<buffer>(res),
                                            {evm::abi_type::uint256,
                                             evm::abi_type::string,
                                             evm::abi_type::address});
        if(!values.has_value()) {
            return error{error_code::settlement_unavailable,
                         "malformed identity registry response"};
        }
        auto identity = agent_identity{(*values)[0].as_uint(),
                                       (*values)[1].as_string(),
                                       (*values)[2].as_address()};
        if(identity.m_id == evmc::uint256be()) {
            return error{error_code::not_found,
                         "agent " + cache_key + " is not registered"};
        }

        auto now = std::chrono::steady_clock::now();
        std::unique_lock l(m_cache_mut);
        for(auto it = m_cache.begin(); it != m_cache.end();) {
            if(it->second.m_expiry <= now) {
                it = m_cache.erase(it);
            } else {
                it++;
            }
        }
        m_cache[cache_key] = cache_entry{identity, now + m_ttl};
        return identity;
    }

    auto identity_resolver::cache_size() -> size_t {
        std::unique_lock l(m_cache_mut);
        return m_cache.size();
    }
}
