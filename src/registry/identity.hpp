// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_REGISTRY_IDENTITY_H_
#define AGENTPAY_SRC_REGISTRY_IDENTITY_H_

#include "chain/registry.hpp"
#include "evm/abi.hpp"
#include "facilitator/messages.hpp"
#include "util/common/logging.hpp"

#include <chrono>
#include <evmc/evmc.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace agentpay::registry {
    /// An agent registered in an identity registry.
    struct agent_identity {
        evmc::uint256be m_id{};
        std::string m_domain;
        evmc::address m_address{};
    };

    /// Read-only client of the ERC-8004 identity registries. Results are
    /// cached for a few seconds; the registry remains the authority.
    class identity_resolver {
      public:
        /// Constructor.
        /// \param chains adapters of all configured networks.
        /// \param ttl lifetime of cached lookups.
        /// \param log log instance.
        identity_resolver(std::shared_ptr<chain::registry> chains,
                          std::chrono::seconds ttl,
                          std::shared_ptr<logging::log> log);

        /// Looks up the agent controlling an address.
        /// \param network network of the registry.
        /// \param addr agent address.
        /// \return identity, NotFound if the address is not registered,
        ///         UnsupportedChain if the network has no identity registry,
        ///         or SettlementUnavailable if the ledger cannot be read.
        auto resolve_by_address(const std::string& network,
                                const evmc::address& addr)
            -> std::variant<agent_identity, facilitator::error>;

        /// Looks up the agent registered under a domain.
        auto resolve_by_domain(const std::string& network,
                               const std::string& domain)
            -> std::variant<agent_identity, facilitator::error>;

        /// Looks up an agent by its numeric identifier.
        auto resolve_by_id(const std::string& network,
                           const evmc::uint256be& id)
            -> std::variant<agent_identity, facilitator::error>;

        /// Returns the number of cached lookups. Expired lookups are
        /// evicted whenever a new result is cached.
        [[nodiscard]] auto cache_size() -> size_t;

      private:
        struct cache_entry {
            agent_identity m_identity;
            std::chrono::steady_clock::time_point m_expiry;
        };

        std::shared_ptr<chain::registry> m_chains;
        std::chrono::seconds m_ttl;
        std::shared_ptr<logging::log> m_log;

        std::mutex m_cache_mut;
        std::map<std::string, cache_entry> m_cache;

        auto lookup(const std::string& network,
                    const std::string& cache_key,
                    const std::string& signature,
                    const evm::abi_value& arg)
            -> std::variant<agent_identity, facilitator::error>;
    };
}

#endif
