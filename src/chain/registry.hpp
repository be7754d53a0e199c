// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_CHAIN_REGISTRY_H_
#define AGENTPAY_SRC_CHAIN_REGISTRY_H_

#include "interface.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"

#include <functional>
#include <map>
#include <memory>
#include <variant>
#include <vector>

namespace agentpay::chain {
    /// Set of chain adapters keyed by network identifier. Built once at
    /// startup and read-only afterwards.
    class registry {
      public:
        /// Creates the adapter for one network.
        using factory_type = std::function<std::shared_ptr<interface>(
            const chain_config& cfg)>;

        /// Builds one adapter per configured network.
        /// \param configs network configurations.
        /// \param factory adapter factory.
        registry(const std::vector<chain_config>& configs,
                 const factory_type& factory);

        /// Wraps already constructed adapters.
        explicit registry(std::vector<std::shared_ptr<interface>> adapters);

        /// Returns the adapter of a network without performing any I/O.
        /// \param network network identifier.
        /// \return adapter or an UnsupportedChain error.
        [[nodiscard]] auto get(const std::string& network) const
            -> std::variant<std::shared_ptr<interface>, facilitator::error>;

        /// Returns the identifiers of all configured networks in
        /// lexicographic order.
        [[nodiscard]] auto networks() const -> std::vector<std::string>;

        /// Returns the EIP-712 domains of all configured networks.
        [[nodiscard]] auto domains() const
            -> std::vector<facilitator::typed_domain>;

      private:
        std::map<std::string, std::shared_ptr<interface>> m_adapters;
    };

    /// Returns a factory building JSON-RPC adapters for each network
    /// family.
    /// \param facilitator_key key signing settlement transactions.
    /// \param rpc_timeout_ms timeout of each JSON-RPC call.
    /// \param log log instance.
    /// \return adapter factory.
    auto make_adapter_factory(const privkey_t& facilitator_key,
                              long rpc_timeout_ms,
                              std::shared_ptr<logging::log> log)
        -> registry::factory_type;
}

#endif
