// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_CHAIN_CONFIG_H_
#define AGENTPAY_SRC_CHAIN_CONFIG_H_

#include "facilitator/messages.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentpay::chain {
    /// Ledger families an adapter can be built for.
    enum class family {
        evm
    };

    /// Parses a family name such as "evm".
    auto parse_family(const std::string& name) -> std::optional<family>;

    /// Immutable settings of one network.
    struct chain_config {
        /// Network identifier used by callers, e.g. "base-sepolia".
        std::string m_network;
        family m_family{family::evm};
        std::string m_rpc_endpoint;
        uint64_t m_chain_id{};
        /// EIP-3009 token contract.
        evmc::address m_token{};
        std::string m_domain_name;
        std::string m_domain_version;
        std::optional<evmc::address> m_identity_registry;
        std::optional<evmc::address> m_reputation_registry;
        uint64_t m_block_time_ms{};
        /// Blocks required on top of the inclusion block.
        uint64_t m_confirmations{};
        bool m_eip1559{false};
        /// Percentage applied to the node's gas price suggestion.
        uint64_t m_gas_price_multiplier_pct{};
        /// Gas limit used when estimation is not available.
        uint64_t m_gas_limit{};

        /// Returns the EIP-712 domain of the network's token.
        [[nodiscard]] auto domain() const -> facilitator::typed_domain;
    };

    /// Reads the per-network sections of the configuration file.
    /// \param opts parsed configuration.
    /// \param log log instance for reporting invalid keys.
    /// \return network configurations, or std::nullopt if a required key
    ///         is missing or invalid.
    auto read_chain_configs(const config::parser& opts,
                            const std::shared_ptr<logging::log>& log)
        -> std::optional<std::vector<chain_config>>;
}

#endif
