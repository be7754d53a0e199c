// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_MESSAGES_H_
#define AGENTPAY_SRC_EVM_MESSAGES_H_

#include "util/common/hash.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <vector>

namespace agentpay::evm {
    struct evm_sig {
        evmc::uint256be m_r;
        evmc::uint256be m_s;
        evmc::uint256be m_v;
    };

    struct evm_access_tuple {
        evmc::address m_address{};
        std::vector<evmc::bytes32> m_storage_keys{};
        auto operator==(const evm_access_tuple& rhs) const -> bool {
            return m_address == rhs.m_address
                && m_storage_keys == rhs.m_storage_keys;
        };
    };

    using evm_access_list = std::vector<evm_access_tuple>;

    enum class evm_tx_type : uint8_t {
        legacy = 0,
        access_list = 1,
        dynamic_fee = 2
    };

    struct evm_tx {
        evm_tx_type m_type{};
        std::optional<evmc::address> m_to{};
        evmc::uint256be m_value{};
        evmc::uint256be m_nonce{};
        evmc::uint256be m_gas_price{};
        evmc::uint256be m_gas_limit{};
        evmc::uint256be m_gas_tip_cap{};
        evmc::uint256be m_gas_fee_cap{};
        std::vector<uint8_t> m_input{};
        evm_access_list m_access_list{};
        evm_sig m_sig;
    };

    /// Inclusion status of a transaction, as reported by
    /// eth_getTransactionReceipt.
    struct evm_tx_receipt {
        hash_t m_tx_hash{};
        /// True if execution succeeded, false if the transaction reverted.
        bool m_success{false};
        uint64_t m_block_number{};
        hash_t m_block_hash{};
        evmc::uint256be m_gas_used{};
    };
}

#endif
