// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_CHAIN_EVM_ADAPTER_H_
#define AGENTPAY_SRC_CHAIN_EVM_ADAPTER_H_

#include "interface.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/http/json_rpc_client.hpp"

#include <memory>
#include <mutex>

namespace agentpay::chain {
    /// Chain adapter for EVM networks speaking Ethereum JSON-RPC. Transfers
    /// are executed by calling transferWithAuthorization on the token
    /// contract from the facilitator's account.
    class evm_adapter : public interface {
      public:
        /// Constructor.
        /// \param cfg network configuration.
        /// \param client JSON-RPC client connected to the network's node.
        /// \param facilitator_key key of the account paying for gas.
        /// \param log log instance.
        evm_adapter(chain_config cfg,
                    std::shared_ptr<rpc::json_rpc_client> client,
                    const privkey_t& facilitator_key,
                    std::shared_ptr<logging::log> log);

        [[nodiscard]] auto config() const -> const chain_config& override;

        auto balance_of(const evmc::address& owner)
            -> result<evmc::uint256be> override;

        auto authorization_used(const evmc::address& authorizer,
                                const evmc::bytes32& nonce)
            -> result<bool> override;

        /// Pre-flights the call with eth_estimateGas, then signs it with the
        /// facilitator key using the account's pending nonce and
        /// broadcasts it.
        auto submit_transfer(const facilitator::payment_authorization& auth)
            -> submission override;

        auto get_receipt(const hash_t& tx_hash)
            -> result<std::optional<evm::evm_tx_receipt>> override;

        auto block_number() -> result<uint64_t> override;

        auto block_hash(uint64_t number)
            -> result<std::optional<hash_t>> override;

        auto call(const evmc::address& to,
                  const buffer& data,
                  const std::optional<evmc::address>& from = std::nullopt)
            -> result<buffer> override;

        auto send_raw_transaction(const buffer& raw_tx)
            -> result<hash_t> override;

        /// Returns the address of the facilitator account.
        [[nodiscard]] auto facilitator_address() const -> evmc::address;

        /// Classifies a failed JSON-RPC call.
        /// \param fail failure details.
        /// \return ledger error. Revert reasons are decoded from
        ///         Error(string) payloads.
        static auto to_error(const rpc::failure& fail) -> error;

      private:
        chain_config m_cfg;
        std::shared_ptr<rpc::json_rpc_client> m_client;
        privkey_t m_key;
        std::shared_ptr<logging::log> m_log;
        secp256k1_context_ptr m_secp{make_secp256k1_context()};
        evmc::address m_address{};

        /// Serializes nonce selection and broadcast of facilitator
        /// transactions.
        std::mutex m_send_mut;

        auto estimate_gas(const buffer& data) -> result<evmc::uint256be>;
        auto fill_fees(evm::evm_tx& tx) -> std::optional<error>;
        auto pending_nonce() -> result<evmc::uint256be>;
    };
}

#endif
