// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_CHAIN_INTERFACE_H_
#define AGENTPAY_SRC_CHAIN_INTERFACE_H_

#include "config.hpp"
#include "evm/messages.hpp"
#include "facilitator/messages.hpp"
#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <chrono>
#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <variant>

namespace agentpay::chain {
    /// Categories of ledger errors.
    enum class error_kind {
        /// The ledger could not be reached or timed out. The same call may
        /// succeed later.
        transient,
        /// The call executed and reverted.
        reverted,
        /// The ledger refused the request, e.g. insufficient funds.
        rejected,
        /// The requested object does not exist.
        not_found
    };

    auto to_string(error_kind kind) -> std::string;

    /// A ledger error with a human readable reason.
    struct error {
        error_kind m_kind{error_kind::transient};
        std::string m_message;
    };

    /// Value of a ledger call or the reason it failed.
    template<typename T>
    using result = std::variant<T, error>;

    /// Outcome of submitting a transfer. The transaction hash is present
    /// whenever a transaction was signed, even if broadcasting it failed,
    /// so that a later nonce consumption can be attributed to it.
    struct submission {
        std::optional<hash_t> m_tx_hash;
        std::optional<error> m_error;
    };

    /// Capabilities a settlement ledger must provide. One adapter exists
    /// per configured network. Implementations must be safe to call from
    /// multiple threads.
    class interface {
      public:
        virtual ~interface() = default;

        interface() = default;
        interface(const interface&) = delete;
        auto operator=(const interface&) -> interface& = delete;
        interface(interface&&) = delete;
        auto operator=(interface&&) -> interface& = delete;

        /// Returns the network configuration of the adapter.
        [[nodiscard]] virtual auto config() const -> const chain_config& = 0;

        /// Returns the token balance of an account.
        virtual auto balance_of(const evmc::address& owner)
            -> result<evmc::uint256be> = 0;

        /// Returns whether a payer's authorization nonce has been consumed
        /// by the token contract.
        virtual auto authorization_used(const evmc::address& authorizer,
                                        const evmc::bytes32& nonce)
            -> result<bool> = 0;

        /// Signs and broadcasts a transferWithAuthorization call.
        /// \param auth authorization to execute.
        /// \return hash of the signed transaction and any error.
        virtual auto
        submit_transfer(const facilitator::payment_authorization& auth)
            -> submission = 0;

        /// Returns the receipt of a transaction, or std::nullopt if it is
        /// not included in a block.
        virtual auto get_receipt(const hash_t& tx_hash)
            -> result<std::optional<evm::evm_tx_receipt>> = 0;

        /// Returns the current head block number.
        virtual auto block_number() -> result<uint64_t> = 0;

        /// Returns the hash of the canonical block at the given height, or
        /// std::nullopt if there is none.
        virtual auto block_hash(uint64_t number)
            -> result<std::optional<hash_t>> = 0;

        /// Executes a read-only contract call against the latest block.
        /// \param to contract address.
        /// \param data call data.
        /// \param from optional caller address.
        /// \return return data, or a reverted error with the decoded
        ///         reason.
        virtual auto call(const evmc::address& to,
                          const buffer& data,
                          const std::optional<evmc::address>& from
                          = std::nullopt) -> result<buffer> = 0;

        /// Broadcasts a transaction signed by a third party.
        /// \param raw_tx network encoded signed transaction.
        /// \return transaction hash.
        virtual auto send_raw_transaction(const buffer& raw_tx)
            -> result<hash_t> = 0;

        /// Returns the expected time for a transaction to reach the
        /// configured confirmation depth.
        [[nodiscard]] virtual auto confirmation_estimate() const
            -> std::chrono::milliseconds;
    };
}

#endif
