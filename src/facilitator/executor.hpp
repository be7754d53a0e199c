// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_EXECUTOR_H_
#define AGENTPAY_SRC_FACILITATOR_EXECUTOR_H_

#include "chain/registry.hpp"
#include "config.hpp"
#include "messages.hpp"
#include "util/common/logging.hpp"
#include "verifier.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <variant>

namespace agentpay::facilitator {
    /// Verifies payment authorizations and drives their settlement through
    /// RECEIVED, VERIFIED, SUBMITTED and finally CONFIRMED or FAILED.
    /// Holds no per-payment state between calls; the ledger's
    /// authorization state decides whether a payment may be submitted.
    class executor {
      public:
        /// Returns the current UNIX time in seconds.
        using clock_type = std::function<uint64_t()>;

        /// Cancellation flag set when the caller goes away.
        using cancel_flag = std::shared_ptr<std::atomic<bool>>;

        /// Constructor.
        /// \param chains adapters of all configured networks.
        /// \param cfg facilitator configuration.
        /// \param log log instance.
        /// \param clock time source, defaults to the system clock.
        executor(std::shared_ptr<chain::registry> chains,
                 const config& cfg,
                 std::shared_ptr<logging::log> log,
                 clock_type clock = system_clock);

        /// Checks that a payment would settle if submitted now: supported
        /// network, valid signature for the network's domain, validity
        /// window, requirements, unused nonce and sufficient payer
        /// balance. Submits nothing.
        /// \param req payment to check.
        /// \return payer address or the first failed check.
        auto verify(const payment_request& req)
            -> std::variant<evmc::address, error>;

        /// Settles a payment. Transient ledger failures are retried with
        /// bounded exponential backoff, re-checking the nonce before every
        /// submission. Returns only once the transfer has reached the
        /// configured confirmation depth or has definitely failed.
        /// \param req payment to settle.
        /// \param cancelled optional flag set when the caller disconnects.
        /// \return receipt of the confirmed transfer or the error.
        auto settle(const payment_request& req,
                    const cancel_flag& cancelled = nullptr)
            -> std::variant<settlement_receipt, error>;

        /// Default clock reading std::chrono::system_clock.
        static auto system_clock() -> uint64_t;

      private:
        struct context;
        enum class outcome;

        std::shared_ptr<chain::registry> m_chains;
        verifier m_verifier;
        std::chrono::seconds m_clock_skew;
        std::chrono::milliseconds m_settlement_timeout;
        size_t m_max_attempts;
        std::chrono::milliseconds m_backoff_initial;
        std::chrono::milliseconds m_backoff_max;
        std::shared_ptr<logging::log> m_log;
        clock_type m_clock;

        auto check_offline(const chain::interface& adapter,
                           const payment_request& req)
            -> std::variant<evmc::address, error>;

        auto check_balance(chain::interface& adapter,
                           const payment_authorization& auth)
            -> std::optional<error>;

        void transition(context& ctx, settlement_status status);
        auto pause(context& ctx, std::chrono::milliseconds duration) -> bool;
        [[nodiscard]] auto interrupted(const context& ctx) const -> bool;
        auto interruption(const context& ctx) -> error;

        auto find_own_inclusion(context& ctx)
            -> std::optional<evm::evm_tx_receipt>;
        auto await_inclusion(context& ctx, const hash_t& tx_hash)
            -> std::pair<outcome, std::optional<evm::evm_tx_receipt>>;
        auto await_confirmation(context& ctx,
                                const evm::evm_tx_receipt& receipt)
            -> outcome;
        auto after_consumed_nonce(context& ctx)
            -> std::variant<settlement_receipt, error, outcome>;
        auto finish(context& ctx, const evm::evm_tx_receipt& receipt)
            -> settlement_receipt;
    };
}

#endif
