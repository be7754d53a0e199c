// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_MESSAGES_H_
#define AGENTPAY_SRC_FACILITATOR_MESSAGES_H_

#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>

namespace agentpay::facilitator {
    /// Stable error kinds reported to callers.
    enum class error_code {
        /// The signature does not recover to the payer.
        invalid_signature,
        /// The authorization was signed for a different domain.
        domain_mismatch,
        /// The signature has the wrong length or out of range values.
        malformed_signature,
        /// The current time is after validBefore.
        expired_authorization,
        /// The current time is before validAfter.
        not_yet_valid,
        /// The nonce has been consumed on chain.
        nonce_already_used,
        /// No adapter is configured for the requested network.
        unsupported_chain,
        /// The ledger could not be reached after retrying.
        settlement_unavailable,
        /// The transfer was rejected by the ledger.
        settlement_failed,
        /// The reputation registry rejected the rater.
        unauthorized_rater,
        /// The request body or one of its fields could not be parsed.
        malformed_request,
        /// The authorized value is below the requested amount.
        insufficient_value,
        /// The payee is not the requested receiver.
        receiver_mismatch,
        /// The score is outside the configured bounds.
        invalid_score,
        /// The requested identity or record does not exist.
        not_found,
        /// The caller went away or the time budget elapsed before
        /// submission.
        cancelled
    };

    /// Returns the stable kind string of an error code, such as
    /// "NonceAlreadyUsed".
    auto to_string(error_code code) -> std::string;

    /// An error kind with a human readable message.
    struct error {
        error_code m_code;
        std::string m_message;
    };

    /// EIP-712 domain a payment authorization is signed under.
    struct typed_domain {
        std::string m_name;
        std::string m_version;
        uint64_t m_chain_id{};
        evmc::address m_verifying_contract{};

        auto operator==(const typed_domain& rhs) const -> bool;
        auto operator!=(const typed_domain& rhs) const -> bool;
    };

    /// Off-chain signed EIP-3009 transferWithAuthorization message.
    struct payment_authorization {
        /// Payer.
        evmc::address m_from{};
        /// Payee.
        evmc::address m_to{};
        evmc::uint256be m_value{};
        evmc::uint256be m_valid_after{};
        evmc::uint256be m_valid_before{};
        evmc::bytes32 m_nonce{};
        /// 65-byte r || s || v signature.
        buffer m_signature;
        /// Domain the payer declares having signed under, if given.
        std::optional<typed_domain> m_domain;
    };

    /// What the resource server requires to be paid.
    struct payment_requirements {
        evmc::uint256be m_amount{};
        std::optional<evmc::address> m_pay_to;
    };

    /// A payment presented for verification or settlement on a network.
    struct payment_request {
        std::string m_network;
        payment_authorization m_authorization;
        payment_requirements m_requirements;
    };

    /// States of a settlement.
    enum class settlement_status {
        received,
        verified,
        submitted,
        confirmed,
        failed
    };

    auto to_string(settlement_status status) -> std::string;

    /// Outcome of a confirmed settlement.
    struct settlement_receipt {
        std::string m_network;
        evmc::address m_payer{};
        evmc::bytes32 m_nonce{};
        hash_t m_tx_hash{};
        settlement_status m_status{settlement_status::received};
        uint64_t m_block_number{};
        hash_t m_block_hash{};
    };
}

#endif
