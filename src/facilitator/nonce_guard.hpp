// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_NONCE_GUARD_H_
#define AGENTPAY_SRC_FACILITATOR_NONCE_GUARD_H_

#include "chain/interface.hpp"
#include "messages.hpp"

#include <optional>
#include <variant>

namespace agentpay::facilitator {
    /// Result of a nonce check: whether the nonce is consumed, or the
    /// ledger error that prevented the check.
    using nonce_state = std::variant<bool, chain::error>;

    /// Asks the ledger whether an authorization's nonce has been consumed.
    /// The ledger is the only authority; nothing is remembered locally.
    /// \param adapter chain adapter of the authorization's network.
    /// \param auth authorization to check.
    /// \return true if consumed, false if unused, or the ledger error.
    auto query_nonce(chain::interface& adapter,
                     const payment_authorization& auth) -> nonce_state;

    /// Checks that an authorization's nonce is unused.
    /// \param adapter chain adapter of the authorization's network.
    /// \param auth authorization to check.
    /// \return NonceAlreadyUsed if consumed, SettlementUnavailable if the
    ///         ledger could not be read, std::nullopt if unused.
    auto check_nonce(chain::interface& adapter,
                     const payment_authorization& auth)
        -> std::optional<error>;
}

#endif
