// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_VERIFIER_H_
#define AGENTPAY_SRC_FACILITATOR_VERIFIER_H_

#include "messages.hpp"
#include "util/common/keys.hpp"

#include <chrono>
#include <optional>
#include <variant>
#include <vector>

namespace agentpay::facilitator {
    /// Checks that a payment authorization was signed by its payer for a
    /// given domain.
    class verifier {
      public:
        /// Constructor.
        /// \param known_domains domains of all configured networks. Used to
        ///                      diagnose signatures made for another
        ///                      network.
        explicit verifier(std::vector<typed_domain> known_domains);

        /// Recovers the signer of an authorization under the target
        /// domain and compares it with the payer.
        /// \param target domain of the network the payment is settled on.
        /// \param auth authorization to check.
        /// \return payer address, or MalformedSignature if the signature
        ///         cannot be parsed, DomainMismatch if the authorization
        ///         was signed under another domain, InvalidSignature
        ///         otherwise.
        [[nodiscard]] auto verify(const typed_domain& target,
                                  const payment_authorization& auth) const
            -> std::variant<evmc::address, error>;

      private:
        std::vector<typed_domain> m_known_domains;
        secp256k1_context_ptr m_secp{make_secp256k1_context()};
    };

    /// Checks validAfter - skew <= now <= validBefore.
    /// \param auth authorization to check.
    /// \param now current UNIX time in seconds.
    /// \param skew tolerance applied to validAfter only.
    /// \return ExpiredAuthorization, NotYetValid or std::nullopt if the
    ///         authorization is currently valid.
    auto check_validity_window(const payment_authorization& auth,
                               uint64_t now,
                               std::chrono::seconds skew)
        -> std::optional<error>;

    /// Checks the authorization against what the resource server asked
    /// for.
    /// \return InsufficientValue, ReceiverMismatch or std::nullopt.
    auto check_requirements(const payment_authorization& auth,
                            const payment_requirements& requirements)
        -> std::optional<error>;
}

#endif
