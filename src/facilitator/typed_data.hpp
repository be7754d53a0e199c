// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_TYPED_DATA_H_
#define AGENTPAY_SRC_FACILITATOR_TYPED_DATA_H_

#include "messages.hpp"
#include "util/common/hash.hpp"

namespace agentpay::facilitator {
    /// EIP-712 type string of the domain.
    static constexpr auto domain_type
        = "EIP712Domain(string name,string version,uint256 chainId,"
          "address verifyingContract)";

    /// EIP-712 type string of the EIP-3009 transfer authorization.
    static constexpr auto transfer_type
        = "TransferWithAuthorization(address from,address to,uint256 value,"
          "uint256 validAfter,uint256 validBefore,bytes32 nonce)";

    /// Computes the EIP-712 domain separator.
    /// \param domain domain to hash.
    /// \return hashStruct of the domain.
    auto domain_separator(const typed_domain& domain) -> hash_t;

    /// Computes the struct hash of a transfer authorization.
    auto transfer_struct_hash(const payment_authorization& auth) -> hash_t;

    /// Computes the digest the payer signs:
    /// keccak256(0x19 0x01 || domainSeparator || structHash).
    /// \param domain domain the authorization is bound to.
    /// \param auth authorization fields. The signature is ignored.
    /// \return signing digest.
    auto transfer_digest(const typed_domain& domain,
                         const payment_authorization& auth) -> hash_t;
}

#endif
