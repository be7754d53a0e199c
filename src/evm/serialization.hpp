// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_SERIALIZATION_H_
#define AGENTPAY_SRC_EVM_SERIALIZATION_H_

#include "messages.hpp"
#include "rlp.hpp"
#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <optional>

namespace agentpay::evm {
    /// Serializes a signed transaction in its network encoding. Legacy
    /// transactions are encoded as an RLP list with an EIP-155 v value,
    /// typed transactions are the type byte followed by the RLP payload.
    /// \param tx transaction to encode.
    /// \param chain_id chain ID of the transaction.
    /// \return raw transaction bytes.
    auto tx_encode(const evm_tx& tx, uint64_t chain_id) -> buffer;

    /// Serializes the unsigned portion of a transaction as it is hashed for
    /// signing.
    /// \param tx transaction to encode.
    /// \param chain_id chain ID of the transaction.
    /// \return signing payload.
    auto tx_encode_for_signing(const evm_tx& tx, uint64_t chain_id)
        -> buffer;

    /// Deserializes a signed raw transaction. Legacy transactions must carry
    /// an EIP-155 v value for the given chain. Typed transactions must
    /// declare the given chain ID.
    /// \param buf raw transaction bytes.
    /// \param chain_id expected chain ID.
    /// \return transaction or std::nullopt if malformed or for another
    ///         chain.
    auto tx_decode(const buffer& buf, uint64_t chain_id)
        -> std::optional<evm_tx>;

    /// Returns the transaction hash of a signed transaction.
    /// \param tx transaction to hash.
    /// \param chain_id chain ID of the transaction.
    /// \return keccak256 of the network encoding.
    auto tx_id(const evm_tx& tx, uint64_t chain_id) -> hash_t;
}

#endif
