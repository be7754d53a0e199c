// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_SIGNATURE_H_
#define AGENTPAY_SRC_EVM_SIGNATURE_H_

#include "messages.hpp"
#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"
#include "util/common/keys.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <variant>

namespace agentpay::evm {
    /// Size of a serialized r || s || v signature.
    static constexpr size_t signature_size = 65;

    /// Reasons a signature cannot be recovered to an address.
    enum class recover_error {
        /// Wrong length, v outside {0, 1, 27, 28}, r or s out of range, or
        /// s in the upper half of the curve order.
        malformed,
        /// Well-formed signature from which no public key can be recovered.
        failed
    };

    /// Signs a hash using a privkey_t using ecdsa and produces an evm_sig
    /// struct. Legacy transactions get an EIP-155 v value, typed
    /// transactions get the y-parity.
    /// \param key key to sign with
    /// \param hash hash to sign
    /// \param type transaction type the signature is for
    /// \param chain_id chain ID the transaction is for
    /// \param ctx secp256k1 context to use
    /// \return the signature value encoded in r,s,v values in an evm_sig struct
    auto eth_sign(const privkey_t& key,
                  const hash_t& hash,
                  evm_tx_type type,
                  uint64_t chain_id,
                  const secp256k1_context_ptr& ctx) -> evm_sig;

    /// Signs a 32-byte digest and returns the 65-byte r || s || v
    /// serialization with v in {27, 28}.
    /// \param key key to sign with.
    /// \param hash digest to sign.
    /// \param ctx secp256k1 context to use.
    /// \return serialized signature.
    auto sign_hash(const privkey_t& key,
                   const hash_t& hash,
                   const secp256k1_context_ptr& ctx) -> buffer;

    /// Parses a 65-byte r || s || v signature. v may be 0, 1, 27 or 28 and
    /// is normalized to the recovery ID.
    /// \param sig serialized signature.
    /// \return signature or std::nullopt if malformed.
    auto parse_signature(const buffer& sig) -> std::optional<evm_sig>;

    /// Recovers the signer address of a digest.
    /// \param hash signed digest.
    /// \param sig signature with v holding the recovery ID.
    /// \param ctx secp256k1 context to use.
    /// \return signer address or the reason recovery failed.
    auto recover_address(const hash_t& hash,
                         const evm_sig& sig,
                         const secp256k1_context_ptr& ctx)
        -> std::variant<evmc::address, recover_error>;

    /// Checks the signature of an EVM transaction
    /// \param tx transaction to check signature for
    /// \param chain_id chain ID the transaction is for
    /// \param ctx secp256k1 context to use
    /// \return the sender's address if valid, std::nullopt otherwise
    auto check_signature(const evm_tx& tx,
                         uint64_t chain_id,
                         const secp256k1_context_ptr& ctx)
        -> std::optional<evmc::address>;

    /// Calculates the hash for creating / validating the signature
    /// \param tx transaction to calculate the sighash for
    /// \param chain_id chain ID the transaction is for
    /// \return the sighash of the transaction
    auto sig_hash(const evm_tx& tx, uint64_t chain_id) -> hash_t;

    /// Derives the EVM address controlled by a private key.
    /// \param key private key.
    /// \param ctx secp256k1 context to use.
    /// \return address, or std::nullopt if the key is invalid.
    auto address_from_privkey(const privkey_t& key,
                              const secp256k1_context_ptr& ctx)
        -> std::optional<evmc::address>;
}

#endif
