// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_KEYS_H_
#define AGENTPAY_SRC_UTIL_COMMON_KEYS_H_

#include <array>
#include <memory>
#include <secp256k1.h>

namespace agentpay {
    /// Size of private keys in bytes.
    static constexpr size_t privkey_size = 32;
    /// Size of uncompressed public keys in bytes, including the 0x04
    /// prefix.
    static constexpr size_t uncompressed_pubkey_size = 65;

    /// A private key of a secp256k1 key pair.
    using privkey_t = std::array<unsigned char, privkey_size>;
    /// An uncompressed secp256k1 public key.
    using uncompressed_pubkey_t
        = std::array<unsigned char, uncompressed_pubkey_size>;

    /// Owning handle for a secp256k1 context.
    using secp256k1_context_ptr
        = std::unique_ptr<secp256k1_context,
                          decltype(&secp256k1_context_destroy)>;

    /// Creates a secp256k1 context usable for signing and verification.
    /// \return owning context handle.
    inline auto make_secp256k1_context() -> secp256k1_context_ptr {
        return {secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                         | SECP256K1_CONTEXT_VERIFY),
                &secp256k1_context_destroy};
    }
}

#endif
