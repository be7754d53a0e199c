// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_HASH_H_
#define AGENTPAY_SRC_EVM_HASH_H_

#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <cstddef>

namespace agentpay {
    /// Calculates the Keccak-256 hash of the given data.
    /// \param data pointer to the data to hash.
    /// \param len number of bytes to hash.
    /// \return the hash.
    auto keccak_data(const void* data, size_t len) -> hash_t;

    /// Calculates the Keccak-256 hash of a buffer.
    /// \param buf data to hash.
    /// \return the hash.
    auto keccak_data(const buffer& buf) -> hash_t;
}

#endif
