// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <cstring>
#include <ethash/keccak.hpp>

namespace agentpay {
    auto keccak_data(const void* data, size_t len) -> hash_t {
        static_assert(sizeof(ethash::hash256) == sizeof(hash_t));
        auto eth_hash
            = ethash::keccak256(static_cast<const uint8_t*>(data), len);
        auto ret = hash_t();
        std::memcpy(ret.data(), eth_hash.bytes, sizeof(eth_hash.bytes));
        return ret;
    }

    auto keccak_data(const buffer& buf) -> hash_t {
        return keccak_data(buf.data(), buf.size());
    }
}
