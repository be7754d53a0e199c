// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_COMMON_HASH_H_
#define AGENTPAY_SRC_UTIL_COMMON_HASH_H_

#include <array>
#include <optional>
#include <string>

namespace agentpay {
    /// Size of 256-bit hashes in bytes.
    static constexpr size_t hash_size = 32;

    /// 256-bit hash value.
    using hash_t = std::array<unsigned char, hash_size>;

    /// Converts a hash to a hex string.
    /// \param val hash to convert.
    /// \return hex string without prefix.
    auto to_string(const hash_t& val) -> std::string;

    /// Parses a hex string into a hash.
    /// \param val hex string to parse, may be prefixed with 0x.
    /// \return hash, or std::nullopt if the string is not 32 bytes of hex.
    auto hash_from_hex(const std::string& val) -> std::optional<hash_t>;
}

#endif
