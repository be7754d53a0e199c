// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_UTIL_H_
#define AGENTPAY_SRC_EVM_UTIL_H_

#include "util/common/buffer.hpp"

#include <cstring>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <optional>
#include <string>
#include <type_traits>

namespace agentpay::evm {
    auto to_uint64(const evmc::uint256be& v) -> uint64_t;

    /// Returns true if the value does not fit in 64 bits.
    auto exceeds_uint64(const evmc::uint256be& v) -> bool;

    template<typename T>
    auto to_hex(const T& v) -> std::string {
        return evmc::hex(evmc::bytes(v.bytes, sizeof(v.bytes)));
    }

    /// Parses hexadecimal representation in string format to T
    /// \param hex hex string to parse. May be prefixed with 0x
    /// \return object containing the parsed T or std::nullopt if
    /// parse failed
    template<typename T>
    auto from_hex(const std::string& hex) ->
        typename std::enable_if_t<std::is_same<T, evmc::bytes32>::value
                                      || std::is_same<T, evmc::address>::value,
                                  std::optional<T>> {
        auto maybe_bytes = agentpay::buffer::from_hex_prefixed(hex);
        if(!maybe_bytes.has_value()) {
            return std::nullopt;
        }
        if(maybe_bytes.value().size() != sizeof(T)) {
            return std::nullopt;
        }

        auto val = T();
        std::memcpy(val.bytes,
                    maybe_bytes.value().data(),
                    maybe_bytes.value().size());
        return val;
    }

    /// Formats an address with the EIP-55 mixed-case checksum.
    /// \param addr address to format.
    /// \return 0x-prefixed checksummed address.
    auto to_checksum_address(const evmc::address& addr) -> std::string;

    /// Formats a value as a JSON-RPC quantity: 0x-prefixed hex without
    /// leading zeroes, "0x0" for zero.
    auto to_quantity(const evmc::uint256be& v) -> std::string;

    /// Parses a JSON-RPC quantity.
    /// \param quantity 0x-prefixed hex string of at most 64 digits.
    /// \return the value, or std::nullopt if malformed.
    auto from_quantity(const std::string& quantity)
        -> std::optional<evmc::uint256be>;

    /// Parses an amount given either as a base-10 string or as a
    /// 0x-prefixed hex quantity.
    auto parse_uint256(const std::string& str)
        -> std::optional<evmc::uint256be>;
}

#endif
