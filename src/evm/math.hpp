// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_EVM_MATH_H_
#define AGENTPAY_SRC_EVM_MATH_H_

#include <evmc/evmc.hpp>
#include <optional>
#include <string>

namespace agentpay::evm {
    auto operator+(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    auto operator-(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    auto operator*(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Shifts the value right by whole bytes.
    auto operator>>(const evmc::uint256be& lhs, size_t count)
        -> evmc::uint256be;

    /// Divides a 256-bit value by a 64-bit divisor.
    /// \param lhs dividend.
    /// \param divisor non-zero divisor.
    /// \param remainder set to the remainder if not null.
    /// \return quotient.
    auto div_u64(const evmc::uint256be& lhs,
                 uint64_t divisor,
                 uint64_t* remainder = nullptr) -> evmc::uint256be;

    /// Formats the value as a base-10 string.
    auto to_decimal(const evmc::uint256be& v) -> std::string;

    /// Parses a base-10 string. Rejects empty strings, non-digits and
    /// values that overflow 256 bits.
    auto from_decimal(const std::string& str)
        -> std::optional<evmc::uint256be>;
}

#endif
