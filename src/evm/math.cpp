// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "math.hpp"

#include <algorithm>
#include <limits>

namespace agentpay::evm {
    auto operator+(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        auto tmp = uint64_t{};
        auto carry = uint8_t{};
        constexpr uint64_t max_val = std::numeric_limits<uint8_t>::max();
        for(int i = sizeof(lhs.bytes) - 1; i >= 0; i--) {
            tmp = lhs.bytes[i] + rhs.bytes[i] + carry;
            carry = (tmp > max_val);
            ret.bytes[i] = (tmp & max_val);
        }
        return ret;
    }

    auto operator-(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        auto tmp1 = uint64_t{};
        auto tmp2 = uint64_t{};
        auto res = uint64_t{};
        auto borrow = uint8_t{};
        constexpr uint64_t max_val = std::numeric_limits<uint8_t>::max();
        for(int i = sizeof(lhs.bytes) - 1; i >= 0; i--) {
            tmp1 = lhs.bytes[i] + (max_val + 1);
            tmp2 = rhs.bytes[i] + borrow;
            res = tmp1 - tmp2;
            ret.bytes[i] = (res & max_val);
            borrow = (res <= max_val);
        }
        return ret;
    }

    auto operator*(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        // Byte i carries weight 256^(31 - i); the product of bytes i and j
        // lands at index i + j - 31.
        constexpr int width = sizeof(lhs.bytes);
        auto ret = evmc::uint256be{};
        for(int i = width - 1; i >= 0; i--) {
            auto row = evmc::uint256be{};
            for(int j = width - 1; j >= 0; j--) {
                auto pos = i + j - (width - 1);
                if(pos < 0) {
                    continue;
                }
                uint64_t intermediate = lhs.bytes[i] * rhs.bytes[j];
                auto tmp = evmc::uint256be(intermediate);
                auto shifted = evmc::uint256be{};
                auto shift = (width - 1) - pos;
                for(int k = width - 1; k - shift >= 0; k--) {
                    shifted.bytes[k - shift] = tmp.bytes[k];
                }
                row = row + shifted;
            }
            ret = ret + row;
        }
        return ret;
    }

    auto operator>>(const evmc::uint256be& lhs, size_t count)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        if(count >= sizeof(lhs.bytes)) {
            return ret;
        }
        for(size_t i = count; i < sizeof(lhs.bytes); i++) {
            ret.bytes[i] = lhs.bytes[i - count];
        }
        return ret;
    }

    auto div_u64(const evmc::uint256be& lhs,
                 uint64_t divisor,
                 uint64_t* remainder) -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        uint64_t rem{0};
        for(size_t i = 0; i < sizeof(lhs.bytes); i++) {
            for(unsigned bit = 8; bit-- > 0;) {
                // rem < divisor, so the shifted value is below
                // 2 * divisor even when the shift carries out.
                auto carry = (rem >> 63U) != 0;
                rem = (rem << 1U)
                    | static_cast<uint64_t>((lhs.bytes[i] >> bit) & 1U);
                if(carry || rem >= divisor) {
                    rem -= divisor;
                    ret.bytes[i] |= static_cast<uint8_t>(1U << bit);
                }
            }
        }
        if(remainder != nullptr) {
            *remainder = static_cast<uint64_t>(rem);
        }
        return ret;
    }

    auto to_decimal(const evmc::uint256be& v) -> std::string {
        static constexpr uint64_t base = 10;
        auto ret = std::string();
        auto cur = v;
        while(cur != evmc::uint256be{}) {
            auto rem = uint64_t{};
            cur = div_u64(cur, base, &rem);
            ret.push_back(static_cast<char>('0' + rem));
        }
        if(ret.empty()) {
            return "0";
        }
        std::reverse(ret.begin(), ret.end());
        return ret;
    }

    auto from_decimal(const std::string& str)
        -> std::optional<evmc::uint256be> {
        static constexpr uint64_t base = 10;
        if(str.empty()) {
            return std::nullopt;
        }
        // ret * 10 + d must not exceed 2^256 - 1.
        auto rem = uint64_t{};
        const auto max_div
            = div_u64(evmc::uint256be{} - evmc::uint256be(1), base, &rem);
        auto ret = evmc::uint256be{};
        for(auto c : str) {
            if(c < '0' || c > '9') {
                return std::nullopt;
            }
            auto digit = static_cast<uint64_t>(c - '0');
            if(max_div < ret || (ret == max_div && digit > rem)) {
                return std::nullopt;
            }
            ret = ret * evmc::uint256be(base) + evmc::uint256be(digit);
        }
        return ret;
    }
}
