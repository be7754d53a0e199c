// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "hash.hpp"
#include "math.hpp"

#include <cctype>

namespace agentpay::evm {
    auto to_uint64(const evmc::uint256be& v) -> uint64_t {
        return evmc::load64be(&v.bytes[sizeof(v.bytes) - sizeof(uint64_t)]);
    }

    auto exceeds_uint64(const evmc::uint256be& v) -> bool {
        for(size_t i = 0; i < sizeof(v.bytes) - sizeof(uint64_t); i++) {
            if(v.bytes[i] != 0) {
                return true;
            }
        }
        return false;
    }

    auto to_checksum_address(const evmc::address& addr) -> std::string {
        auto lower = to_hex(addr);
        auto h = keccak_data(lower.data(), lower.size());
        auto ret = std::string("0x");
        for(size_t i = 0; i < lower.size(); i++) {
            auto nibble = (i % 2 == 0) ? (h[i / 2] >> 4U) : (h[i / 2] & 0xfU);
            auto c = lower[i];
            if(std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8) {
                c = static_cast<char>(
                    std::toupper(static_cast<unsigned char>(c)));
            }
            ret.push_back(c);
        }
        return ret;
    }

    auto to_quantity(const evmc::uint256be& v) -> std::string {
        auto hex = to_hex(v);
        auto first = hex.find_first_not_of('0');
        if(first == std::string::npos) {
            return "0x0";
        }
        return "0x" + hex.substr(first);
    }

    auto from_quantity(const std::string& quantity)
        -> std::optional<evmc::uint256be> {
        static constexpr size_t max_digits = 64;
        if(quantity.size() < 3 || quantity.compare(0, 2, "0x") != 0) {
            return std::nullopt;
        }
        auto digits = quantity.substr(2);
        if(digits.size() > max_digits) {
            return std::nullopt;
        }
        digits.insert(0, max_digits - digits.size(), '0');
        auto maybe_buf = buffer::from_hex(digits);
        if(!maybe_buf.has_value()) {
            return std::nullopt;
        }
        auto ret = evmc::uint256be{};
        std::memcpy(ret.bytes, maybe_buf->data(), sizeof(ret.bytes));
        return ret;
    }

    auto parse_uint256(const std::string& str)
        -> std::optional<evmc::uint256be> {
        if(str.compare(0, 2, "0x") == 0) {
            return from_quantity(str);
        }
        return from_decimal(str);
    }
}
