// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "typed_data.hpp"

#include "evm/abi.hpp"
#include "evm/hash.hpp"

#include <cstring>
#include <string>

namespace agentpay::facilitator {
    namespace {
        auto hash_string(const std::string& str) -> evmc::bytes32 {
            auto h = keccak_data(str.data(), str.size());
            auto ret = evmc::bytes32();
            std::memcpy(ret.bytes, h.data(), h.size());
            return ret;
        }
    }

    auto domain_separator(const typed_domain& domain) -> hash_t {
        using evm::abi_value;
        auto encoded = evm::abi_encode(
            {abi_value::from_bytes32(hash_string(domain_type)),
             abi_value::from_bytes32(hash_string(domain.m_name)),
             abi_value::from_bytes32(hash_string(domain.m_version)),
             abi_value::from_uint(evmc::uint256be(domain.m_chain_id)),
             abi_value::from_address(domain.m_verifying_contract)});
        return keccak_data(encoded);
    }

    auto transfer_struct_hash(const payment_authorization& auth) -> hash_t {
        using evm::abi_value;
        auto encoded = evm::abi_encode(
            {abi_value::from_bytes32(hash_string(transfer_type)),
             abi_value::from_address(auth.m_from),
             abi_value::from_address(auth.m_to),
             abi_value::from_uint(auth.m_value),
             abi_value::from_uint(auth.m_valid_after),
             abi_value::from_uint(auth.m_valid_before),
             abi_value::from_bytes32(auth.m_nonce)});
        return keccak_data(encoded);
    }

    auto transfer_digest(const typed_domain& domain,
                         const payment_authorization& auth) -> hash_t {
        static constexpr std::array<uint8_t, 2> prefix{0x19, 0x01};
        auto sep = domain_separator(domain);
        auto struct_hash = transfer_struct_hash(auth);
        auto buf = buffer();
        buf.append(prefix.data(), prefix.size());
        buf.append(sep.data(), sep.size());
        buf.append(struct_hash.data(), struct_hash.size());
        return keccak_data(buf);
    }
}
