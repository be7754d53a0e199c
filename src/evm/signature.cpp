// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "signature.hpp"

#include "hash.hpp"
#include "math.hpp"
#include "serialization.hpp"
#include "util.hpp"

#include <cassert>
#include <cstring>

namespace agentpay::evm {
    namespace {
        using namespace evmc::literals;

        constexpr uint64_t eip155_offset = 35;
        constexpr uint8_t legacy_v_offset = 27;
        constexpr size_t rs_size = 64;

        // Half of the secp256k1 group order.
        constexpr evmc::uint256be half_order
            = 0x7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0_bytes32;

        struct recoverable_sig {
            std::array<unsigned char, rs_size> m_rs{};
            int m_recid{};
        };

        auto sign_recoverable(const privkey_t& key,
                              const hash_t& hash,
                              const secp256k1_context_ptr& ctx)
            -> recoverable_sig {
            secp256k1_ecdsa_recoverable_signature sig;
            [[maybe_unused]] const auto sig_ret
                = secp256k1_ecdsa_sign_recoverable(ctx.get(),
                                                   &sig,
                                                   hash.data(),
                                                   key.data(),
                                                   nullptr,
                                                   nullptr);
            assert(sig_ret == 1);

            auto ret = recoverable_sig();
            [[maybe_unused]] const auto ser_ret
                = secp256k1_ecdsa_recoverable_signature_serialize_compact(
                    ctx.get(),
                    ret.m_rs.data(),
                    &ret.m_recid,
                    &sig);
            assert(ser_ret == 1);
            return ret;
        }

        auto address_from_pubkey(const secp256k1_pubkey& pubkey,
                                 const secp256k1_context_ptr& ctx)
            -> evmc::address {
            auto pubkey_serialized = uncompressed_pubkey_t();
            auto pubkey_size = pubkey_serialized.size();
            [[maybe_unused]] const auto ser_ret
                = secp256k1_ec_pubkey_serialize(ctx.get(),
                                                pubkey_serialized.data(),
                                                &pubkey_size,
                                                &pubkey,
                                                SECP256K1_EC_UNCOMPRESSED);
            assert(ser_ret == 1);

            // Skip the 0x04 prefix and take the last 20 bytes of the hash.
            auto pubkey_hash = keccak_data(pubkey_serialized.data() + 1,
                                           pubkey_size - 1);
            auto addr = evmc::address();
            std::memcpy(addr.bytes,
                        pubkey_hash.data() + (hash_size - sizeof(addr.bytes)),
                        sizeof(addr.bytes));
            return addr;
        }

        auto is_low_s(const evmc::uint256be& s) -> bool {
            return std::memcmp(s.bytes, half_order.bytes, sizeof(s.bytes))
                <= 0;
        }
    }

    auto eth_sign(const privkey_t& key,
                  const hash_t& hash,
                  evm_tx_type type,
                  uint64_t chain_id,
                  const secp256k1_context_ptr& ctx) -> evm_sig {
        auto rsig = sign_recoverable(key, hash, ctx);
        auto sig = evm_sig();
        std::memcpy(sig.m_r.bytes, rsig.m_rs.data(), sizeof(sig.m_r.bytes));
        std::memcpy(sig.m_s.bytes,
                    rsig.m_rs.data() + sizeof(sig.m_r.bytes),
                    sizeof(sig.m_s.bytes));
        auto recid = static_cast<uint64_t>(rsig.m_recid);
        if(type == evm_tx_type::legacy) {
            sig.m_v = evmc::uint256be(chain_id * 2 + eip155_offset + recid);
        } else {
            sig.m_v = evmc::uint256be(recid);
        }
        return sig;
    }

    auto sign_hash(const privkey_t& key,
                   const hash_t& hash,
                   const secp256k1_context_ptr& ctx) -> buffer {
        auto rsig = sign_recoverable(key, hash, ctx);
        auto ret = buffer();
        ret.append(rsig.m_rs.data(), rsig.m_rs.size());
        auto v = static_cast<uint8_t>(legacy_v_offset + rsig.m_recid);
        ret.append(&v, 1);
        return ret;
    }

    auto parse_signature(const buffer& sig) -> std::optional<evm_sig> {
        if(sig.size() != signature_size) {
            return std::nullopt;
        }
        auto v = sig.c_ptr()[rs_size];
        if(v >= legacy_v_offset) {
            v = static_cast<uint8_t>(v - legacy_v_offset);
        }
        if(v > 1) {
            return std::nullopt;
        }
        auto ret = evm_sig();
        std::memcpy(ret.m_r.bytes, sig.c_ptr(), sizeof(ret.m_r.bytes));
        std::memcpy(ret.m_s.bytes,
                    sig.c_ptr() + sizeof(ret.m_r.bytes),
                    sizeof(ret.m_s.bytes));
        ret.m_v = evmc::uint256be(v);
        return ret;
    }

    auto recover_address(const hash_t& hash,
                         const evm_sig& sig,
                         const secp256k1_context_ptr& ctx)
        -> std::variant<evmc::address, recover_error> {
        if(exceeds_uint64(sig.m_v) || to_uint64(sig.m_v) > 1
           || !is_low_s(sig.m_s)) {
            return recover_error::malformed;
        }

        std::array<unsigned char, rs_size> sig_arr{};
        std::memcpy(sig_arr.data(), sig.m_r.bytes, sizeof(sig.m_r.bytes));
        std::memcpy(sig_arr.data() + sizeof(sig.m_r.bytes),
                    sig.m_s.bytes,
                    sizeof(sig.m_s.bytes));
        auto recid = static_cast<int>(to_uint64(sig.m_v));

        secp256k1_ecdsa_recoverable_signature parsed_sig;
        if(secp256k1_ecdsa_recoverable_signature_parse_compact(ctx.get(),
                                                               &parsed_sig,
                                                               sig_arr.data(),
                                                               recid)
           != 1) {
            return recover_error::malformed;
        }

        secp256k1_pubkey pubkey;
        if(secp256k1_ecdsa_recover(ctx.get(),
                                   &pubkey,
                                   &parsed_sig,
                                   hash.data())
           != 1) {
            return recover_error::failed;
        }

        return address_from_pubkey(pubkey, ctx);
    }

    auto check_signature(const evm_tx& tx,
                         uint64_t chain_id,
                         const secp256k1_context_ptr& ctx)
        -> std::optional<evmc::address> {
        auto sig = tx.m_sig;
        if(tx.m_type == evm_tx_type::legacy) {
            auto base = evmc::uint256be(chain_id * 2 + eip155_offset);
            sig.m_v = sig.m_v - base;
        }
        auto sighash = sig_hash(tx, chain_id);
        auto res = recover_address(sighash, sig, ctx);
        if(auto* addr = std::get_if<evmc::address>(&res)) {
            return *addr;
        }
        return std::nullopt;
    }

    auto sig_hash(const evm_tx& tx, uint64_t chain_id) -> hash_t {
        return keccak_data(tx_encode_for_signing(tx, chain_id));
    }

    auto address_from_privkey(const privkey_t& key,
                              const secp256k1_context_ptr& ctx)
        -> std::optional<evmc::address> {
        secp256k1_pubkey pubkey;
        if(secp256k1_ec_pubkey_create(ctx.get(), &pubkey, key.data()) != 1) {
            return std::nullopt;
        }
        return address_from_pubkey(pubkey, ctx);
    }
}
