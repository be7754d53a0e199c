// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "serialization.hpp"

#include "hash.hpp"
#include "math.hpp"
#include "util.hpp"

namespace agentpay::evm {
    namespace {
        constexpr size_t legacy_field_count = 9;
        constexpr size_t access_list_field_count = 11;
        constexpr size_t dynamic_fee_field_count = 12;
        constexpr uint64_t eip155_offset = 35;

        auto make_to(const std::optional<evmc::address>& to) -> rlp_value {
            if(to.has_value()) {
                return make_rlp_value(to.value());
            }
            return rlp_value(buffer());
        }

        auto make_input(const std::vector<uint8_t>& input) -> rlp_value {
            auto buf = buffer();
            buf.append(input.data(), input.size());
            return rlp_value(buf);
        }

        // Appends the fields shared by signed and unsigned encodings.
        auto make_payload(const evm_tx& tx, uint64_t chain_id) -> rlp_value {
            auto chain = make_rlp_value(evmc::uint256be(chain_id), true);
            switch(tx.m_type) {
                case evm_tx_type::legacy:
                    return make_rlp_array(make_rlp_value(tx.m_nonce, true),
                                          make_rlp_value(tx.m_gas_price, true),
                                          make_rlp_value(tx.m_gas_limit, true),
                                          make_to(tx.m_to),
                                          make_rlp_value(tx.m_value, true),
                                          make_input(tx.m_input));
                case evm_tx_type::access_list:
                    return make_rlp_array(
                        chain,
                        make_rlp_value(tx.m_nonce, true),
                        make_rlp_value(tx.m_gas_price, true),
                        make_rlp_value(tx.m_gas_limit, true),
                        make_to(tx.m_to),
                        make_rlp_value(tx.m_value, true),
                        make_input(tx.m_input),
                        make_rlp_access_list(tx.m_access_list));
                case evm_tx_type::dynamic_fee:
                    return make_rlp_array(
                        chain,
                        make_rlp_value(tx.m_nonce, true),
                        make_rlp_value(tx.m_gas_tip_cap, true),
                        make_rlp_value(tx.m_gas_fee_cap, true),
                        make_rlp_value(tx.m_gas_limit, true),
                        make_to(tx.m_to),
                        make_rlp_value(tx.m_value, true),
                        make_input(tx.m_input),
                        make_rlp_access_list(tx.m_access_list));
            }
            return rlp_value(rlp_value_type::array);
        }

        auto with_type_prefix(evm_tx_type type, const buffer& payload)
            -> buffer {
            if(type == evm_tx_type::legacy) {
                return payload;
            }
            auto ret = buffer();
            auto b = static_cast<uint8_t>(type);
            ret.append(&b, 1);
            ret.append(payload);
            return ret;
        }

        auto parse_to(const rlp_value& v)
            -> std::optional<std::optional<evmc::address>> {
            if(v.type() != rlp_value_type::buffer) {
                return std::nullopt;
            }
            if(v.value().size() == 0) {
                return std::optional<evmc::address>();
            }
            auto addr = rlp_to_address(v);
            if(!addr.has_value()) {
                return std::nullopt;
            }
            return addr;
        }

        auto parse_input(const rlp_value& v, evm_tx& tx) -> bool {
            if(v.type() != rlp_value_type::buffer) {
                return false;
            }
            const auto& data = v.value();
            tx.m_input.assign(data.c_ptr(), data.c_ptr() + data.size());
            return true;
        }

        auto parse_legacy(const rlp_value& rlp, uint64_t chain_id)
            -> std::optional<evm_tx> {
            if(rlp.size() != legacy_field_count) {
                return std::nullopt;
            }
            auto tx = evm_tx();
            tx.m_type = evm_tx_type::legacy;
            auto nonce = rlp_to_uint256(rlp.value_at(0));
            auto gas_price = rlp_to_uint256(rlp.value_at(1));
            auto gas_limit = rlp_to_uint256(rlp.value_at(2));
            auto to = parse_to(rlp.value_at(3));
            auto value = rlp_to_uint256(rlp.value_at(4));
            auto v = rlp_to_uint256(rlp.value_at(6));
            auto r = rlp_to_uint256(rlp.value_at(7));
            auto s = rlp_to_uint256(rlp.value_at(8));
            if(!nonce || !gas_price || !gas_limit || !to || !value || !v
               || !r || !s || !parse_input(rlp.value_at(5), tx)) {
                return std::nullopt;
            }

            // Only replay-protected signatures for this chain are accepted.
            auto base = evmc::uint256be(chain_id) * evmc::uint256be(2)
                      + evmc::uint256be(eip155_offset);
            if(v.value() != base
               && v.value() != base + evmc::uint256be(1)) {
                return std::nullopt;
            }

            tx.m_nonce = nonce.value();
            tx.m_gas_price = gas_price.value();
            tx.m_gas_limit = gas_limit.value();
            tx.m_to = to.value();
            tx.m_value = value.value();
            tx.m_sig.m_v = v.value();
            tx.m_sig.m_r = r.value();
            tx.m_sig.m_s = s.value();
            return tx;
        }

        auto parse_typed(evm_tx_type type,
                         const rlp_value& rlp,
                         uint64_t chain_id) -> std::optional<evm_tx> {
            auto expected = type == evm_tx_type::access_list
                              ? access_list_field_count
                              : dynamic_fee_field_count;
            if(rlp.size() != expected) {
                return std::nullopt;
            }
            auto tx = evm_tx();
            tx.m_type = type;
            size_t idx = 0;
            auto chain = rlp_to_uint256(rlp.value_at(idx++));
            if(!chain.has_value()
               || chain.value() != evmc::uint256be(chain_id)) {
                return std::nullopt;
            }
            auto nonce = rlp_to_uint256(rlp.value_at(idx++));
            std::optional<evmc::uint256be> gas_price;
            std::optional<evmc::uint256be> tip_cap;
            std::optional<evmc::uint256be> fee_cap;
            if(type == evm_tx_type::access_list) {
                gas_price = rlp_to_uint256(rlp.value_at(idx++));
                tip_cap = evmc::uint256be();
                fee_cap = evmc::uint256be();
            } else {
                gas_price = evmc::uint256be();
                tip_cap = rlp_to_uint256(rlp.value_at(idx++));
                fee_cap = rlp_to_uint256(rlp.value_at(idx++));
            }
            auto gas_limit = rlp_to_uint256(rlp.value_at(idx++));
            auto to = parse_to(rlp.value_at(idx++));
            auto value = rlp_to_uint256(rlp.value_at(idx++));
            if(!parse_input(rlp.value_at(idx++), tx)) {
                return std::nullopt;
            }
            auto access_list = parse_rlp_access_list(rlp.value_at(idx++));
            auto y_parity = rlp_to_uint256(rlp.value_at(idx++));
            auto r = rlp_to_uint256(rlp.value_at(idx++));
            auto s = rlp_to_uint256(rlp.value_at(idx++));
            if(!nonce || !gas_price || !tip_cap || !fee_cap || !gas_limit
               || !to || !value || !access_list || !y_parity || !r || !s) {
                return std::nullopt;
            }
            if(y_parity.value() != evmc::uint256be()
               && y_parity.value() != evmc::uint256be(1)) {
                return std::nullopt;
            }

            tx.m_nonce = nonce.value();
            tx.m_gas_price = gas_price.value();
            tx.m_gas_tip_cap = tip_cap.value();
            tx.m_gas_fee_cap = fee_cap.value();
            tx.m_gas_limit = gas_limit.value();
            tx.m_to = to.value();
            tx.m_value = value.value();
            tx.m_access_list = std::move(access_list.value());
            tx.m_sig.m_v = y_parity.value();
            tx.m_sig.m_r = r.value();
            tx.m_sig.m_s = s.value();
            return tx;
        }
    }

    auto tx_encode_for_signing(const evm_tx& tx, uint64_t chain_id)
        -> buffer {
        auto payload = make_payload(tx, chain_id);
        if(tx.m_type == evm_tx_type::legacy) {
            payload.push_back(
                make_rlp_value(evmc::uint256be(chain_id), true));
            payload.push_back(rlp_value(buffer()));
            payload.push_back(rlp_value(buffer()));
        }
        return with_type_prefix(tx.m_type, rlp_encode(payload));
    }

    auto tx_encode(const evm_tx& tx, uint64_t chain_id) -> buffer {
        auto payload = make_payload(tx, chain_id);
        payload.push_back(make_rlp_value(tx.m_sig.m_v, true));
        payload.push_back(make_rlp_value(tx.m_sig.m_r, true));
        payload.push_back(make_rlp_value(tx.m_sig.m_s, true));
        return with_type_prefix(tx.m_type, rlp_encode(payload));
    }

    auto tx_decode(const buffer& buf, uint64_t chain_id)
        -> std::optional<evm_tx> {
        if(buf.size() == 0) {
            return std::nullopt;
        }
        auto first = buf.c_ptr()[0];
        if(first >= 0xc0) {
            auto rlp = rlp_decode(buf);
            if(!rlp.has_value() || rlp->type() != rlp_value_type::array) {
                return std::nullopt;
            }
            return parse_legacy(rlp.value(), chain_id);
        }

        auto type = static_cast<evm_tx_type>(first);
        if(type != evm_tx_type::access_list
           && type != evm_tx_type::dynamic_fee) {
            return std::nullopt;
        }
        auto payload = buffer();
        payload.append(buf.c_ptr() + 1, buf.size() - 1);
        auto rlp = rlp_decode(payload);
        if(!rlp.has_value() || rlp->type() != rlp_value_type::array) {
            return std::nullopt;
        }
        return parse_typed(type, rlp.value(), chain_id);
    }

    auto tx_id(const evm_tx& tx, uint64_t chain_id) -> hash_t {
        return keccak_data(tx_encode(tx, chain_id));
    }
}
