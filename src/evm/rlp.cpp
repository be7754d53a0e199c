// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rlp.hpp"

#include <cassert>
#include <cstring>

namespace agentpay::evm {
    namespace {
        constexpr uint8_t string_offset = 0x80;
        constexpr uint8_t array_offset = 0xc0;
        constexpr size_t short_max = 55;

        auto encode_length(size_t len, uint8_t offset) -> buffer {
            auto ret = buffer();
            if(len <= short_max) {
                auto b = static_cast<uint8_t>(offset + len);
                ret.append(&b, 1);
                return ret;
            }
            auto len_bytes = std::vector<uint8_t>();
            for(auto l = len; l > 0; l >>= 8U) {
                len_bytes.insert(len_bytes.begin(),
                                 static_cast<uint8_t>(l & 0xffU));
            }
            auto b = static_cast<uint8_t>(offset + short_max
                                          + len_bytes.size());
            ret.append(&b, 1);
            ret.append(len_bytes.data(), len_bytes.size());
            return ret;
        }

        // Decodes one item starting at pos, advancing pos past it.
        auto decode_item(const uint8_t* data, size_t size, size_t& pos)
            -> std::optional<rlp_value> {
            if(pos >= size) {
                return std::nullopt;
            }
            auto prefix = data[pos];
            if(prefix < string_offset) {
                auto buf = buffer();
                buf.append(&data[pos], 1);
                pos++;
                return rlp_value(buf);
            }

            auto is_array = prefix >= array_offset;
            auto offset = is_array ? array_offset : string_offset;
            auto short_form = static_cast<size_t>(prefix - offset);
            pos++;

            size_t len{};
            if(short_form <= short_max) {
                len = short_form;
            } else {
                auto len_of_len = short_form - short_max;
                if(len_of_len > sizeof(size_t) || pos + len_of_len > size
                   || data[pos] == 0) {
                    return std::nullopt;
                }
                for(size_t i = 0; i < len_of_len; i++) {
                    len = (len << 8U) | data[pos + i];
                }
                pos += len_of_len;
                if(len <= short_max) {
                    return std::nullopt;
                }
            }
            if(len > size - pos) {
                return std::nullopt;
            }

            if(!is_array) {
                if(len == 1 && data[pos] < string_offset) {
                    return std::nullopt;
                }
                auto buf = buffer();
                buf.append(&data[pos], len);
                pos += len;
                return rlp_value(buf);
            }

            auto ret = rlp_value(rlp_value_type::array);
            auto end = pos + len;
            while(pos < end) {
                auto item = decode_item(data, end, pos);
                if(!item.has_value()) {
                    return std::nullopt;
                }
                ret.push_back(item.value());
            }
            return ret;
        }
    }

    rlp_value::rlp_value(rlp_value_type type) : m_type(type) {}

    rlp_value::rlp_value(const buffer& data)
        : m_type(rlp_value_type::buffer),
          m_buffer(data) {}

    void rlp_value::assign(const buffer& data) {
        assert(m_type == rlp_value_type::buffer);
        m_buffer = data;
    }

    void rlp_value::push_back(const rlp_value& data) {
        assert(m_type == rlp_value_type::array);
        m_values.push_back(data);
    }

    auto rlp_value::value() const -> const buffer& {
        return m_buffer;
    }

    auto rlp_value::size() const -> size_t {
        return m_values.size();
    }

    auto rlp_value::value_at(size_t index) const -> const rlp_value& {
        return m_values.at(index);
    }

    auto rlp_value::type() const -> rlp_value_type {
        return m_type;
    }

    auto make_rlp_access_list(const evm_access_list& access_list)
        -> rlp_value {
        auto ret = rlp_value(rlp_value_type::array);
        for(const auto& tuple : access_list) {
            auto keys = rlp_value(rlp_value_type::array);
            for(const auto& key : tuple.m_storage_keys) {
                keys.push_back(make_rlp_value(key));
            }
            ret.push_back(make_rlp_array(make_rlp_value(tuple.m_address),
                                         keys));
        }
        return ret;
    }

    auto parse_rlp_access_list(const rlp_value& rlp)
        -> std::optional<evm_access_list> {
        if(rlp.type() != rlp_value_type::array) {
            return std::nullopt;
        }
        auto ret = evm_access_list();
        for(size_t i = 0; i < rlp.size(); i++) {
            const auto& item = rlp.value_at(i);
            if(item.type() != rlp_value_type::array || item.size() != 2) {
                return std::nullopt;
            }
            auto addr = rlp_to_address(item.value_at(0));
            const auto& keys = item.value_at(1);
            if(!addr.has_value() || keys.type() != rlp_value_type::array) {
                return std::nullopt;
            }
            auto tuple = evm_access_tuple{addr.value(), {}};
            for(size_t j = 0; j < keys.size(); j++) {
                const auto& key = keys.value_at(j);
                if(key.type() != rlp_value_type::buffer
                   || key.value().size() != sizeof(evmc::bytes32)) {
                    return std::nullopt;
                }
                auto k = evmc::bytes32();
                std::memcpy(k.bytes, key.value().data(), sizeof(k.bytes));
                tuple.m_storage_keys.push_back(k);
            }
            ret.push_back(std::move(tuple));
        }
        return ret;
    }

    auto rlp_encode(const rlp_value& v) -> buffer {
        if(v.type() == rlp_value_type::buffer) {
            const auto& data = v.value();
            if(data.size() == 1 && data.c_ptr()[0] < string_offset) {
                return data;
            }
            auto ret = encode_length(data.size(), string_offset);
            ret.append(data);
            return ret;
        }

        auto payload = buffer();
        for(size_t i = 0; i < v.size(); i++) {
            payload.append(rlp_encode(v.value_at(i)));
        }
        auto ret = encode_length(payload.size(), array_offset);
        ret.append(payload);
        return ret;
    }

    auto rlp_decode(const buffer& buf) -> std::optional<rlp_value> {
        size_t pos{0};
        auto ret = decode_item(buf.c_ptr(), buf.size(), pos);
        if(!ret.has_value() || pos != buf.size()) {
            return std::nullopt;
        }
        return ret;
    }

    auto rlp_to_uint256(const rlp_value& v)
        -> std::optional<evmc::uint256be> {
        if(v.type() != rlp_value_type::buffer) {
            return std::nullopt;
        }
        const auto& data = v.value();
        if(data.size() > sizeof(evmc::uint256be::bytes)
           || (data.size() > 0 && data.c_ptr()[0] == 0)) {
            return std::nullopt;
        }
        auto ret = evmc::uint256be{};
        std::memcpy(&ret.bytes[sizeof(ret.bytes) - data.size()],
                    data.data(),
                    data.size());
        return ret;
    }

    auto rlp_to_address(const rlp_value& v) -> std::optional<evmc::address> {
        if(v.type() != rlp_value_type::buffer
           || v.value().size() != sizeof(evmc::address::bytes)) {
            return std::nullopt;
        }
        auto ret = evmc::address{};
        std::memcpy(ret.bytes, v.value().data(), sizeof(ret.bytes));
        return ret;
    }
}
