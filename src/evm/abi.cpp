// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi.hpp"

#include "hash.hpp"
#include "util.hpp"

#include <cstring>
#include <limits>

namespace agentpay::evm {
    namespace {
        auto word_to_size(const uint8_t* word) -> std::optional<size_t> {
            auto v = evmc::uint256be();
            std::memcpy(v.bytes, word, sizeof(v.bytes));
            if(exceeds_uint64(v)) {
                return std::nullopt;
            }
            auto ret = to_uint64(v);
            if(ret > std::numeric_limits<size_t>::max()) {
                return std::nullopt;
            }
            return static_cast<size_t>(ret);
        }

        auto padded_size(size_t len) -> size_t {
            return (len + abi_word_size - 1) / abi_word_size * abi_word_size;
        }

        auto has_zero_prefix(const evmc::bytes32& word, size_t len) -> bool {
            for(size_t i = 0; i < len; i++) {
                if(word.bytes[i] != 0) {
                    return false;
                }
            }
            return true;
        }

        auto decode_static(abi_type type, const evmc::bytes32& word)
            -> std::optional<abi_value> {
            switch(type) {
                case abi_type::address: {
                    if(!has_zero_prefix(word,
                                        abi_word_size
                                            - sizeof(evmc::address::bytes))) {
                        return std::nullopt;
                    }
                    auto addr = evmc::address();
                    std::memcpy(addr.bytes,
                                &word.bytes[abi_word_size
                                            - sizeof(addr.bytes)],
                                sizeof(addr.bytes));
                    return abi_value::from_address(addr);
                }
                case abi_type::uint256:
                    return abi_value::from_uint(word);
                case abi_type::uint8:
                    if(!has_zero_prefix(word, abi_word_size - 1)) {
                        return std::nullopt;
                    }
                    return abi_value::from_uint8(word.bytes[abi_word_size - 1]);
                case abi_type::boolean:
                    if(!has_zero_prefix(word, abi_word_size - 1)
                       || word.bytes[abi_word_size - 1] > 1) {
                        return std::nullopt;
                    }
                    return abi_value::from_bool(word.bytes[abi_word_size - 1]
                                                == 1);
                case abi_type::bytes32:
                    return abi_value::from_bytes32(word);
                case abi_type::string:
                case abi_type::bytes:
                    break;
            }
            return std::nullopt;
        }
    }

    auto abi_value::from_address(const evmc::address& addr) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::address;
        std::memcpy(&ret.m_word.bytes[abi_word_size - sizeof(addr.bytes)],
                    addr.bytes,
                    sizeof(addr.bytes));
        return ret;
    }

    auto abi_value::from_uint(const evmc::uint256be& v) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::uint256;
        ret.m_word = v;
        return ret;
    }

    auto abi_value::from_uint8(uint8_t v) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::uint8;
        ret.m_word.bytes[abi_word_size - 1] = v;
        return ret;
    }

    auto abi_value::from_bool(bool v) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::boolean;
        ret.m_word.bytes[abi_word_size - 1] = v ? 1 : 0;
        return ret;
    }

    auto abi_value::from_bytes32(const evmc::bytes32& v) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::bytes32;
        ret.m_word = v;
        return ret;
    }

    auto abi_value::from_string(const std::string& v) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::string;
        ret.m_dynamic.append(v.data(), v.size());
        return ret;
    }

    auto abi_value::from_bytes(const buffer& v) -> abi_value {
        auto ret = abi_value();
        ret.m_type = abi_type::bytes;
        ret.m_dynamic = v;
        return ret;
    }

    auto abi_value::type() const -> abi_type {
        return m_type;
    }

    auto abi_value::is_dynamic() const -> bool {
        return m_type == abi_type::string || m_type == abi_type::bytes;
    }

    auto abi_value::as_address() const -> evmc::address {
        auto addr = evmc::address();
        std::memcpy(addr.bytes,
                    &m_word.bytes[abi_word_size - sizeof(addr.bytes)],
                    sizeof(addr.bytes));
        return addr;
    }

    auto abi_value::as_uint() const -> evmc::uint256be {
        return m_word;
    }

    auto abi_value::as_uint8() const -> uint8_t {
        return m_word.bytes[abi_word_size - 1];
    }

    auto abi_value::as_bool() const -> bool {
        return m_word.bytes[abi_word_size - 1] != 0;
    }

    auto abi_value::as_bytes32() const -> evmc::bytes32 {
        return m_word;
    }

    auto abi_value::as_string() const -> std::string {
        return std::string(reinterpret_cast<const char*>(m_dynamic.c_ptr()),
                           m_dynamic.size());
    }

    auto abi_value::as_bytes() const -> const buffer& {
        return m_dynamic;
    }

    auto abi_value::word() const -> const evmc::bytes32& {
        return m_word;
    }

    auto abi_selector(const std::string& signature) -> selector_t {
        auto h = keccak_data(signature.data(), signature.size());
        auto ret = selector_t();
        std::memcpy(ret.data(), h.data(), ret.size());
        return ret;
    }

    auto abi_encode(const std::vector<abi_value>& values) -> buffer {
        auto head = buffer();
        auto tail = buffer();
        auto head_size = values.size() * abi_word_size;
        for(const auto& v : values) {
            if(!v.is_dynamic()) {
                head.append(v.word().bytes, abi_word_size);
                continue;
            }
            auto offset = evmc::uint256be(head_size + tail.size());
            head.append(offset.bytes, abi_word_size);

            const auto& data = v.as_bytes();
            auto len = evmc::uint256be(data.size());
            tail.append(len.bytes, abi_word_size);
            tail.append(data);
            tail.extend(padded_size(data.size()) - data.size());
        }
        head.append(tail);
        return head;
    }

    auto abi_encode_call(const std::string& signature,
                         const std::vector<abi_value>& args) -> buffer {
        auto sel = abi_selector(signature);
        auto ret = buffer();
        ret.append(sel.data(), sel.size());
        ret.append(abi_encode(args));
        return ret;
    }

    auto abi_decode(const buffer& data, const std::vector<abi_type>& types)
        -> std::optional<std::vector<abi_value>> {
        if(data.size() < types.size() * abi_word_size) {
            return std::nullopt;
        }
        auto ret = std::vector<abi_value>();
        for(size_t i = 0; i < types.size(); i++) {
            const auto* head = data.c_ptr() + i * abi_word_size;
            auto type = types[i];
            if(type != abi_type::string && type != abi_type::bytes) {
                auto word = evmc::bytes32();
                std::memcpy(word.bytes, head, abi_word_size);
                auto v = decode_static(type, word);
                if(!v.has_value()) {
                    return std::nullopt;
                }
                ret.push_back(std::move(v.value()));
                continue;
            }

            auto offset = word_to_size(head);
            if(!offset.has_value()
               || offset.value() > data.size() - abi_word_size) {
                return std::nullopt;
            }
            auto len = word_to_size(data.c_ptr() + offset.value());
            auto start = offset.value() + abi_word_size;
            if(!len.has_value() || len.value() > data.size() - start) {
                return std::nullopt;
            }
            auto bytes = buffer();
            bytes.append(data.c_ptr() + start, len.value());
            if(type == abi_type::string) {
                ret.push_back(abi_value::from_string(
                    std::string(reinterpret_cast<const char*>(bytes.c_ptr()),
                                bytes.size())));
            } else {
                ret.push_back(abi_value::from_bytes(bytes));
            }
        }
        return ret;
    }

    auto abi_decode_tuple(const buffer& data,
                          const std::vector<abi_type>& types)
        -> std::optional<std::vector<abi_value>> {
        if(data.size() < abi_word_size) {
            return std::nullopt;
        }
        auto offset = word_to_size(data.c_ptr());
        if(!offset.has_value() || offset.value() > data.size()) {
            return std::nullopt;
        }
        auto tuple = buffer();
        tuple.append(data.c_ptr() + offset.value(),
                     data.size() - offset.value());
        return abi_decode(tuple, types);
    }

    auto abi_split_call(const buffer& call_data)
        -> std::optional<std::pair<selector_t, buffer>> {
        if(call_data.size() < selector_size) {
            return std::nullopt;
        }
        auto sel = selector_t();
        std::memcpy(sel.data(), call_data.c_ptr(), sel.size());
        auto args = buffer();
        args.append(call_data.c_ptr() + selector_size,
                    call_data.size() - selector_size);
        return std::make_pair(sel, args);
    }

    auto abi_decode_revert(const buffer& data) -> std::optional<std::string> {
        auto split = abi_split_call(data);
        if(!split.has_value()
           || split->first != abi_selector("Error(string)")) {
            return std::nullopt;
        }
        auto values = abi_decode(split->second, {abi_type::string});
        if(!values.has_value()) {
            return std::nullopt;
        }
        return values->front().as_string();
    }
}
