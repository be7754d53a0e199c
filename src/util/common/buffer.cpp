// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace agentpay {
    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::c_ptr() -> uint8_t* {
        return m_data.data();
    }

    auto buffer::c_ptr() const -> const uint8_t* {
        return m_data.data();
    }

    void buffer::append(const void* data, size_t len) {
        const auto* start = static_cast<const uint8_t*>(data);
        m_data.insert(m_data.end(), start, start + len);
    }

    void buffer::append(const buffer& other) {
        append(other.data(), other.size());
    }

    void buffer::clear() {
        m_data.clear();
    }

    void buffer::extend(size_t len) {
        m_data.resize(m_data.size() + len);
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return m_data != other.m_data;
    }

    auto buffer::operator<(const buffer& other) const -> bool {
        return m_data < other.m_data;
    }

    auto buffer::to_hex() const -> std::string {
        auto ret = std::stringstream();
        for(const auto& b : m_data) {
            ret << std::hex << std::setfill('0') << std::setw(2)
                << static_cast<int>(b);
        }
        return ret.str();
    }

    auto buffer::to_hex_prefixed(const std::string& prefix) const
        -> std::string {
        return prefix + to_hex();
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        if(hex.size() % 2 != 0) {
            return std::nullopt;
        }

        auto ret = buffer();
        ret.m_data.reserve(hex.size() / 2);
        for(size_t i = 0; i < hex.size(); i += 2) {
            uint8_t v{};
            for(size_t j = 0; j < 2; j++) {
                auto c = hex[i + j];
                v = static_cast<uint8_t>(v << 4U);
                if(c >= '0' && c <= '9') {
                    v |= static_cast<uint8_t>(c - '0');
                } else if(c >= 'a' && c <= 'f') {
                    v |= static_cast<uint8_t>(c - 'a' + 10);
                } else if(c >= 'A' && c <= 'F') {
                    v |= static_cast<uint8_t>(c - 'A' + 10);
                } else {
                    return std::nullopt;
                }
            }
            ret.m_data.push_back(v);
        }

        return ret;
    }

    auto buffer::from_hex_prefixed(const std::string& hex,
                                   const std::string& prefix)
        -> std::optional<buffer> {
        if(hex.compare(0, prefix.size(), prefix) == 0) {
            return from_hex(hex.substr(prefix.size()));
        }
        return from_hex(hex);
    }
}
