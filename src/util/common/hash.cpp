// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include "buffer.hpp"

#include <cstring>

namespace agentpay {
    auto to_string(const hash_t& val) -> std::string {
        auto buf = buffer();
        buf.append(val.data(), val.size());
        return buf.to_hex();
    }

    auto hash_from_hex(const std::string& val) -> std::optional<hash_t> {
        auto maybe_buf = buffer::from_hex_prefixed(val);
        if(!maybe_buf.has_value() || maybe_buf->size() != hash_size) {
            return std::nullopt;
        }
        auto ret = hash_t();
        std::memcpy(ret.data(), maybe_buf->data(), ret.size());
        return ret;
    }
}
