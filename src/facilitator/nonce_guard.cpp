// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "nonce_guard.hpp"

#include "evm/util.hpp"

namespace agentpay::facilitator {
    auto query_nonce(chain::interface& adapter,
                     const payment_authorization& auth) -> nonce_state {
        auto res = adapter.authorization_used(auth.m_from, auth.m_nonce);
        if(auto* err = std::get_if<chain::error>(&res)) {
            return *err;
        }
        return std::get<bool>(res);
    }

    auto check_nonce(chain::interface& adapter,
                     const payment_authorization& auth)
        -> std::optional<error> {
        auto state = query_nonce(adapter, auth);
        if(auto* err = std::get_if<chain::error>(&state)) {
            return error{error_code::settlement_unavailable,
                         "unable to read authorization state: "
                             + err->m_message};
        }
        if(std::get<bool>(state)) {
            return error{error_code::nonce_already_used,
                         "nonce 0x" + evm::to_hex(auth.m_nonce)
                             + " has already been used by 0x"
                             + evm::to_hex(auth.m_from)};
        }
        return std::nullopt;
    }
}
