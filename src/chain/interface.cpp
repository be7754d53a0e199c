// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "interface.hpp"

namespace agentpay::chain {
    auto to_string(error_kind kind) -> std::string {
        switch(kind) {
            case error_kind::transient:
                return "transient";
            case error_kind::reverted:
                return "reverted";
            case error_kind::rejected:
                return "rejected";
            case error_kind::not_found:
                return "not_found";
        }
        return "unknown";
    }

    auto interface::confirmation_estimate() const
        -> std::chrono::milliseconds {
        const auto& cfg = config();
        return std::chrono::milliseconds(cfg.m_block_time_ms
                                         * (cfg.m_confirmations + 1));
    }
}
