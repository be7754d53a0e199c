// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "json_rpc_client.hpp"

namespace agentpay::rpc {
    auto failure::transient() const -> bool {
        static constexpr long too_many_requests = 429;
        static constexpr long server_error = 500;
        switch(m_kind) {
            case failure_kind::transport:
            case failure_kind::timeout:
                return true;
            case failure_kind::http_status:
                return m_http_status == too_many_requests
                    || m_http_status >= server_error;
            case failure_kind::malformed_response:
            case failure_kind::rpc:
                return false;
        }
        return false;
    }

    auto to_string(failure_kind kind) -> std::string {
        switch(kind) {
            case failure_kind::transport:
                return "transport";
            case failure_kind::timeout:
                return "timeout";
            case failure_kind::http_status:
                return "http_status";
            case failure_kind::malformed_response:
                return "malformed_response";
            case failure_kind::rpc:
                return "rpc";
        }
        return "unknown";
    }
}
