// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_RPC_HTTP_JSON_RPC_CLIENT_H_
#define AGENTPAY_SRC_UTIL_RPC_HTTP_JSON_RPC_CLIENT_H_

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace agentpay::rpc {
    /// Category of a failed remote call.
    enum class failure_kind {
        /// The connection could not be established or was reset.
        transport,
        /// The call did not complete within its timeout.
        timeout,
        /// The server replied with a non-success HTTP status.
        http_status,
        /// The reply was not a valid JSON-RPC response.
        malformed_response,
        /// The server returned a JSON-RPC error object.
        rpc
    };

    /// Details of a failed remote call.
    struct failure {
        failure_kind m_kind{failure_kind::transport};
        /// HTTP status code, if a reply was received.
        long m_http_status{};
        /// JSON-RPC error code for failure_kind::rpc.
        int64_t m_code{};
        std::string m_message;
        /// Hex encoded JSON-RPC error data (revert payload), if any.
        std::string m_data;

        /// Returns true if the same call may succeed when retried: transport
        /// failures, timeouts, HTTP 429 and 5xx responses.
        [[nodiscard]] auto transient() const -> bool;
    };

    /// Result of a JSON-RPC call: the "result" member of the response or
    /// the reason the call failed.
    using call_result = std::variant<nlohmann::json, failure>;

    /// Interface for a JSON-RPC 2.0 client.
    class json_rpc_client {
      public:
        virtual ~json_rpc_client() = default;

        json_rpc_client() = default;
        json_rpc_client(const json_rpc_client&) = delete;
        auto operator=(const json_rpc_client&) -> json_rpc_client& = delete;
        json_rpc_client(json_rpc_client&&) = delete;
        auto operator=(json_rpc_client&&) -> json_rpc_client& = delete;

        /// Calls a remote method and blocks until it returns or times out.
        /// \param method method name.
        /// \param params positional parameters.
        /// \return result member of the response or failure details.
        virtual auto call(const std::string& method, nlohmann::json params)
            -> call_result = 0;
    };

    auto to_string(failure_kind kind) -> std::string;
}

#endif
