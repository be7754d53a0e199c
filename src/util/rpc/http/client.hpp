// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_RPC_HTTP_CLIENT_H_
#define AGENTPAY_SRC_UTIL_RPC_HTTP_CLIENT_H_

#include "json_rpc_client.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <variant>

namespace agentpay::rpc {
    /// Reply to a plain HTTP request.
    struct http_response {
        long m_status{};
        std::string m_body;
    };

    /// Performs a blocking HTTP request using libcurl.
    /// \param url target URL.
    /// \param body request body, sent with POST if not empty, otherwise the
    ///             request is a GET.
    /// \param timeout_ms total timeout for the request.
    /// \return response or failure details. Non-2xx replies are returned
    ///         as responses.
    auto http_request(const std::string& url,
                      const std::string& body,
                      long timeout_ms)
        -> std::variant<http_response, failure>;

    /// JSON-RPC 2.0 client over HTTP POST. Each call uses its own curl
    /// handle so the client may be shared between threads.
    class json_rpc_http_client : public json_rpc_client {
      public:
        /// Constructor.
        /// \param endpoint URL of the JSON-RPC server.
        /// \param timeout_ms per-call timeout.
        /// \param log log instance.
        json_rpc_http_client(std::string endpoint,
                             long timeout_ms,
                             std::shared_ptr<logging::log> log);

        auto call(const std::string& method, nlohmann::json params)
            -> call_result override;

      private:
        std::string m_endpoint;
        long m_timeout_ms;
        std::shared_ptr<logging::log> m_log;
        std::atomic<uint64_t> m_next_id{1};
    };
}

#endif
