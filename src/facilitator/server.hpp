// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_SERVER_H_
#define AGENTPAY_SRC_FACILITATOR_SERVER_H_

#include "chain/registry.hpp"
#include "executor.hpp"
#include "messages.hpp"
#include "registry/discovery.hpp"
#include "registry/identity.hpp"
#include "registry/reputation.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/http/server.hpp"

#include <memory>
#include <string>
#include <vector>

namespace agentpay::facilitator {
    /// HTTP front end of the facilitator. Maps requests to the settlement
    /// executor and the registry clients and their results to JSON replies.
    /// Holds no state of its own so any number of instances may serve the
    /// same networks.
    class server {
      public:
        /// Constructor.
        /// \param chains adapters of all configured networks.
        /// \param exec payment verifier and settlement executor.
        /// \param identities identity registry client.
        /// \param reputation reputation registry client.
        /// \param finder agent card fetcher.
        /// \param log log instance.
        server(std::shared_ptr<chain::registry> chains,
               std::shared_ptr<executor> exec,
               std::shared_ptr<registry::identity_resolver> identities,
               std::shared_ptr<registry::reputation_recorder> reputation,
               std::shared_ptr<registry::discovery> finder,
               std::shared_ptr<logging::log> log);

        server(const server&) = delete;
        auto operator=(const server&) -> server& = delete;
        server(server&&) = delete;
        auto operator=(server&&) -> server& = delete;

        /// Handles one HTTP request. Safe to call from several threads.
        /// \param req request to handle.
        /// \return reply with a JSON body.
        auto handle(const rpc::request& req) -> rpc::response;

        /// HTTP status for an error returned by /settle.
        static auto settle_status(error_code code) -> int;

        /// HTTP status for an error returned by the registry routes.
        static auto registry_status(error_code code) -> int;

      private:
        std::shared_ptr<chain::registry> m_chains;
        std::shared_ptr<executor> m_executor;
        std::shared_ptr<registry::identity_resolver> m_identities;
        std::shared_ptr<registry::reputation_recorder> m_reputation;
        std::shared_ptr<registry::discovery> m_discovery;
        std::shared_ptr<logging::log> m_log;

        auto health() -> rpc::response;
        auto supported() -> rpc::response;
        auto verify(const rpc::request& req) -> rpc::response;
        auto settle(const rpc::request& req) -> rpc::response;
        auto feedback(const rpc::request& req) -> rpc::response;
        auto identity(const std::vector<std::string>& segments)
            -> rpc::response;
        auto reputation(const std::vector<std::string>& segments)
            -> rpc::response;
        auto discover(const rpc::request& req) -> rpc::response;
    };
}

#endif
