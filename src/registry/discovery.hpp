// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_REGISTRY_DISCOVERY_H_
#define AGENTPAY_SRC_REGISTRY_DISCOVERY_H_

#include "facilitator/messages.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/http/client.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentpay::registry {
    /// Path of the agent card relative to an agent's base URL.
    static constexpr auto agent_card_path = "/.well-known/agent-card";

    /// Price of one skill invocation.
    struct skill_price {
        /// Decimal amount in the smallest token unit.
        std::string m_amount;
        std::string m_currency{"GLUE"};
    };

    /// Capability advertised by an agent.
    struct agent_skill {
        std::string m_id;
        std::string m_name;
        std::string m_description;
        skill_price m_price;
        nlohmann::json m_input_schema;
        nlohmann::json m_output_schema;
        std::optional<std::string> m_endpoint;
    };

    /// Where an agent is registered on chain.
    struct agent_registration {
        std::string m_contract;
        std::string m_address;
        uint64_t m_agent_id{};
        std::string m_network;
    };

    /// Self-description an agent publishes at its well-known path.
    struct agent_card {
        uint64_t m_agent_id{};
        std::string m_name;
        std::string m_description;
        std::string m_version;
        std::string m_domain;
        std::vector<agent_skill> m_skills;
        std::vector<std::string> m_trust_models;
        std::vector<std::string> m_payment_methods;
        std::vector<agent_registration> m_registrations;
    };

    /// Parses an agent card document. Only the structure is checked.
    /// \param body JSON document.
    /// \return card or std::nullopt if required fields are missing or
    ///         have the wrong type.
    auto parse_agent_card(const std::string& body)
        -> std::optional<agent_card>;

    /// Serializes an agent card using the document's field names.
    auto to_json(const agent_card& card) -> nlohmann::json;

    /// Fetches agent cards from other agents.
    class discovery {
      public:
        /// Performs an HTTP GET of a URL.
        using fetch_type = std::function<
            std::variant<rpc::http_response, rpc::failure>(
                const std::string& url)>;

        /// Constructor using libcurl for fetching.
        /// \param timeout_ms timeout of each fetch.
        /// \param log log instance.
        discovery(long timeout_ms, std::shared_ptr<logging::log> log);

        /// Constructor with a custom fetch function.
        discovery(fetch_type fetch, std::shared_ptr<logging::log> log);

        /// Fetches and parses the agent card published under a base URL.
        /// \param base_url agent base URL, e.g. "http://host:8080".
        /// \return card, NotFound if the agent publishes none,
        ///         MalformedRequest if the URL or document is invalid, or
        ///         SettlementUnavailable if the agent cannot be reached.
        auto fetch(const std::string& base_url)
            -> std::variant<agent_card, facilitator::error>;

      private:
        fetch_type m_fetch;
        std::shared_ptr<logging::log> m_log;
    };
}

#endif
