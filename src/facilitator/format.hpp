// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_FORMAT_H_
#define AGENTPAY_SRC_FACILITATOR_FORMAT_H_

#include "messages.hpp"
#include "registry/identity.hpp"
#include "registry/reputation.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace agentpay::facilitator {
    /// Parses the body of a /verify or /settle request. The signature may
    /// be given as one 65-byte hex string or as separate v, r and s fields.
    /// Amounts and timestamps may be JSON numbers, decimal strings or
    /// 0x-prefixed hex strings.
    /// \param body request body.
    /// \return request, MalformedRequest naming the offending field, or
    ///         MalformedSignature if the signature is not hex.
    auto parse_payment_request(const std::string& body)
        -> std::variant<payment_request, error>;

    /// Parses the body of a /feedback request.
    /// \param body request body.
    /// \return request or MalformedRequest.
    auto parse_feedback_request(const std::string& body)
        -> std::variant<registry::feedback_request, error>;

    /// Parses an unsigned 256-bit integer from a JSON number, a decimal
    /// string or a 0x-prefixed hex string.
    auto parse_uint256(const nlohmann::json& val)
        -> std::optional<evmc::uint256be>;

    auto to_json(const error& err) -> nlohmann::json;
    auto to_json(const settlement_receipt& receipt) -> nlohmann::json;
    auto to_json(const registry::agent_identity& identity) -> nlohmann::json;
    auto to_json(const registry::reputation_record& record)
        -> nlohmann::json;
}

#endif
