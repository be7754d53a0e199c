// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

namespace agentpay::facilitator {
    auto to_string(error_code code) -> std::string {
        switch(code) {
            case error_code::invalid_signature:
                return "InvalidSignature";
            case error_code::domain_mismatch:
                return "DomainMismatch";
            case error_code::malformed_signature:
                return "MalformedSignature";
            case error_code::expired_authorization:
                return "ExpiredAuthorization";
            case error_code::not_yet_valid:
                return "NotYetValid";
            case error_code::nonce_already_used:
                return "NonceAlreadyUsed";
            case error_code::unsupported_chain:
                return "UnsupportedChain";
            case error_code::settlement_unavailable:
                return "SettlementUnavailable";
            case error_code::settlement_failed:
                return "SettlementFailed";
            case error_code::unauthorized_rater:
                return "UnauthorizedRater";
            case error_code::malformed_request:
                return "MalformedRequest";
            case error_code::insufficient_value:
                return "InsufficientValue";
            case error_code::receiver_mismatch:
                return "ReceiverMismatch";
            case error_code::invalid_score:
                return "InvalidScore";
            case error_code::not_found:
                return "NotFound";
            case error_code::cancelled:
                return "Cancelled";
        }
        return "Unknown";
    }

    auto to_string(settlement_status status) -> std::string {
        switch(status) {
            case settlement_status::received:
                return "RECEIVED";
            case settlement_status::verified:
                return "VERIFIED";
            case settlement_status::submitted:
                return "SUBMITTED";
            case settlement_status::confirmed:
                return "CONFIRMED";
            case settlement_status::failed:
                return "FAILED";
        }
        return "UNKNOWN";
    }

    auto typed_domain::operator==(const typed_domain& rhs) const -> bool {
        return m_name == rhs.m_name && m_version == rhs.m_version
            && m_chain_id == rhs.m_chain_id
            && m_verifying_contract == rhs.m_verifying_contract;
    }

    auto typed_domain::operator!=(const typed_domain& rhs) const -> bool {
        return !(*this == rhs);
    }
}
