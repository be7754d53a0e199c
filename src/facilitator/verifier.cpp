// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "verifier.hpp"

#include "evm/signature.hpp"
#include "evm/util.hpp"
#include "typed_data.hpp"

#include <cstring>
#include <limits>

namespace agentpay::facilitator {
    namespace {
        auto describe(const typed_domain& d) -> std::string {
            return "(" + d.m_name + ", " + d.m_version + ", chain "
                 + std::to_string(d.m_chain_id) + ", "
                 + evm::to_checksum_address(d.m_verifying_contract) + ")";
        }

        auto to_seconds(const evmc::uint256be& v) -> uint64_t {
            if(evm::exceeds_uint64(v)) {
                return std::numeric_limits<uint64_t>::max();
            }
            return evm::to_uint64(v);
        }
    }

    verifier::verifier(std::vector<typed_domain> known_domains)
        : m_known_domains(std::move(known_domains)) {}

    auto verifier::verify(const typed_domain& target,
                          const payment_authorization& auth) const
        -> std::variant<evmc::address, error> {
        auto sig = evm::parse_signature(auth.m_signature);
        if(!sig.has_value()) {
            return error{error_code::malformed_signature,
                         "signature must be 65 bytes with v in {0, 1, 27, "
                         "28}"};
        }

        if(auth.m_domain.has_value() && auth.m_domain.value() != target) {
            return error{error_code::domain_mismatch,
                         "authorization declares domain "
                             + describe(auth.m_domain.value())
                             + " but the network expects "
                             + describe(target)};
        }

        auto digest = transfer_digest(target, auth);
        auto recovered = evm::recover_address(digest, sig.value(), m_secp);
        if(auto* err = std::get_if<evm::recover_error>(&recovered)) {
            if(*err == evm::recover_error::malformed) {
                return error{error_code::malformed_signature,
                             "signature values are out of range"};
            }
            return error{error_code::invalid_signature,
                         "no signer can be recovered from the signature"};
        }
        auto signer = std::get<evmc::address>(recovered);
        if(signer == auth.m_from) {
            return signer;
        }

        for(const auto& other : m_known_domains) {
            if(other == target) {
                continue;
            }
            auto other_digest = transfer_digest(other, auth);
            auto res = evm::recover_address(other_digest, sig.value(), m_secp);
            if(auto* addr = std::get_if<evmc::address>(&res)) {
                if(*addr == auth.m_from) {
                    return error{error_code::domain_mismatch,
                                 "authorization was signed for domain "
                                     + describe(other)
                                     + " but the network expects "
                                     + describe(target)};
                }
            }
        }

        return error{error_code::invalid_signature,
                     "signature does not recover to the payer"};
    }

    auto check_validity_window(const payment_authorization& auth,
                               uint64_t now,
                               std::chrono::seconds skew)
        -> std::optional<error> {
        auto valid_before = to_seconds(auth.m_valid_before);
        if(now > valid_before) {
            return error{error_code::expired_authorization,
                         "authorization expired at "
                             + std::to_string(valid_before)};
        }
        auto valid_after = to_seconds(auth.m_valid_after);
        auto skew_s = static_cast<uint64_t>(skew.count());
        auto tolerant_now = now > std::numeric_limits<uint64_t>::max() - skew_s
                              ? std::numeric_limits<uint64_t>::max()
                              : now + skew_s;
        if(tolerant_now < valid_after) {
            return error{error_code::not_yet_valid,
                         "authorization is valid from "
                             + std::to_string(valid_after)};
        }
        return std::nullopt;
    }

    auto check_requirements(const payment_authorization& auth,
                            const payment_requirements& requirements)
        -> std::optional<error> {
        if(std::memcmp(auth.m_value.bytes,
                       requirements.m_amount.bytes,
                       sizeof(auth.m_value.bytes))
           < 0) {
            return error{error_code::insufficient_value,
                         "authorized value is below the required amount"};
        }
        if(requirements.m_pay_to.has_value()
           && requirements.m_pay_to.value() != auth.m_to) {
            return error{error_code::receiver_mismatch,
                         "payee does not match the required receiver"};
        }
        return std::nullopt;
    }
}
