// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_REGISTRY_REPUTATION_H_
#define AGENTPAY_SRC_REGISTRY_REPUTATION_H_

#include "chain/registry.hpp"
#include "evm/messages.hpp"
#include "facilitator/messages.hpp"
#include "identity.hpp"
#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <chrono>
#include <evmc/evmc.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace agentpay::registry {
    /// Relation a reputation record describes. Each direction is stored
    /// separately by the reputation registry.
    enum class direction {
        /// A client rates the server it paid.
        client_to_server,
        /// A server rates a client it served.
        server_to_client,
        /// A server rates the validator that checked its work.
        server_to_validator
    };

    /// Returns the wire name of a direction, e.g. "client_to_server".
    auto to_string(direction dir) -> std::string;

    /// Parses the wire name of a direction.
    auto parse_direction(const std::string& name) -> std::optional<direction>;

    /// A rating held by the reputation registry.
    struct reputation_record {
        direction m_direction{direction::client_to_server};
        /// Agent that gave the rating.
        evmc::uint256be m_rater_id{};
        /// Agent the rating is about.
        evmc::uint256be m_subject_id{};
        uint8_t m_score{};
        /// UNIX time the record was observed on the ledger, when known.
        std::optional<uint64_t> m_timestamp;
        /// Transaction that wrote the record, when written by this process.
        std::optional<hash_t> m_tx_hash;
    };

    /// Feedback submitted by a rater. The rater signs the registry call
    /// with their own key so the registry authenticates them.
    struct feedback_request {
        std::string m_network;
        direction m_direction{direction::client_to_server};
        evmc::uint256be m_subject_id{};
        uint8_t m_score{};
        /// Network encoded signed transaction calling the registry.
        buffer m_signed_tx;
    };

    /// Relays signed reputation writes and reads back stored ratings.
    class reputation_recorder {
      public:
        using clock_type = std::function<uint64_t()>;
        using cancel_flag = std::shared_ptr<std::atomic<bool>>;

        /// Constructor.
        /// \param chains adapters of all configured networks.
        /// \param identities resolver used to map the sender to an agent.
        /// \param min_score lowest accepted score.
        /// \param max_score highest accepted score.
        /// \param timeout how long to wait for the write to be included.
        /// \param log log instance.
        /// \param clock time source for record timestamps.
        reputation_recorder(std::shared_ptr<chain::registry> chains,
                            std::shared_ptr<identity_resolver> identities,
                            uint8_t min_score,
                            uint8_t max_score,
                            std::chrono::milliseconds timeout,
                            std::shared_ptr<logging::log> log,
                            clock_type clock);

        reputation_recorder(const reputation_recorder&) = delete;
        auto operator=(const reputation_recorder&)
            -> reputation_recorder& = delete;
        reputation_recorder(reputation_recorder&&) = delete;
        auto operator=(reputation_recorder&&) -> reputation_recorder& = delete;

        /// Validates, dry-runs and relays a rating, then waits until the
        /// registry transaction is included.
        /// \param req feedback to record.
        /// \param cancelled optional flag set when the caller disconnects.
        /// \return the written record or the reason it was refused.
        auto submit_feedback(const feedback_request& req,
                             const cancel_flag& cancelled = nullptr)
            -> std::variant<reputation_record, facilitator::error>;

        /// Reads the active rating for a rater, subject and direction.
        /// \return record or NotFound if no rating exists.
        auto get_record(const std::string& network,
                        direction dir,
                        const evmc::uint256be& rater_id,
                        const evmc::uint256be& subject_id)
            -> std::variant<reputation_record, facilitator::error>;

        /// Encodes the registry call recording a rating.
        /// \param dir relation being rated.
        /// \param subject_id agent being rated.
        /// \param score rating.
        /// \return call data.
        static auto make_call_data(direction dir,
                                   const evmc::uint256be& subject_id,
                                   uint8_t score) -> buffer;

      private:
        std::shared_ptr<chain::registry> m_chains;
        std::shared_ptr<identity_resolver> m_identities;
        uint8_t m_min_score;
        uint8_t m_max_score;
        std::chrono::milliseconds m_timeout;
        std::shared_ptr<logging::log> m_log;
        clock_type m_clock;
        secp256k1_context_ptr m_secp{make_secp256k1_context()};

        static auto check_call(const feedback_request& req,
                               const evmc::address& registry,
                               const evm::evm_tx& tx)
            -> std::optional<facilitator::error>;

        auto await_receipt(chain::interface& adapter,
                           const hash_t& tx_hash,
                           const cancel_flag& cancelled)
            -> std::variant<evm::evm_tx_receipt, facilitator::error>;
    };
}

#endif
