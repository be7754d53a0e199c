// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_FACILITATOR_CONFIG_H_
#define AGENTPAY_SRC_FACILITATOR_CONFIG_H_

#include "chain/config.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace agentpay::facilitator {
    /// Configuration parameters of a facilitator instance.
    struct config {
        /// Address and port the HTTP interface listens on.
        network::endpoint_t m_listen_endpoint;
        /// Number of threads handling HTTP requests.
        size_t m_worker_threads{};
        logging::log_level m_loglevel{logging::log_level::info};
        /// Name of the environment variable holding the hex encoded key of
        /// the account submitting settlement transactions.
        std::string m_facilitator_key_env;
        /// Tolerance applied to validAfter for clocks running behind the
        /// payer's.
        std::chrono::seconds m_clock_skew{};
        /// Timeout of each ledger call.
        std::chrono::milliseconds m_rpc_timeout{};
        /// Overall budget of a settlement from receipt to confirmation.
        std::chrono::milliseconds m_settlement_timeout{};
        /// Maximum number of transaction submissions per settlement.
        size_t m_max_submit_attempts{};
        std::chrono::milliseconds m_backoff_initial{};
        std::chrono::milliseconds m_backoff_max{};
        /// Lifetime of cached identity lookups.
        std::chrono::seconds m_identity_cache_ttl{};
        /// Inclusive bounds of reputation scores.
        uint8_t m_min_score{};
        uint8_t m_max_score{};
        /// Per-network settings.
        std::vector<chain::chain_config> m_networks;
    };

    /// Reads the configuration parameters from the program arguments. The
    /// first argument is the path of the configuration file.
    /// \param argc number of program arguments.
    /// \param argv program arguments.
    /// \param log log instance for reporting errors.
    /// \return configuration parameters or std::nullopt if there was an
    ///         error while parsing the arguments or the file.
    auto read_config(int argc,
                     char** argv,
                     const std::shared_ptr<logging::log>& log)
        -> std::optional<config>;

    /// Reads the configuration parameters from a parsed configuration file.
    /// \param opts parsed file.
    /// \param log log instance for reporting errors.
    /// \return configuration parameters or std::nullopt if a key is
    ///         missing or invalid.
    auto read_config(const agentpay::config::parser& opts,
                     const std::shared_ptr<logging::log>& log)
        -> std::optional<config>;
}

#endif
