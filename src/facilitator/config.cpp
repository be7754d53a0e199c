// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

namespace agentpay::facilitator {
    namespace {
        constexpr size_t default_worker_threads = 4;
        constexpr auto default_key_env = "FACILITATOR_PRIVATE_KEY";
        constexpr uint64_t default_clock_skew_s = 60;
        constexpr uint64_t default_rpc_timeout_ms = 5000;
        constexpr uint64_t default_settlement_timeout_ms = 60000;
        constexpr uint64_t default_max_submit_attempts = 3;
        constexpr uint64_t default_backoff_initial_ms = 250;
        constexpr uint64_t default_backoff_max_ms = 4000;
        constexpr uint64_t default_identity_cache_ttl_s = 5;
        constexpr uint64_t max_identity_cache_ttl_s = 60;
        constexpr uint64_t default_min_score = 0;
        constexpr uint64_t default_max_score = 100;
        constexpr uint64_t score_limit = 255;
    }

    auto read_config(int argc,
                     char** argv,
                     const std::shared_ptr<logging::log>& log)
        -> std::optional<config> {
        if(argc < 2) {
            log->error("Usage:", argv[0], "<config file>");
            return std::nullopt;
        }
        auto opts = agentpay::config::parser(std::string(argv[1]));
        if(!opts.valid()) {
            if(auto line = opts.error_line()) {
                log->error("Malformed configuration at line", line.value());
            } else {
                log->error("Unable to read configuration file", argv[1]);
            }
            return std::nullopt;
        }
        return read_config(opts, log);
    }

    auto read_config(const agentpay::config::parser& opts,
                     const std::shared_ptr<logging::log>& log)
        -> std::optional<config> {
        auto cfg = config();

        auto ep = opts.get_endpoint("listen_endpoint");
        if(!ep.has_value()) {
            log->error("Missing or invalid listen_endpoint");
            return std::nullopt;
        }
        cfg.m_listen_endpoint = ep.value();

        cfg.m_worker_threads = opts.get_ulong("worker_threads")
                                   .value_or(default_worker_threads);
        if(cfg.m_worker_threads == 0) {
            log->error("worker_threads must be at least 1");
            return std::nullopt;
        }

        auto level_name = opts.get_string("loglevel").value_or("INFO");
        auto level = logging::parse_loglevel(level_name);
        if(!level.has_value()) {
            log->error("Unknown loglevel", level_name);
            return std::nullopt;
        }
        cfg.m_loglevel = level.value();

        cfg.m_facilitator_key_env
            = opts.get_string("facilitator_key_env").value_or(default_key_env);

        cfg.m_clock_skew
            = std::chrono::seconds(opts.get_ulong("clock_skew_seconds")
                                       .value_or(default_clock_skew_s));
        cfg.m_rpc_timeout = std::chrono::milliseconds(
            opts.get_ulong("rpc_timeout_ms").value_or(default_rpc_timeout_ms));
        cfg.m_settlement_timeout = std::chrono::milliseconds(
            opts.get_ulong("settlement_timeout_ms")
                .value_or(default_settlement_timeout_ms));
        cfg.m_max_submit_attempts = opts.get_ulong("max_submit_attempts")
                                        .value_or(default_max_submit_attempts);
        if(cfg.m_max_submit_attempts == 0) {
            log->error("max_submit_attempts must be at least 1");
            return std::nullopt;
        }
        cfg.m_backoff_initial = std::chrono::milliseconds(
            opts.get_ulong("backoff_initial_ms")
                .value_or(default_backoff_initial_ms));
        cfg.m_backoff_max = std::chrono::milliseconds(
            opts.get_ulong("backoff_max_ms").value_or(default_backoff_max_ms));
        if(cfg.m_backoff_max < cfg.m_backoff_initial) {
            log->error("backoff_max_ms is below backoff_initial_ms");
            return std::nullopt;
        }

        auto ttl = opts.get_ulong("identity_cache_ttl_seconds")
                       .value_or(default_identity_cache_ttl_s);
        if(ttl >= max_identity_cache_ttl_s) {
            log->error("identity_cache_ttl_seconds must be below",
                       max_identity_cache_ttl_s);
            return std::nullopt;
        }
        cfg.m_identity_cache_ttl = std::chrono::seconds(ttl);

        auto min_score
            = opts.get_ulong("min_score").value_or(default_min_score);
        auto max_score
            = opts.get_ulong("max_score").value_or(default_max_score);
        if(max_score > score_limit || min_score > max_score) {
            log->error("Invalid score bounds", min_score, max_score);
            return std::nullopt;
        }
        cfg.m_min_score = static_cast<uint8_t>(min_score);
        cfg.m_max_score = static_cast<uint8_t>(max_score);

        auto networks = chain::read_chain_configs(opts, log);
        if(!networks.has_value()) {
            return std::nullopt;
        }
        cfg.m_networks = std::move(networks.value());

        return cfg;
    }
}
