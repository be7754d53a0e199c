// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "facilitator/config.hpp"

#include <gtest/gtest.h>
#include <sstream>

class facilitator_config_test : public ::testing::Test {
  protected:
    auto read(const std::string& extra)
        -> std::optional<agentpay::facilitator::config> {
        auto stream = std::istringstream(m_network + extra);
        auto opts = agentpay::config::parser(stream);
        if(!opts.valid()) {
            return std::nullopt;
        }
        return agentpay::facilitator::read_config(opts, m_log);
    }

    std::shared_ptr<agentpay::logging::log> m_log{
        std::make_shared<agentpay::logging::log>(
            agentpay::logging::log_level::fatal)};

    std::string m_network{"network_count = 1\n"
                          "network0_id = \"local\"\n"
                          "network0_rpc_endpoint = \"http://127.0.0.1:8545\"\n"
                          "network0_chain_id = 31337\n"
                          "network0_token_address = "
                          "\"0x00000000000000000000000000000000000000aa\"\n"
                          "network0_domain_name = \"Test Token\"\n"};
};

TEST_F(facilitator_config_test, defaults) {
    auto cfg = read("listen_endpoint = \"0.0.0.0:8402\"\n");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->m_listen_endpoint.first, "0.0.0.0");
    EXPECT_EQ(cfg->m_listen_endpoint.second, 8402);
    EXPECT_EQ(cfg->m_worker_threads, 4U);
    EXPECT_EQ(cfg->m_loglevel, agentpay::logging::log_level::info);
    EXPECT_EQ(cfg->m_facilitator_key_env, "FACILITATOR_PRIVATE_KEY");
    EXPECT_EQ(cfg->m_clock_skew, std::chrono::seconds(60));
    EXPECT_EQ(cfg->m_max_submit_attempts, 3U);
    EXPECT_EQ(cfg->m_identity_cache_ttl, std::chrono::seconds(5));
    EXPECT_EQ(cfg->m_min_score, 0);
    EXPECT_EQ(cfg->m_max_score, 100);
    ASSERT_EQ(cfg->m_networks.size(), 1U);
    EXPECT_EQ(cfg->m_networks[0].m_network, "local");
}

TEST_F(facilitator_config_test, overrides) {
    auto cfg = read("listen_endpoint = \"127.0.0.1:9000\"\n"
                    "worker_threads = 16\n"
                    "loglevel = \"debug\"\n"
                    "facilitator_key_env = \"RELAYER_KEY\"\n"
                    "clock_skew_seconds = 5\n"
                    "settlement_timeout_ms = 120000\n"
                    "max_submit_attempts = 6\n"
                    "backoff_initial_ms = 100\n"
                    "backoff_max_ms = 800\n"
                    "identity_cache_ttl_seconds = 30\n"
                    "min_score = 1\n"
                    "max_score = 5\n");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->m_worker_threads, 16U);
    EXPECT_EQ(cfg->m_loglevel, agentpay::logging::log_level::debug);
    EXPECT_EQ(cfg->m_facilitator_key_env, "RELAYER_KEY");
    EXPECT_EQ(cfg->m_clock_skew, std::chrono::seconds(5));
    EXPECT_EQ(cfg->m_settlement_timeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(cfg->m_max_submit_attempts, 6U);
    EXPECT_EQ(cfg->m_backoff_initial, std::chrono::milliseconds(100));
    EXPECT_EQ(cfg->m_backoff_max, std::chrono::milliseconds(800));
    EXPECT_EQ(cfg->m_identity_cache_ttl, std::chrono::seconds(30));
    EXPECT_EQ(cfg->m_min_score, 1);
    EXPECT_EQ(cfg->m_max_score, 5);
}

TEST_F(facilitator_config_test, invalid) {
    EXPECT_FALSE(read("").has_value());
    EXPECT_FALSE(read("listen_endpoint = \"localhost\"\n").has_value());

    const auto ep = std::string("listen_endpoint = \"0.0.0.0:8402\"\n");
    EXPECT_FALSE(read(ep + "worker_threads = 0\n").has_value());
    EXPECT_FALSE(read(ep + "loglevel = \"LOUD\"\n").has_value());
    EXPECT_FALSE(read(ep + "max_submit_attempts = 0\n").has_value());
    EXPECT_FALSE(
        read(ep + "backoff_initial_ms = 500\nbackoff_max_ms = 100\n")
            .has_value());
    EXPECT_FALSE(read(ep + "identity_cache_ttl_seconds = 60\n").has_value());
    EXPECT_FALSE(read(ep + "max_score = 256\n").has_value());
    EXPECT_FALSE(read(ep + "min_score = 10\nmax_score = 5\n").has_value());
    EXPECT_FALSE(read(ep + "worker_threads = many\n").has_value());
}

TEST(config_parser_test, syntax) {
    auto stream = std::istringstream("# comment\n"
                                     "\n"
                                     "  name = \"value with spaces\"  \n"
                                     "count = -3\n");
    auto opts = agentpay::config::parser(stream);
    ASSERT_TRUE(opts.valid());
    EXPECT_EQ(opts.get_string("name"), "value with spaces");
    EXPECT_EQ(opts.get_int("count"), -3);
    EXPECT_FALSE(opts.get_ulong("count").has_value());
    EXPECT_FALSE(opts.get_string("count").has_value());
    EXPECT_FALSE(opts.get_int("missing").has_value());

    auto bad = std::istringstream("ok = 1\nnot a pair\n");
    auto bad_opts = agentpay::config::parser(bad);
    EXPECT_FALSE(bad_opts.valid());
    EXPECT_EQ(bad_opts.error_line(), 2U);

    auto missing = agentpay::config::parser(std::string("/nonexistent.cfg"));
    EXPECT_FALSE(missing.valid());
    EXPECT_FALSE(missing.error_line().has_value());

    EXPECT_EQ(agentpay::network::parse_ip_port("[::1]:80"),
              (agentpay::network::endpoint_t{"[::1]", 80}));
    EXPECT_FALSE(agentpay::network::parse_ip_port("host:99999").has_value());
    EXPECT_FALSE(agentpay::network::parse_ip_port(":80").has_value());
}
