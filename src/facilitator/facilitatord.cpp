// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/registry.hpp"
#include "config.hpp"
#include "evm/signature.hpp"
#include "evm/util.hpp"
#include "executor.hpp"
#include "registry/discovery.hpp"
#include "registry/identity.hpp"
#include "registry/reputation.hpp"
#include "server.hpp"
#include "util/common/buffer.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"
#include "util/rpc/http/server.hpp"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

auto main(int argc, char** argv) -> int {
    auto log = std::make_shared<agentpay::logging::log>(
        agentpay::logging::log_level::info);

    auto cfg = agentpay::facilitator::read_config(argc, argv, log);
    if(!cfg.has_value()) {
        log->error("Error parsing options");
        return 1;
    }
    log->set_loglevel(cfg->m_loglevel);

    const auto* key_hex = std::getenv(cfg->m_facilitator_key_env.c_str());
    if(key_hex == nullptr) {
        log->error("Environment variable",
                   cfg->m_facilitator_key_env,
                   "is not set");
        return 1;
    }
    auto key_buf = agentpay::buffer::from_hex_prefixed(key_hex);
    if(!key_buf.has_value() || key_buf->size() != agentpay::privkey_size) {
        log->error("Facilitator key is not 32 bytes of hex");
        return 1;
    }
    auto key = agentpay::privkey_t();
    std::memcpy(key.data(), key_buf->data(), key.size());

    auto secp = agentpay::make_secp256k1_context();
    auto facilitator_addr = agentpay::evm::address_from_privkey(key, secp);
    if(!facilitator_addr.has_value()) {
        log->error("Facilitator key is not a valid secp256k1 key");
        return 1;
    }
    log->info("Facilitator address",
              agentpay::evm::to_checksum_address(facilitator_addr.value()));

    auto chains = std::make_shared<agentpay::chain::registry>(
        cfg->m_networks,
        agentpay::chain::make_adapter_factory(key,
                                              cfg->m_rpc_timeout.count(),
                                              log));
    for(const auto& network : chains->networks()) {
        log->info("Serving network", network);
    }

    auto exec
        = std::make_shared<agentpay::facilitator::executor>(chains,
                                                            cfg.value(),
                                                            log);
    auto identities = std::make_shared<agentpay::registry::identity_resolver>(
        chains,
        cfg->m_identity_cache_ttl,
        log);
    auto reputation
        = std::make_shared<agentpay::registry::reputation_recorder>(
            chains,
            identities,
            cfg->m_min_score,
            cfg->m_max_score,
            cfg->m_settlement_timeout,
            log,
            &agentpay::facilitator::executor::system_clock);
    auto finder = std::make_shared<agentpay::registry::discovery>(
        cfg->m_rpc_timeout.count(),
        log);

    auto srv = std::make_shared<agentpay::facilitator::server>(chains,
                                                               exec,
                                                               identities,
                                                               reputation,
                                                               finder,
                                                               log);

    auto http = std::make_unique<agentpay::rpc::http_server>(
        cfg->m_listen_endpoint,
        cfg->m_worker_threads,
        log);
    if(!http->init([srv](const agentpay::rpc::request& req) {
           return srv->handle(req);
       })) {
        log->error("Error listening on",
                   cfg->m_listen_endpoint.first,
                   cfg->m_listen_endpoint.second);
        return 1;
    }

    static auto running = std::atomic_bool{true};

    std::signal(SIGINT, [](int /* signal */) {
        running = false;
    });
    std::signal(SIGTERM, [](int /* signal */) {
        running = false;
    });

    log->info("Facilitator running");

    while(running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    log->info("Shutting down...");
    http->stop();

    return 0;
}
