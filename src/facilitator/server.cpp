// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server.hpp"

#include "evm/util.hpp"
#include "format.hpp"
#include "util/common/variant_overloaded.hpp"

#include <sstream>
#include <variant>

namespace agentpay::facilitator {
    namespace {
        constexpr int http_ok = 200;
        constexpr int http_bad_request = 400;
        constexpr int http_payment_required = 402;
        constexpr int http_forbidden = 403;
        constexpr int http_not_found = 404;
        constexpr int http_bad_method = 405;
        constexpr int http_bad_gateway = 502;
        constexpr int http_unavailable = 503;

        auto reply(int status, const nlohmann::json& body) -> rpc::response {
            return rpc::response{status, body.dump()};
        }

        auto reply_error(int status, const error& err) -> rpc::response {
            return reply(status, to_json(err));
        }

        auto split_path(const std::string& path) -> std::vector<std::string> {
            auto segments = std::vector<std::string>();
            auto ss = std::stringstream(path);
            auto segment = std::string();
            while(std::getline(ss, segment, '/')) {
                if(!segment.empty()) {
                    segments.push_back(segment);
                }
            }
            return segments;
        }

        auto parse_id(const std::string& str)
            -> std::optional<evmc::uint256be> {
            return evm::parse_uint256(str);
        }
    }

    server::server(std::shared_ptr<chain::registry> chains,
                   std::shared_ptr<executor> exec,
                   std::shared_ptr<registry::identity_resolver> identities,
                   std::shared_ptr<registry::reputation_recorder> reputation,
                   std::shared_ptr<registry::discovery> finder,
                   std::shared_ptr<logging::log> log)
        : m_chains(std::move(chains)),
          m_executor(std::move(exec)),
          m_identities(std::move(identities)),
          m_reputation(std::move(reputation)),
          m_discovery(std::move(finder)),
          m_log(std::move(log)) {}

    auto server::settle_status(error_code code) -> int {
        switch(code) {
            case error_code::malformed_request:
            case error_code::malformed_signature:
            case error_code::unsupported_chain:
                return http_bad_request;
            case error_code::settlement_unavailable:
            case error_code::cancelled:
                return http_unavailable;
            default:
                return http_payment_required;
        }
    }

    auto server::registry_status(error_code code) -> int {
        switch(code) {
            case error_code::unauthorized_rater:
                return http_forbidden;
            case error_code::not_found:
                return http_not_found;
            case error_code::settlement_failed:
                return http_bad_gateway;
            case error_code::settlement_unavailable:
            case error_code::cancelled:
                return http_unavailable;
            default:
                return http_bad_request;
        }
    }

    auto server::handle(const rpc::request& req) -> rpc::response {
        m_log->debug(req.m_method, req.m_path);
        auto segments = split_path(req.m_path);
        auto route = segments.empty() ? std::string() : segments.front();
        auto is_get = req.m_method == "GET";
        auto is_post = req.m_method == "POST";

        if(route == "health" && segments.size() == 1 && is_get) {
            return health();
        }
        if(route == "supported" && segments.size() == 1 && is_get) {
            return supported();
        }
        if(route == "verify" && segments.size() == 1 && is_post) {
            return verify(req);
        }
        if(route == "settle" && segments.size() == 1 && is_post) {
            return settle(req);
        }
        if(route == "feedback" && segments.size() == 1 && is_post) {
            return feedback(req);
        }
        if(route == "identity" && is_get) {
            return identity(segments);
        }
        if(route == "reputation" && is_get) {
            return reputation(segments);
        }
        if(route == "discover" && segments.size() == 1 && is_get) {
            return discover(req);
        }

        static const auto known_routes = std::vector<std::string>{
            "health",
            "supported",
            "verify",
            "settle",
            "feedback",
            "identity",
            "reputation",
            "discover"};
        for(const auto& known : known_routes) {
            if(route == known && segments.size() == 1) {
                return reply_error(http_bad_method,
                                   error{error_code::malformed_request,
                                         "method " + req.m_method
                                             + " not allowed on "
                                             + req.m_path});
            }
        }
        return reply_error(http_not_found,
                           error{error_code::not_found,
                                 "no route for " + req.m_method + " "
                                     + req.m_path});
    }

    auto server::health() -> rpc::response {
        auto networks = nlohmann::json::array();
        auto all_reachable = true;
        for(const auto& id : m_chains->networks()) {
            auto adapter = std::get<std::shared_ptr<chain::interface>>(
                m_chains->get(id));
            auto head = adapter->block_number();
            auto entry = nlohmann::json{{"network", id}};
            std::visit(overloaded{[&](uint64_t height) {
                                      entry["reachable"] = true;
                                      entry["headBlock"] = height;
                                  },
                                  [&](const chain::error& err) {
                                      all_reachable = false;
                                      entry["reachable"] = false;
                                      entry["error"] = err.m_message;
                                  }},
                       head);
            networks.push_back(std::move(entry));
        }
        return reply(all_reachable ? http_ok : http_unavailable,
                     {{"status", all_reachable ? "ok" : "degraded"},
                      {"networks", networks}});
    }

    auto server::supported() -> rpc::response {
        auto kinds = nlohmann::json::array();
        for(const auto& id : m_chains->networks()) {
            auto adapter = std::get<std::shared_ptr<chain::interface>>(
                m_chains->get(id));
            const auto& cfg = adapter->config();
            kinds.push_back(
                {{"scheme", "exact"},
                 {"network", id},
                 {"chainId", cfg.m_chain_id},
                 {"asset", evm::to_checksum_address(cfg.m_token)},
                 {"extra",
                  {{"name", cfg.m_domain_name},
                   {"version", cfg.m_domain_version}}},
                 {"identityRegistry", cfg.m_identity_registry.has_value()},
                 {"reputationRegistry",
                  cfg.m_reputation_registry.has_value()}});
        }
        return reply(http_ok, {{"kinds", kinds}});
    }

    auto server::verify(const rpc::request& req) -> rpc::response {
        auto invalid = [](const error& err) {
            auto body = to_json(err);
            body["isValid"] = false;
            return reply(err.m_code == error_code::settlement_unavailable
                             ? http_unavailable
                             : http_bad_request,
                         body);
        };

        auto parsed = parse_payment_request(req.m_body);
        if(auto* err = std::get_if<error>(&parsed)) {
            return invalid(*err);
        }
        auto res = m_executor->verify(std::get<payment_request>(parsed));
        if(auto* err = std::get_if<error>(&res)) {
            m_log->info("Rejected payment:", to_string(err->m_code));
            return invalid(*err);
        }
        return reply(
            http_ok,
            {{"isValid", true},
             {"payer",
              evm::to_checksum_address(std::get<evmc::address>(res))}});
    }

    auto server::settle(const rpc::request& req) -> rpc::response {
        auto parsed = parse_payment_request(req.m_body);
        if(auto* err = std::get_if<error>(&parsed)) {
            return reply_error(settle_status(err->m_code), *err);
        }
        auto res = m_executor->settle(std::get<payment_request>(parsed),
                                      req.m_cancelled);
        if(auto* err = std::get_if<error>(&res)) {
            auto body = to_json(*err);
            body["success"] = false;
            return reply(settle_status(err->m_code), body);
        }
        return reply(http_ok, to_json(std::get<settlement_receipt>(res)));
    }

    auto server::feedback(const rpc::request& req) -> rpc::response {
        auto parsed = parse_feedback_request(req.m_body);
        if(auto* err = std::get_if<error>(&parsed)) {
            return reply_error(registry_status(err->m_code), *err);
        }
        const auto& fb = std::get<registry::feedback_request>(parsed);
        auto res = m_reputation->submit_feedback(fb, req.m_cancelled);
        if(auto* err = std::get_if<error>(&res)) {
            return reply_error(registry_status(err->m_code), *err);
        }
        auto body = to_json(std::get<registry::reputation_record>(res));
        body["network"] = fb.m_network;
        return reply(http_ok, body);
    }

    auto server::identity(const std::vector<std::string>& segments)
        -> rpc::response {
        auto res = std::variant<registry::agent_identity, error>(
            error{error_code::not_found, "unknown identity route"});
        if(segments.size() == 3) {
            auto id = parse_id(segments[2]);
            if(!id.has_value()) {
                return reply_error(http_bad_request,
                                   error{error_code::malformed_request,
                                         "agent id is not an integer"});
            }
            res = m_identities->resolve_by_id(segments[1], id.value());
        } else if(segments.size() == 4 && segments[2] == "address") {
            auto addr = evm::from_hex<evmc::address>(segments[3]);
            if(!addr.has_value()) {
                return reply_error(http_bad_request,
                                   error{error_code::malformed_request,
                                         "invalid agent address"});
            }
            res = m_identities->resolve_by_address(segments[1], addr.value());
        } else if(segments.size() == 4 && segments[2] == "domain") {
            res = m_identities->resolve_by_domain(segments[1], segments[3]);
        }

        if(auto* err = std::get_if<error>(&res)) {
            return reply_error(registry_status(err->m_code), *err);
        }
        auto body = to_json(std::get<registry::agent_identity>(res));
        body["network"] = segments[1];
        return reply(http_ok, body);
    }

    auto server::reputation(const std::vector<std::string>& segments)
        -> rpc::response {
        if(segments.size() != 5) {
            return reply_error(http_not_found,
                               error{error_code::not_found,
                                     "expected /reputation/{network}/"
                                     "{direction}/{rater_id}/{subject_id}"});
        }
        auto dir = registry::parse_direction(segments[2]);
        auto rater = parse_id(segments[3]);
        auto subject = parse_id(segments[4]);
        if(!dir || !rater || !subject) {
            return reply_error(http_bad_request,
                               error{error_code::malformed_request,
                                     "invalid direction or agent id"});
        }
        auto res = m_reputation->get_record(segments[1],
                                            dir.value(),
                                            rater.value(),
                                            subject.value());
        if(auto* err = std::get_if<error>(&res)) {
            return reply_error(registry_status(err->m_code), *err);
        }
        auto body = to_json(std::get<registry::reputation_record>(res));
        body["network"] = segments[1];
        return reply(http_ok, body);
    }

    auto server::discover(const rpc::request& req) -> rpc::response {
        auto it = req.m_query.find("url");
        if(it == req.m_query.end() || it->second.empty()) {
            return reply_error(http_bad_request,
                               error{error_code::malformed_request,
                                     "missing url parameter"});
        }
        auto res = m_discovery->fetch(it->second);
        if(auto* err = std::get_if<error>(&res)) {
            return reply_error(registry_status(err->m_code), *err);
        }
        return reply(http_ok,
                     registry::to_json(std::get<registry::agent_card>(res)));
    }
}
