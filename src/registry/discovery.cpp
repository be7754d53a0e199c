// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "discovery.hpp"

namespace agentpay::registry {
    namespace {
        using facilitator::error;
        using facilitator::error_code;

        constexpr long http_ok_min = 200;
        constexpr long http_ok_max = 299;
        constexpr long http_not_found = 404;

        auto get_string(const nlohmann::json& obj,
                        const char* key,
                        std::string& out) -> bool {
            auto it = obj.find(key);
            if(it == obj.end() || !it->is_string()) {
                return false;
            }
            out = it->get<std::string>();
            return true;
        }

        auto get_uint(const nlohmann::json& obj, const char* key, uint64_t& out)
            -> bool {
            auto it = obj.find(key);
            if(it == obj.end() || !it->is_number_unsigned()) {
                return false;
            }
            out = it->get<uint64_t>();
            return true;
        }

        auto get_strings(const nlohmann::json& obj,
                         const char* key,
                         std::vector<std::string>& out) -> bool {
            auto it = obj.find(key);
            if(it == obj.end()) {
                return true;
            }
            if(!it->is_array()) {
                return false;
            }
            for(const auto& elem : *it) {
                if(!elem.is_string()) {
                    return false;
                }
                out.push_back(elem.get<std::string>());
            }
            return true;
        }

        auto parse_skill(const nlohmann::json& obj)
            -> std::optional<agent_skill> {
            if(!obj.is_object()) {
                return std::nullopt;
            }
            auto skill = agent_skill();
            if(!get_string(obj, "skillId", skill.m_id)
               || !get_string(obj, "name", skill.m_name)) {
                return std::nullopt;
            }
            get_string(obj, "description", skill.m_description);

            auto price = obj.find("price");
            if(price == obj.end() || !price->is_object()) {
                return std::nullopt;
            }
            auto amount = price->find("amount");
            if(amount == price->end()) {
                return std::nullopt;
            }
            if(amount->is_string()) {
                skill.m_price.m_amount = amount->get<std::string>();
            } else if(amount->is_number_unsigned()) {
                skill.m_price.m_amount
                    = std::to_string(amount->get<uint64_t>());
            } else {
                return std::nullopt;
            }
            get_string(*price, "currency", skill.m_price.m_currency);

            auto input = obj.find("inputSchema");
            if(input != obj.end()) {
                skill.m_input_schema = *input;
            }
            auto output = obj.find("outputSchema");
            if(output != obj.end()) {
                skill.m_output_schema = *output;
            }
            auto endpoint = std::string();
            if(get_string(obj, "endpoint", endpoint)) {
                skill.m_endpoint = endpoint;
            }
            return skill;
        }
    }

    auto parse_agent_card(const std::string& body)
        -> std::optional<agent_card> {
        auto doc = nlohmann::json::parse(body, nullptr, false);
        if(doc.is_discarded() || !doc.is_object()) {
            return std::nullopt;
        }

        auto card = agent_card();
        if(!get_uint(doc, "agentId", card.m_agent_id)
           || !get_string(doc, "name", card.m_name)
           || !get_string(doc, "domain", card.m_domain)) {
            return std::nullopt;
        }
        get_string(doc, "description", card.m_description);
        get_string(doc, "version", card.m_version);

        auto skills = doc.find("skills");
        if(skills != doc.end()) {
            if(!skills->is_array()) {
                return std::nullopt;
            }
            for(const auto& elem : *skills) {
                auto skill = parse_skill(elem);
                if(!skill.has_value()) {
                    return std::nullopt;
                }
                card.m_skills.push_back(std::move(skill.value()));
            }
        }

        if(!get_strings(doc, "trustModels", card.m_trust_models)
           || !get_strings(doc, "paymentMethods", card.m_payment_methods)) {
            return std::nullopt;
        }

        auto registrations = doc.find("registrations");
        if(registrations != doc.end()) {
            if(!registrations->is_array()) {
                return std::nullopt;
            }
            for(const auto& elem : *registrations) {
                auto reg = agent_registration();
                if(!elem.is_object()
                   || !get_string(elem, "contract", reg.m_contract)
                   || !get_string(elem, "address", reg.m_address)
                   || !get_uint(elem, "agentId", reg.m_agent_id)) {
                    return std::nullopt;
                }
                get_string(elem, "network", reg.m_network);
                card.m_registrations.push_back(std::move(reg));
            }
        }

        return card;
    }

    auto to_json(const agent_card& card) -> nlohmann::json {
        auto skills = nlohmann::json::array();
        for(const auto& skill : card.m_skills) {
            auto obj = nlohmann::json{
                {"skillId", skill.m_id},
                {"name", skill.m_name},
                {"description", skill.m_description},
                {"price",
                 {{"amount", skill.m_price.m_amount},
                  {"currency", skill.m_price.m_currency}}},
                {"inputSchema", skill.m_input_schema},
                {"outputSchema", skill.m_output_schema}};
            if(skill.m_endpoint.has_value()) {
                obj["endpoint"] = skill.m_endpoint.value();
            }
            skills.push_back(std::move(obj));
        }

        auto registrations = nlohmann::json::array();
        for(const auto& reg : card.m_registrations) {
            registrations.push_back({{"contract", reg.m_contract},
                                     {"address", reg.m_address},
                                     {"agentId", reg.m_agent_id},
                                     {"network", reg.m_network}});
        }

        return {{"agentId", card.m_agent_id},
                {"name", card.m_name},
                {"description", card.m_description},
                {"version", card.m_version},
                {"domain", card.m_domain},
                {"skills", skills},
                {"trustModels", card.m_trust_models},
                {"paymentMethods", card.m_payment_methods},
                {"registrations", registrations}};
    }

    discovery::discovery(long timeout_ms, std::shared_ptr<logging::log> log)
        : discovery(
            [timeout_ms](const std::string& url) {
                return rpc::http_request(url, "", timeout_ms);
            },
            std::move(log)) {}

    discovery::discovery(fetch_type fetch, std::shared_ptr<logging::log> log)
        : m_fetch(std::move(fetch)),
          m_log(std::move(log)) {}

    auto discovery::fetch(const std::string& base_url)
        -> std::variant<agent_card, error> {
        if(base_url.rfind("http://", 0) != 0
           && base_url.rfind("https://", 0) != 0) {
            return error{error_code::malformed_request,
                         "agent URL must use http or https"};
        }
        auto url = base_url;
        while(!url.empty() && url.back() == '/') {
            url.pop_back();
        }
        url += agent_card_path;

        auto res = m_fetch(url);
        if(auto* fail = std::get_if<rpc::failure>(&res)) {
            m_log->warn("Failed to fetch", url, ":", fail->m_message);
            return error{error_code::settlement_unavailable,
                         "agent unreachable: " + fail->m_message};
        }
        auto& resp = std::get<rpc::http_response>(res);
        if(resp.m_status == http_not_found) {
            return error{error_code::not_found,
                         "no agent card published at " + url};
        }
        if(resp.m_status < http_ok_min || resp.m_status > http_ok_max) {
            return error{error_code::settlement_unavailable,
                         "agent replied with HTTP "
                             + std::to_string(resp.m_status)};
        }

        auto card = parse_agent_card(resp.m_body);
        if(!card.has_value()) {
            m_log->debug("Malformed agent card at", url);
            return error{error_code::malformed_request,
                         "malformed agent card at " + url};
        }
        return card.value();
    }
}
