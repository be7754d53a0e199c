// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "client.hpp"

#include <curl/curl.h>
#include <mutex>

namespace agentpay::rpc {
    namespace {
        std::once_flag curl_init_flag;

        auto write_callback(void* contents,
                            size_t size,
                            size_t nmemb,
                            void* userp) -> size_t {
            auto* out = static_cast<std::string*>(userp);
            auto total = size * nmemb;
            out->append(static_cast<char*>(contents), total);
            return total;
        }

        using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using slist_ptr
            = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
    }

    auto http_request(const std::string& url,
                      const std::string& body,
                      long timeout_ms)
        -> std::variant<http_response, failure> {
        std::call_once(curl_init_flag, [] {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        });

        auto handle = curl_ptr(curl_easy_init(), &curl_easy_cleanup);
        if(!handle) {
            return failure{failure_kind::transport,
                           0,
                           0,
                           "failed to initialize curl",
                           {}};
        }

        auto headers = slist_ptr(nullptr, &curl_slist_free_all);
        auto* list = curl_slist_append(nullptr,
                                       "Content-Type: application/json");
        list = curl_slist_append(list, "Accept: application/json");
        headers.reset(list);

        auto response = http_response();
        curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.m_body);
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
        curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 3L);
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
        if(!body.empty()) {
            curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(handle.get(),
                             CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(body.size()));
        }

        auto res = curl_easy_perform(handle.get());
        if(res == CURLE_OPERATION_TIMEDOUT) {
            return failure{failure_kind::timeout,
                           0,
                           0,
                           curl_easy_strerror(res),
                           {}};
        }
        if(res != CURLE_OK) {
            return failure{failure_kind::transport,
                           0,
                           0,
                           curl_easy_strerror(res),
                           {}};
        }

        curl_easy_getinfo(handle.get(),
                          CURLINFO_RESPONSE_CODE,
                          &response.m_status);
        return response;
    }

    json_rpc_http_client::json_rpc_http_client(
        std::string endpoint,
        long timeout_ms,
        std::shared_ptr<logging::log> log)
        : m_endpoint(std::move(endpoint)),
          m_timeout_ms(timeout_ms),
          m_log(std::move(log)) {}

    auto json_rpc_http_client::call(const std::string& method,
                                    nlohmann::json params) -> call_result {
        auto id = m_next_id++;
        auto request = nlohmann::json{{"jsonrpc", "2.0"},
                                      {"id", id},
                                      {"method", method},
                                      {"params", std::move(params)}};
        m_log->trace("RPC", m_endpoint, method, "id", id);

        auto maybe_resp = http_request(m_endpoint,
                                       request.dump(),
                                       m_timeout_ms);
        if(auto* fail = std::get_if<failure>(&maybe_resp)) {
            m_log->warn("RPC",
                        method,
                        "to",
                        m_endpoint,
                        "failed:",
                        to_string(fail->m_kind),
                        fail->m_message);
            return *fail;
        }

        auto& resp = std::get<http_response>(maybe_resp);
        static constexpr long http_ok_min = 200;
        static constexpr long http_ok_max = 299;
        if(resp.m_status < http_ok_min || resp.m_status > http_ok_max) {
            m_log->warn("RPC",
                        method,
                        "to",
                        m_endpoint,
                        "returned HTTP",
                        resp.m_status);
            return failure{failure_kind::http_status,
                           resp.m_status,
                           0,
                           "HTTP status " + std::to_string(resp.m_status),
                           {}};
        }

        auto body = nlohmann::json::parse(resp.m_body, nullptr, false);
        if(body.is_discarded() || !body.is_object()) {
            return failure{failure_kind::malformed_response,
                           resp.m_status,
                           0,
                           "response is not a JSON object",
                           {}};
        }

        auto err = body.find("error");
        if(err != body.end() && !err->is_null()) {
            auto ret = failure{failure_kind::rpc, resp.m_status, 0, {}, {}};
            if(err->is_object()) {
                auto code = err->find("code");
                if(code != err->end() && code->is_number_integer()) {
                    ret.m_code = code->get<int64_t>();
                }
                auto msg = err->find("message");
                if(msg != err->end() && msg->is_string()) {
                    ret.m_message = msg->get<std::string>();
                }
                auto data = err->find("data");
                if(data != err->end() && data->is_string()) {
                    ret.m_data = data->get<std::string>();
                }
            } else {
                ret.m_message = err->dump();
            }
            m_log->debug("RPC",
                         method,
                         "error",
                         ret.m_code,
                         ret.m_message);
            return ret;
        }

        auto result = body.find("result");
        if(result == body.end()) {
            return failure{failure_kind::malformed_response,
                           resp.m_status,
                           0,
                           "response has no result",
                           {}};
        }
        return *result;
    }
}
