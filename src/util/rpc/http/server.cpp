// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server.hpp"

#include <event2/buffer.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/thread.h>
#include <cstdlib>
#include <mutex>

namespace agentpay::rpc {
    struct http_server::pending_request {
        /// Only touched on the event loop thread. Null once the connection
        /// has closed.
        evhttp_request* m_req{};
        evhttp_connection* m_conn{};
        request m_request;
        response m_response;
        http_server* m_server{};
    };

    namespace {
        std::once_flag evthread_flag;

        auto method_name(evhttp_cmd_type cmd) -> std::string {
            switch(cmd) {
                case EVHTTP_REQ_GET:
                    return "GET";
                case EVHTTP_REQ_POST:
                    return "POST";
                case EVHTTP_REQ_HEAD:
                    return "HEAD";
                case EVHTTP_REQ_PUT:
                    return "PUT";
                case EVHTTP_REQ_DELETE:
                    return "DELETE";
                case EVHTTP_REQ_OPTIONS:
                    return "OPTIONS";
                default:
                    return "OTHER";
            }
        }

        auto decode(const char* str) -> std::string {
            if(str == nullptr) {
                return {};
            }
            auto* decoded = evhttp_uridecode(str, 0, nullptr);
            if(decoded == nullptr) {
                return {};
            }
            auto ret = std::string(decoded);
            free(decoded); // NOLINT(cppcoreguidelines-no-malloc)
            return ret;
        }
    }

    auto parse_query(const std::string& query)
        -> std::map<std::string, std::string> {
        auto ret = std::map<std::string, std::string>();
        evkeyvalq params{};
        if(evhttp_parse_query_str(query.c_str(), &params) != 0) {
            evhttp_clear_headers(&params);
            return ret;
        }
        for(auto* kv = params.tqh_first; kv != nullptr;
            kv = kv->next.tqe_next) {
            ret.emplace(kv->key, kv->value);
        }
        evhttp_clear_headers(&params);
        return ret;
    }

    http_server::http_server(network::endpoint_t endpoint,
                             size_t worker_threads,
                             std::shared_ptr<logging::log> log)
        : m_endpoint(std::move(endpoint)),
          m_worker_count(worker_threads == 0 ? 1 : worker_threads),
          m_log(std::move(log)),
          m_evbase(nullptr, &event_base_free),
          m_http(nullptr, &evhttp_free) {}

    http_server::~http_server() {
        stop();
    }

    auto http_server::init(handler_type handler) -> bool {
        std::call_once(evthread_flag, [] {
            evthread_use_pthreads();
        });

        m_handler = std::move(handler);
        m_evbase.reset(event_base_new());
        if(!m_evbase) {
            m_log->error("Failed to create event base");
            return false;
        }
        m_http.reset(evhttp_new(m_evbase.get()));
        if(!m_http) {
            m_log->error("Failed to create HTTP server");
            return false;
        }
        evhttp_set_allowed_methods(m_http.get(),
                                   EVHTTP_REQ_GET | EVHTTP_REQ_POST);
        evhttp_set_gencb(m_http.get(), &http_server::on_request, this);

        auto* handle = evhttp_bind_socket_with_handle(m_http.get(),
                                                      m_endpoint.first.c_str(),
                                                      m_endpoint.second);
        if(handle == nullptr) {
            m_log->error("Failed to bind HTTP server to",
                         m_endpoint.first,
                         m_endpoint.second);
            return false;
        }

        m_running = true;
        for(size_t i = 0; i < m_worker_count; i++) {
            m_workers.emplace_back([&]() {
                worker_loop();
            });
        }
        m_event_thread = std::thread([&]() {
            event_base_loop(m_evbase.get(), EVLOOP_NO_EXIT_ON_EMPTY);
        });

        m_log->info("HTTP server listening on",
                    m_endpoint.first + ":" + std::to_string(m_endpoint.second),
                    "with",
                    m_worker_count,
                    "workers");
        return true;
    }

    void http_server::stop() {
        if(!m_running.exchange(false)) {
            return;
        }
        event_base_loopbreak(m_evbase.get());
        if(m_event_thread.joinable()) {
            m_event_thread.join();
        }
        // Freeing the HTTP server runs the close callbacks of open
        // connections, which reference requests still held by the queue.
        m_http.reset();
        m_queue.clear();
        for(auto& t : m_workers) {
            if(t.joinable()) {
                t.join();
            }
        }
        m_workers.clear();
        {
            std::unique_lock l(m_replies_mut);
            for(auto* holder : m_scheduled_replies) {
                delete holder;
            }
            m_scheduled_replies.clear();
        }
        m_evbase.reset();
        m_log->info("HTTP server stopped");
    }

    void http_server::on_request(evhttp_request* req, void* arg) {
        auto* server = static_cast<http_server*>(arg);
        auto pending = std::make_shared<pending_request>();
        pending->m_req = req;
        pending->m_conn = evhttp_request_get_connection(req);
        pending->m_server = server;

        auto& r = pending->m_request;
        r.m_method = method_name(evhttp_request_get_command(req));
        const auto* uri = evhttp_request_get_evhttp_uri(req);
        if(uri != nullptr) {
            r.m_path = decode(evhttp_uri_get_path(uri));
            const auto* query = evhttp_uri_get_query(uri);
            if(query != nullptr) {
                r.m_query = parse_query(query);
            }
        }
        auto* input = evhttp_request_get_input_buffer(req);
        auto len = evbuffer_get_length(input);
        r.m_body.resize(len);
        if(len > 0) {
            evbuffer_copyout(input, r.m_body.data(), len);
        }

        evhttp_connection_set_closecb(pending->m_conn,
                                      &http_server::on_close,
                                      pending.get());
        server->m_log->trace("HTTP", r.m_method, r.m_path);
        server->m_queue.push(std::move(pending));
    }

    void http_server::on_close(evhttp_connection* /* conn */, void* arg) {
        auto* pending = static_cast<pending_request*>(arg);
        pending->m_req = nullptr;
        pending->m_conn = nullptr;
        *pending->m_request.m_cancelled = true;
        pending->m_server->m_log->debug("HTTP client disconnected from",
                                        pending->m_request.m_path);
    }

    void http_server::on_reply(int /* fd */, short /* what */, void* arg) {
        auto holder = std::unique_ptr<std::shared_ptr<pending_request>>(
            static_cast<std::shared_ptr<pending_request>*>(arg));
        auto& pending = *holder;
        {
            std::unique_lock l(pending->m_server->m_replies_mut);
            pending->m_server->m_scheduled_replies.erase(holder.get());
        }
        if(pending->m_req == nullptr) {
            return;
        }
        evhttp_connection_set_closecb(pending->m_conn, nullptr, nullptr);

        auto* headers = evhttp_request_get_output_headers(pending->m_req);
        evhttp_add_header(headers, "Content-Type", "application/json");
        auto* out = evbuffer_new();
        evbuffer_add(out,
                     pending->m_response.m_body.data(),
                     pending->m_response.m_body.size());
        evhttp_send_reply(pending->m_req,
                          pending->m_response.m_status,
                          nullptr,
                          out);
        evbuffer_free(out);
        pending->m_req = nullptr;
    }

    void http_server::worker_loop() {
        auto pending = std::shared_ptr<pending_request>();
        while(m_queue.pop(pending)) {
            if(!*pending->m_request.m_cancelled) {
                pending->m_response = m_handler(pending->m_request);
            }
            static constexpr timeval immediately{0, 0};
            auto* arg = new std::shared_ptr<pending_request>(
                std::move(pending));
            {
                std::unique_lock l(m_replies_mut);
                m_scheduled_replies.insert(arg);
            }
            if(event_base_once(m_evbase.get(),
                               -1,
                               EV_TIMEOUT,
                               &http_server::on_reply,
                               arg,
                               &immediately)
               != 0) {
                m_log->error("Failed to schedule HTTP reply");
                std::unique_lock l(m_replies_mut);
                m_scheduled_replies.erase(arg);
                delete arg;
            }
            pending = nullptr;
        }
    }
}
