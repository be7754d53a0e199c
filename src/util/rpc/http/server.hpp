// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SRC_UTIL_RPC_HTTP_SERVER_H_
#define AGENTPAY_SRC_UTIL_RPC_HTTP_SERVER_H_

#include "util/common/blocking_queue.hpp"
#include "util/common/config.hpp"
#include "util/common/logging.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct event_base;
struct evhttp;
struct evhttp_request;
struct evhttp_connection;

namespace agentpay::rpc {
    /// An HTTP request as seen by a request handler.
    struct request {
        std::string m_method;
        /// Percent-decoded URI path.
        std::string m_path;
        std::map<std::string, std::string> m_query;
        std::string m_body;
        /// Set when the client disconnects before the reply is sent.
        std::shared_ptr<std::atomic<bool>> m_cancelled{
            std::make_shared<std::atomic<bool>>(false)};
    };

    /// Reply to an HTTP request. Bodies are JSON.
    struct response {
        int m_status{};
        std::string m_body;
    };

    /// Parses an URL query string into decoded key/value pairs.
    /// \param query query string without the leading '?'.
    /// \return parameters. Later duplicates are ignored.
    auto parse_query(const std::string& query)
        -> std::map<std::string, std::string>;

    /// HTTP server using libevent. The event loop runs on one thread and
    /// requests are dispatched to a fixed pool of worker threads. Replies
    /// are handed back to the event loop thread for sending. A request
    /// whose connection closes before the handler returns has its
    /// cancellation flag set and its reply dropped.
    class http_server {
      public:
        /// Request handler. Called from a worker thread.
        using handler_type = std::function<response(const request&)>;

        /// Constructor.
        /// \param endpoint address and port to listen on.
        /// \param worker_threads number of handler threads.
        /// \param log log instance.
        http_server(network::endpoint_t endpoint,
                    size_t worker_threads,
                    std::shared_ptr<logging::log> log);

        /// Stops the event loop and joins all threads.
        ~http_server();

        http_server(const http_server&) = delete;
        auto operator=(const http_server&) -> http_server& = delete;
        http_server(http_server&&) = delete;
        auto operator=(http_server&&) -> http_server& = delete;

        /// Binds the listening socket and starts the event loop and worker
        /// threads.
        /// \param handler request handler.
        /// \return true if the server started listening.
        auto init(handler_type handler) -> bool;

        /// Stops accepting requests and joins all threads. Queued requests
        /// are dropped.
        void stop();

      private:
        struct pending_request;

        network::endpoint_t m_endpoint;
        size_t m_worker_count;
        std::shared_ptr<logging::log> m_log;
        handler_type m_handler;

        std::unique_ptr<event_base, void (*)(event_base*)> m_evbase;
        std::unique_ptr<evhttp, void (*)(evhttp*)> m_http;

        blocking_queue<std::shared_ptr<pending_request>> m_queue;
        std::thread m_event_thread;
        std::vector<std::thread> m_workers;
        std::atomic<bool> m_running{false};

        /// Replies handed to the event loop that have not run yet. Freed by
        /// stop() if the loop exits first.
        std::mutex m_replies_mut;
        std::set<std::shared_ptr<pending_request>*> m_scheduled_replies;

        static void on_request(evhttp_request* req, void* arg);
        static void on_close(evhttp_connection* conn, void* arg);
        static void on_reply(int fd, short what, void* arg);

        void worker_loop();
    };
}

#endif
