#pragma once

/**
 * @file ncf_http_server.hpp
 * @brief HTTP/1.1 front end for ApiRouter over libwebsockets
 */

#include "ncf_api_router.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace ncf {

struct HttpServerConfig {
    std::string host = "127.0.0.1";   ///< Bind address or interface name
    uint16_t    port = 8000;          ///< 0 picks a free port, see HttpServer::port()
    size_t      worker_threads = 2;
    size_t      max_body_bytes = 64 * 1024;
    int         idle_timeout_sec = 30;
};

/**
 * @brief Serves the JSON API
 *
 * The service thread only parses requests and writes responses; handlers
 * run on a worker pool and hand their result back through
 * lws_cancel_service(). Every response carries
 * Access-Control-Allow-Origin: *.
 *
 * Usage:
 *   HttpServer http(router);
 *   http.initialize(cfg);
 *   http.start();
 *   ...
 *   http.stop();
 */
class HttpServer {
public:
    explicit HttpServer(const ApiRouter& router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Create the listening context; false if the port cannot be bound
    bool initialize(const HttpServerConfig& config);
    bool start();
    void stop();
    bool is_running() const;

    /// Port actually bound; 0 before initialize()
    uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ncf
