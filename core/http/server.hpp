#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "runtime/config.hpp"

namespace pastebin {
namespace paste {
class PasteService;
}

namespace http {

/**
 * @brief HTTP surface of the paste service
 *
 * Exposes three routes and delegates every operation to the PasteService:
 * - POST /api/paste         create, JSON in and out
 * - GET  /api/paste/{id}    fetch as JSON
 * - GET  /{id}              fetch as an HTML page
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - The service and its store are safe to call from several workers
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, paste::PasteService &service);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server. Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // Scheme and host that paste URLs are built on, without trailing slash
    std::string base_url_for(const httplib::Request &req) const;

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    paste::PasteService &service_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/paste_handlers.cpp)
    void handle_post_paste(const httplib::Request &req, httplib::Response &res);
    void handle_get_paste(const httplib::Request &req, httplib::Response &res);
    void handle_get_paste_page(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace pastebin
