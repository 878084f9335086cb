#include "server.hpp"

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"
#include "paste/paste_service.hpp"

namespace pastebin {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, paste::PasteService &service)
    : config_(config), service_(service) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(static_cast<size_t>(pool_size)); };

    setup_routes();

    // JSON body for errors raised outside handlers (unknown routes, httplib failures).
    // Content already set by a handler is left alone.
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        std::string message = "Internal server error.";
        if (res.status == kStatusNotFound) {
            LOG_DEBUG("[HTTP] Route not found: " << req.method << " " << req.path);
            message = "Not found.";
        } else if (res.status >= 400 && res.status < 500) {
            message = "Bad request.";
        }

        send_json(res, res.status, make_error_response(message));
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        send_json(res, kStatusInternal, make_error_response("Internal server error."));
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

std::string HttpServer::base_url_for(const httplib::Request &req) const {
    if (!config_.public_base_url.empty()) {
        return config_.public_base_url;
    }

    std::string host = req.get_header_value("Host");
    if (host.empty()) {
        host = config_.bind + ":" + std::to_string(port_);
    }
    return "http://" + host;
}

void HttpServer::setup_routes() {
    // POST /api/paste - Create a paste
    server_->Post("/api/paste",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_paste(req, res); });

    // GET /api/paste/:id - Paste as JSON
    server_->Get(R"(/api/paste/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_paste(req, res); });

    // GET /:id - Paste as HTML page. Registered last so /api/... routes win.
    server_->Get(R"(/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_paste_page(req, res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST /api/paste");
    LOG_INFO("[HTTP]   GET  /api/paste/{id}");
    LOG_INFO("[HTTP]   GET  /{id}");
}

}  // namespace http
}  // namespace pastebin
