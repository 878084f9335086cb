#include "runtime.hpp"

#include <chrono>
#include <exception>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace pastebin {
namespace runtime {

namespace {
constexpr auto kRunLoopInterval = std::chrono::milliseconds(100);
}  // namespace

Runtime::Runtime(const ServiceConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing pastebin service");

    if (!init_store(error)) {
        return false;
    }

    if (!init_service(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_store(std::string &error) {
    try {
        store_ = store::SqlitePasteStore::open(config_.storage.path);
    } catch (const std::exception &e) {
        error = "Failed to open store: " + std::string(e.what());
        return false;
    }
    return true;
}

bool Runtime::init_service(std::string &) {
    id_generator_ = std::make_unique<paste::RandomIdGenerator>();

    paste::PasteServiceOptions options;
    options.max_content_length = config_.paste.max_content_length;
    options.max_id_attempts = config_.paste.max_id_attempts;

    service_ = std::make_unique<paste::PasteService>(*store_, *id_generator_, options);
    LOG_INFO("[Runtime] Paste service created");
    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *service_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    return true;
}

void Runtime::run() {
    running_ = true;
    LOG_INFO("[Runtime] Pastebin service running on port " << config_.http.port);

    while (!stop_requested_ && !SignalHandler::is_shutdown_requested()) {
        if (http_server_ && !http_server_->is_running()) {
            LOG_ERROR("[Runtime] HTTP server stopped unexpectedly");
            break;
        }
        std::this_thread::sleep_for(kRunLoopInterval);
    }

    running_ = false;
    LOG_INFO("[Runtime] Main loop exited");
    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
    }

    service_.reset();
    id_generator_.reset();

    if (store_) {
        store_->close();
        store_.reset();
    }
}

}  // namespace runtime
}  // namespace pastebin
