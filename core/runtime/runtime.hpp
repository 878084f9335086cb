#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "paste/id_generator.hpp"
#include "paste/paste_service.hpp"
#include "store/sqlite_paste_store.hpp"

namespace pastebin {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const ServiceConfig &config);
    ~Runtime();

    // Open the store, build the service and start the HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { stop_requested_ = true; }
    bool is_running() const { return running_; }

    // Stop the HTTP server, then close the store. Idempotent.
    void shutdown();

    paste::PasteService &get_service() { return *service_; }

private:
    bool init_store(std::string &error);
    bool init_service(std::string &error);
    bool init_http(std::string &error);

    ServiceConfig config_;

    std::unique_ptr<store::SqlitePasteStore> store_;
    std::unique_ptr<paste::IdGenerator> id_generator_;
    std::unique_ptr<paste::PasteService> service_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace runtime
}  // namespace pastebin
