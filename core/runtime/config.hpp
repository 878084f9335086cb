#pragma once

#include <cstddef>
#include <string>

namespace pastebin {
namespace runtime {

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 3000;                 // HTTP port (PORT env var overrides)
    int thread_pool_size = 8;        // Worker thread pool size
    std::string public_base_url;     // Base for paste URLs; empty = derive from Host header
};

struct StorageConfig {
    std::string path = "./pastebin.db";  // SQLite database file
};

struct PasteConfig {
    std::size_t max_content_length = 10000;  // Characters (code points)
    int max_id_attempts = 5;                 // Identifier draws per create on collision
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ServiceConfig {
    HttpConfig http;
    StorageConfig storage;
    PasteConfig paste;
    LoggingConfig logging;
};

// Loads configuration from a YAML file, applies environment overrides and validates
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

// Applies PORT from the environment if set. Returns false if it is not a valid integer.
bool apply_env_overrides(ServiceConfig &config, std::string &error);

}  // namespace runtime
}  // namespace pastebin
