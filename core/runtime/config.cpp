#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <vector>

#include "../logging/logger.hpp"

namespace pastebin {
namespace runtime {

bool validate_config(const ServiceConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (!config.http.public_base_url.empty()) {
        const auto &url = config.http.public_base_url;
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            error = "http.public_base_url must start with http:// or https://";
            return false;
        }
        if (url.back() == '/') {
            error = "http.public_base_url must not end with '/'";
            return false;
        }
    }

    // Validate storage settings
    if (config.storage.path.empty()) {
        error = "storage.path must not be empty";
        return false;
    }

    // Validate paste limits
    if (config.paste.max_content_length < 1) {
        error = "paste.max_content_length must be at least 1";
        return false;
    }
    if (config.paste.max_id_attempts < 1) {
        error = "paste.max_id_attempts must be at least 1";
        return false;
    }

    // Validate Logging settings
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool apply_env_overrides(ServiceConfig &config, std::string &error) {
    const char *port_env = std::getenv("PORT");
    if (port_env == nullptr || *port_env == '\0') {
        return true;
    }

    try {
        size_t consumed = 0;
        const int port = std::stoi(port_env, &consumed);
        if (consumed != std::string(port_env).size()) {
            error = "PORT environment variable is not an integer: " + std::string(port_env);
            return false;
        }
        config.http.port = port;
    } catch (const std::exception &) {
        error = "PORT environment variable is not an integer: " + std::string(port_env);
        return false;
    }

    LOG_INFO("[Config] HTTP port overridden by PORT environment variable: " << config.http.port);
    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "storage", "paste", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["public_base_url"]) {
                config.http.public_base_url = http["public_base_url"].as<std::string>();
            }
        }

        // Load storage config
        if (yaml["storage"]) {
            if (yaml["storage"]["path"]) {
                config.storage.path = yaml["storage"]["path"].as<std::string>();
            }
        }

        // Load paste limits
        if (yaml["paste"]) {
            if (yaml["paste"]["max_content_length"]) {
                const int max_length = yaml["paste"]["max_content_length"].as<int>();
                if (max_length < 1) {
                    error = "paste.max_content_length must be at least 1";
                    return false;
                }
                config.paste.max_content_length = static_cast<std::size_t>(max_length);
            }
            if (yaml["paste"]["max_id_attempts"]) {
                config.paste.max_id_attempts = yaml["paste"]["max_id_attempts"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!apply_env_overrides(config, error)) {
            return false;
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                 << config.http.thread_pool_size << " workers)";
        if (!config.http.public_base_url.empty()) {
            http_msg << ", public URL " << config.http.public_base_url;
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Storage: " << config.storage.path);
        LOG_INFO("[Config] Paste limits: " << config.paste.max_content_length << " characters, "
                                           << config.paste.max_id_attempts << " id attempts");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace pastebin
