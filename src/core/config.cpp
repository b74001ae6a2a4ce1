/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "log.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <stdexcept>

namespace conduit {

RuntimeConfig parse_runtime_config(const json& doc) {
    RuntimeConfig config;
    if (!doc.is_object()) {
        throw std::runtime_error("configuration root must be an object");
    }

    if (doc.contains("queue_label")) config.queue_label = doc.at("queue_label").get<std::string>();
    if (doc.contains("log_capacity")) config.log_capacity = doc.at("log_capacity").get<std::size_t>();
    if (doc.contains("listen_host")) config.listen_host = doc.at("listen_host").get<std::string>();
    if (doc.contains("listen_port")) config.listen_port = doc.at("listen_port").get<int>();
    if (doc.contains("invoke_timeout_ms")) {
        config.invoke_timeout = std::chrono::milliseconds(doc.at("invoke_timeout_ms").get<long long>());
    }
    if (doc.contains("plugins")) {
        const json& plugins = doc.at("plugins");
        if (!plugins.is_object()) {
            throw std::runtime_error("\"plugins\" must be an object");
        }
        config.plugins = plugins;
    }
    return config;
}

RuntimeConfig load_runtime_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        conduit_log("WARN", "Config file " + path + " missing. Using system defaults.");
        return RuntimeConfig();
    }

    try {
        return parse_runtime_config(json::parse(ifs));
    } catch (const std::exception& e) {
        conduit_log("ERROR", "Config Parse Error in " + path + ": " + std::string(e.what()));
        return RuntimeConfig();
    }
}

RuntimeConfig load_runtime_config_from_env() {
    const char* env_path = std::getenv("CONDUIT_CONFIG");
    RuntimeConfig config = load_runtime_config(env_path ? env_path : "conduit.json");

    const char* env_port = std::getenv("CONDUIT_PORT");
    if (env_port) {
        try {
            config.listen_port = std::stoi(env_port);
        } catch (const std::exception& e) {
            conduit_log("ERROR", "Ignoring invalid CONDUIT_PORT '" + std::string(env_port) + "': " + e.what());
        }
    }
    return config;
}

std::string plugin_config_for(const RuntimeConfig& config, const std::string& plugin_name) {
    auto it = config.plugins.find(plugin_name);
    if (it == config.plugins.end()) {
        return "{}";
    }
    return it->dump();
}

} // namespace conduit
