/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Runtime configuration. Read from the JSON file named by CONDUIT_CONFIG
 * (default "conduit.json"); every key is optional.
 *
 *   {
 *     "queue_label": "ipc",
 *     "log_capacity": 200,
 *     "listen_host": "0.0.0.0",
 *     "listen_port": 8080,
 *     "invoke_timeout_ms": 0,
 *     "plugins": { "echo": { "prefix": "" } }
 *   }
 *
 * CONDUIT_PORT overrides listen_port.
 * ============================================================================
 */

#ifndef CONDUIT_CONFIG_HPP
#define CONDUIT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace conduit {

    struct RuntimeConfig {
        std::string queue_label = "ipc";
        std::size_t log_capacity = 200;
        std::string listen_host = "0.0.0.0";
        int listen_port = 8080;
        std::chrono::milliseconds invoke_timeout{0}; // 0 = wait forever
        json plugins = json::object();
    };

    /**
     * @brief Applies the keys present in doc on top of the defaults.
     * @throws std::runtime_error when the root or "plugins" is not an object,
     * json::type_error when a key holds the wrong type.
     */
    RuntimeConfig parse_runtime_config(const json& doc);

    /**
     * @brief Loads the configuration file at path. A missing file yields the
     * defaults (logged as WARN), a corrupt one yields the defaults (logged as
     * ERROR). Never throws.
     */
    RuntimeConfig load_runtime_config(const std::string& path);

    /**
     * @brief load_runtime_config() on $CONDUIT_CONFIG, then the
     * CONDUIT_PORT override.
     */
    RuntimeConfig load_runtime_config_from_env();

    /**
     * @brief The opaque configuration blob handed to a plugin at
     * registration: its "plugins" entry serialized, or "{}".
     */
    std::string plugin_config_for(const RuntimeConfig& config, const std::string& plugin_name);

} // namespace conduit

#endif // CONDUIT_CONFIG_HPP
