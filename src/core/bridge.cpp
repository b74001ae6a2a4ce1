/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: bridge.cpp
 * ============================================================================
 */

#include "bridge.hpp"
#include "Runtime.hpp"
#include "config.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <string>
#include <utility>

struct conduit_runtime {
    explicit conduit_runtime(const conduit::RuntimeConfig& config) : runtime(config) {}
    conduit::Runtime runtime;
};

struct conduit_plugin {
    std::shared_ptr<conduit::plugins::Plugin> instance;
};

namespace conduit {
namespace plugins {

conduit_plugin* ExportPlugin(std::shared_ptr<Plugin> plugin) {
    return new conduit_plugin{std::move(plugin)};
}

} // namespace plugins
} // namespace conduit

namespace {

std::string to_string_or_empty(const char* s) {
    return s ? std::string(s) : std::string();
}

conduit::plugins::Surface to_surface(conduit_surface* surface) {
    conduit::plugins::Surface out;
    out.native = surface;
    return out;
}

} // namespace

extern "C" {

// Nothing thrown inside the router may unwind into the C caller.

conduit_runtime* conduit_runtime_create(void) {
    try {
        return new conduit_runtime(conduit::load_runtime_config_from_env());
    } catch (const std::exception& e) {
        conduit::conduit_log("ERROR", std::string("conduit_runtime_create failed: ") + e.what());
        return nullptr;
    }
}

void conduit_runtime_destroy(conduit_runtime* runtime) {
    delete runtime;
}

void conduit_plugin_release(conduit_plugin* plugin) {
    delete plugin;
}

void conduit_register_plugin(
    conduit_runtime* runtime,
    const char* name,
    conduit_plugin* plugin,
    const char* config,
    conduit_surface* surface) {
    std::unique_ptr<conduit_plugin> box(plugin);
    if (!runtime || !name || !box || !box->instance) {
        conduit::conduit_log("ERROR", "conduit_register_plugin: runtime, name and plugin are required.");
        return;
    }

    std::optional<conduit::plugins::Surface> attach;
    if (surface) {
        attach = to_surface(surface);
    }
    try {
        runtime->runtime.RegisterPlugin(name, box->instance, to_string_or_empty(config), attach);
    } catch (const std::exception& e) {
        conduit::conduit_log("ERROR", "conduit_register_plugin failed for '" + std::string(name) + "': " + e.what());
    }
}

void conduit_surface_created(
    conduit_runtime* runtime,
    conduit_surface* surface,
    void* owner) {
    if (!runtime || !surface) {
        conduit::conduit_log("ERROR", "conduit_surface_created: runtime and surface are required.");
        return;
    }
    try {
        runtime->runtime.SurfaceCreated(to_surface(surface), owner);
    } catch (const std::exception& e) {
        conduit::conduit_log("ERROR", std::string("conduit_surface_created failed: ") + e.what());
    }
}

void conduit_run_plugin_command(
    conduit_runtime* runtime,
    int64_t invocation_id,
    const char* name,
    const char* command,
    const char* data,
    conduit_result_fn callback,
    conduit_channel_data_fn send_channel_data) {
    if (!runtime || !name || !command) {
        conduit::conduit_log("ERROR", "conduit_run_plugin_command: runtime, name and command are required.");
        if (callback) {
            callback(invocation_id, false, "Invalid invocation");
        }
        return;
    }

    try {
        runtime->runtime.RunCommand(
            invocation_id, name, command, to_string_or_empty(data),
            [callback](std::int64_t id, bool success, const std::string& payload) {
                if (callback) {
                    callback(id, success, payload.c_str());
                }
            },
            [send_channel_data](std::uint64_t channel_id, const std::string& payload) {
                if (send_channel_data) {
                    send_channel_data(channel_id, payload.c_str());
                }
            });
    } catch (const std::exception& e) {
        conduit::conduit_log("ERROR", std::string("conduit_run_plugin_command failed: ") + e.what());
    }
}

} // extern "C"
